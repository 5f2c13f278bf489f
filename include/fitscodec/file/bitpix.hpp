#ifndef FITSCODEC_FILE_BITPIX_HPP
#define FITSCODEC_FILE_BITPIX_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace fitscodec {

    namespace file {

        /*! @ingroup file
         *  @{
         */

        /*! Element types a FITS data array can hold. The enumerator values are
         *  the BITPIX codes used in the header.
         */
        enum Bitpix {
            BITPIX_BYTE = 8,            // uint8
            BITPIX_SHORT = 16,          // int16
            BITPIX_INT = 32,            // int32
            BITPIX_LONG = 64,           // int64
            BITPIX_FLOAT = -32,         // IEEE-754 single precision
            BITPIX_DOUBLE = -64         // IEEE-754 double precision
        };

        /*! @fn Bitpix bitpixFromCode( int code )
         *  @brief Map a BITPIX header value to a Bitpix.
         *  @throws FormatError if \c code is not one of 8, 16, 32, 64, -32, -64.
         */
        Bitpix bitpixFromCode( int code );

        /*! @fn size_t byteWidth( Bitpix bp )
         *  @brief Number of bytes occupied by one element.
         */
        size_t byteWidth( Bitpix bp );

        std::string bitpixName( Bitpix bp );

        template <typename T> Bitpix getBitpix( void );
        template <> inline Bitpix getBitpix<uint8_t>( void ) { return BITPIX_BYTE; }
        template <> inline Bitpix getBitpix<int16_t>( void ) { return BITPIX_SHORT; }
        template <> inline Bitpix getBitpix<int32_t>( void ) { return BITPIX_INT; }
        template <> inline Bitpix getBitpix<int64_t>( void ) { return BITPIX_LONG; }
        template <> inline Bitpix getBitpix<float>( void ) { return BITPIX_FLOAT; }
        template <> inline Bitpix getBitpix<double>( void ) { return BITPIX_DOUBLE; }

        /*! @} */

    } // end namespace file

} // end namespace fitscodec

#endif // FITSCODEC_FILE_BITPIX_HPP
