#ifndef FITSCODEC_FILE_EXTENSION_HPP
#define FITSCODEC_FILE_EXTENSION_HPP

#include "fitscodec/file/bitpix.hpp"
#include "fitscodec/image/typedimage.hpp"
#include "fitscodec/table/asciitable.hpp"

#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/variant.hpp>

namespace fitscodec {

    namespace file {

        /*! @ingroup file
         *  @{
         */

        /*! Binary table payload. The rows are kept as raw bytes (NAXIS1*NAXIS2 bytes followed
         *  by the heap), together with the keywords needed to write them back.
         */
        struct BinTable {
            BinTable( void ) : rowWidth(0), nRows(0), heapSize(0) {}
            size_t rowWidth;                                    // NAXIS1
            size_t nRows;                                       // NAXIS2
            size_t heapSize;                                    // PCOUNT
            std::vector<std::string> formats;                   // TFORMn
            std::vector<boost::optional<std::string>> labels;   // TTYPEn
            std::vector<char> data;
            size_t dataSize( void ) const { return rowWidth*nRows + heapSize; }
        };


        /*! Random groups payload (primary HDU with NAXIS1 = 0 and GROUPS = T), kept as raw bytes.
         */
        struct RandomGroups {
            RandomGroups( void ) : bitpix(BITPIX_BYTE), nParameters(0), nGroups(0) {}
            Bitpix bitpix;
            std::vector<size_t> axes;                           // NAXIS2 ... NAXISn
            size_t nParameters;                                 // PCOUNT
            size_t nGroups;                                     // GCOUNT
            std::vector<char> data;
            size_t dataSize( void ) const;
        };


        /*! The decoded payload of one HDU. Which alternative is used is decided by the header
         *  keywords, never by the data.
         */
        typedef boost::variant< table::AsciiTable,
                                BinTable,
                                image::TypedImage,
                                RandomGroups > Extension;

        enum ExtensionType { EXT_ASCII_TABLE = 0, EXT_BINTABLE, EXT_IMAGE, EXT_RANDOM_GROUPS };
        inline ExtensionType extensionType( const Extension& ext ) { return static_cast<ExtensionType>( ext.which() ); }

        /*! @} */

    } // end namespace file

} // end namespace fitscodec

#endif // FITSCODEC_FILE_EXTENSION_HPP
