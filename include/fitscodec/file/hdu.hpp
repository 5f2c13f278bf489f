#ifndef FITSCODEC_FILE_HDU_HPP
#define FITSCODEC_FILE_HDU_HPP

#include "fitscodec/codecsettings.hpp"
#include "fitscodec/file/blockio.hpp"
#include "fitscodec/file/extension.hpp"
#include "fitscodec/file/header.hpp"
#include "fitscodec/logging/logger.hpp"
#include "fitscodec/table/asciitablecodec.hpp"

#include <vector>

#include <boost/optional.hpp>

namespace fitscodec {

    namespace file {

        /*! @ingroup file
         *  @{
         */

        /*! One header/data unit. \c data is empty when the header describes no data (NAXIS = 0).
         */
        struct Hdu {
            Header header;
            boost::optional<Extension> data;
        };


        /*! Reads and writes complete HDUs, dispatching the data part to the image or table codecs.
         */
        class HduCodec {

        public:
            explicit HduCodec( logging::Logger& logger, const CodecSettings& settings=CodecSettings() );

            /*! @brief Read the next HDU. The reader is left at the start of the following one.
             *  @throws FormatError if a structural keyword is missing/malformed, or XTENSION is unknown.
             *  @throws DataIOException if the stream ends early.
             */
            Hdu read( BlockReader& reader ) const;
            std::vector<Hdu> readAll( BlockReader& reader ) const;

            /*! @brief Write the HDU. The structural keywords are generated from the data,
             *         any such keywords in \c hdu.header are replaced.
             *  @throws BadArgument if a table is written as primary HDU.
             */
            void write( BlockWriter& writer, const Hdu& hdu, bool primary ) const;

            const CodecSettings& getSettings( void ) const { return settings; }

        private:
            logging::Logger& logger;
            CodecSettings settings;
            table::AsciiTableCodec tableCodec;

        };

        /*! @} */

    } // end namespace file

} // end namespace fitscodec

#endif // FITSCODEC_FILE_HDU_HPP
