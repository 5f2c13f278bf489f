#ifndef FITSCODEC_TABLE_ASCIITABLECODEC_HPP
#define FITSCODEC_TABLE_ASCIITABLECODEC_HPP

#include "fitscodec/codecsettings.hpp"
#include "fitscodec/file/blockio.hpp"
#include "fitscodec/file/extension.hpp"
#include "fitscodec/logging/logger.hpp"
#include "fitscodec/table/asciitable.hpp"

#include <string>
#include <vector>

#include <boost/optional.hpp>

namespace fitscodec {

    namespace table {

        /*! @ingroup table
         *  @{
         */

        /*! The header keywords describing the data of an ASCII table.
         */
        struct TableLayout {
            TableLayout( void ) : rowWidth(0), nRows(0) {}
            size_t rowWidth;                                    // NAXIS1, characters per row
            size_t nRows;                                       // NAXIS2
            std::vector<std::string> formats;                   // TFORMn
            std::vector<boost::optional<std::string>> labels;   // TTYPEn, may be shorter than formats
            std::vector<size_t> columnStarts;                   // TBCOLn (1-based), empty if not known
        };


        /*! Converts between the rows of an ASCII-table HDU and an AsciiTable.
         */
        class AsciiTableCodec {

        public:
            explicit AsciiTableCodec( logging::Logger& logger, const CodecSettings& settings=CodecSettings() );

            /*! @brief Read the data of an ASCII table, including the block padding.
             *  @details The field conversion is done in parallel, rows are returned in file order.
             *  @throws file::SetupError    if a TFORM is not understood (nothing is read in that case).
             *  @throws file::FormatError   if a field does not fit in the row, or contains non-ASCII bytes.
             *  @throws file::ParseError    if a field does not convert to the type of its column.
             *  @throws file::DataIOException
             */
            file::Extension decode( file::BlockReader& reader, const TableLayout& layout ) const;
            AsciiTable decodeTable( file::BlockReader& reader, const TableLayout& layout ) const;

            /*! @brief Write the table as fixed-width text rows, padded to whole blocks.
             *  @details Short columns are padded with empty entries, every column gets the width of its
             *           widest entry (but at least its declared width).
             *  @returns The keywords that describe the written data.
             */
            TableLayout encode( AsciiTable table, file::BlockWriter& writer ) const;

            const CodecSettings& getSettings( void ) const { return settings; }

        private:
            logging::Logger& logger;
            CodecSettings settings;

        };

        /*! @} */

    }   // table

}   // fitscodec


#endif  // FITSCODEC_TABLE_ASCIITABLECODEC_HPP
