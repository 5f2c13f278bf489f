#ifndef FITSCODEC_TABLE_TABLEENTRY_HPP
#define FITSCODEC_TABLE_TABLEENTRY_HPP

#include "fitscodec/table/tableentryformat.hpp"

#include <cstdint>
#include <string>

#include <boost/variant.hpp>

namespace fitscodec {

    namespace table {

        /*! @ingroup table
         *  @{
         */

        /*! One decoded ASCII-table cell: text, integer or floating-point. */
        typedef boost::variant<std::string, int64_t, double> TableEntry;

        /*! @fn TableEntry makeEntry( const std::string& text, const TableEntryFormat& fmt, size_t row=0, size_t field=0 )
         *  @brief Convert the raw text of a field to an entry of the kind given by \c fmt.
         *  @details Text fields lose their trailing blanks. Numeric fields ignore surrounding blanks.
         *           F fields accept a Fortran "D" exponent. An F field without a decimal point
         *           or exponent has an implied decimal point \c precision digits from the right.
         *           An all-blank numeric field is zero if \c blankAsZero is set.
         *  @param row,field Only used for the error report.
         *  @throws file::ParseError if the text does not convert.
         *  @throws file::SetupError if \c fmt is invalid.
         */
        TableEntry makeEntry( const std::string& text, const TableEntryFormat& fmt, size_t row=0, size_t field=0,
                              bool blankAsZero=true );

        /*! @fn std::string renderEntry( const TableEntry& entry, const TableEntryFormat& fmt )
         *  @brief Minimal text representation of \c entry.
         *  @details Floats use the precision of \c fmt, unless the value would not read back unchanged.
         *           Then more decimals, or the exponent form if that is shorter, are used.
         */
        std::string renderEntry( const TableEntry& entry, const TableEntryFormat& fmt );

        /*! @} */

    }   // table

}   // fitscodec


#endif  // FITSCODEC_TABLE_TABLEENTRY_HPP
