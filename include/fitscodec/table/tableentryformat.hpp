#ifndef FITSCODEC_TABLE_TABLEENTRYFORMAT_HPP
#define FITSCODEC_TABLE_TABLEENTRYFORMAT_HPP

#include <iosfwd>
#include <string>

namespace fitscodec {

    namespace table {

        /*! @ingroup table
         *  @{
         */

        /*! The format of one ASCII-table field, as given by a TFORMn keyword.
         *
         *  Recognized codes are "Aw" (text), "Iw" (integer) and "Fw.d" (fixed-point, ".d"
         *  optional). Any other code gives an INVALID format which keeps the original text,
         *  so that the error can be reported where the format is actually used.
         */
        class TableEntryFormat {

        public:
            enum Kind { INVALID = 0, CHAR, INT, FLOAT };

            TableEntryFormat( void ) : kind_(INVALID), width_(0), precision_(0) {}

            static TableEntryFormat parse( const std::string& code );
            static TableEntryFormat charFormat( size_t width ) { return TableEntryFormat( CHAR, width, 0 ); }
            static TableEntryFormat intFormat( size_t width ) { return TableEntryFormat( INT, width, 0 ); }
            static TableEntryFormat floatFormat( size_t width, size_t precision ) { return TableEntryFormat( FLOAT, width, precision ); }

            Kind kind( void ) const { return kind_; }
            bool valid( void ) const { return kind_ != INVALID; }
            bool numeric( void ) const { return kind_ == INT || kind_ == FLOAT; }
            size_t width( void ) const { return width_; }
            size_t precision( void ) const { return precision_; }

            /*! Number of characters the field occupies in a row (0 for an invalid format). */
            size_t fieldWidth( void ) const { return valid() ? width_ : 0; }

            /*! The text the format was parsed from (for an invalid format, unchanged). */
            const std::string& text( void ) const { return text_; }

            /*! The format code, e.g. "F8.3". An invalid format returns its original text. */
            std::string code( void ) const;

            TableEntryFormat withWidth( size_t w ) const;

            bool operator==( const TableEntryFormat& rhs ) const;
            bool operator!=( const TableEntryFormat& rhs ) const { return !(*this == rhs); }

        private:
            TableEntryFormat( Kind k, size_t w, size_t p );

            Kind kind_;
            size_t width_;
            size_t precision_;
            std::string text_;

        };

        std::ostream& operator<<( std::ostream&, const TableEntryFormat& );

        /*! @} */

    }   // table

}   // fitscodec


#endif  // FITSCODEC_TABLE_TABLEENTRYFORMAT_HPP
