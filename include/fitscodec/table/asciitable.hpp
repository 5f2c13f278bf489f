#ifndef FITSCODEC_TABLE_ASCIITABLE_HPP
#define FITSCODEC_TABLE_ASCIITABLE_HPP

#include "fitscodec/table/column.hpp"
#include "fitscodec/table/tableentry.hpp"

#include <vector>

namespace fitscodec {

    namespace table {

        /*! @ingroup table
         *  @{
         */

        /*! A table of heterogeneously typed columns.
         *
         *  Decoding creates the table with the row count from the header and fills it
         *  row by row. Columns are deep-copied when the table is copied.
         */
        class AsciiTable {

        public:
            AsciiTable( void ) : nRows_(0) {}
            explicit AsciiTable( size_t nRows ) : nRows_(nRows) {}
            AsciiTable( const AsciiTable& );
            AsciiTable( AsciiTable&& ) = default;
            AsciiTable& operator=( const AsciiTable& );
            AsciiTable& operator=( AsciiTable&& ) = default;

            void addColumn( ColumnBase::Ptr col );
            template <typename T>
            void addColumn( const Column<T>& col ) { addColumn( ColumnBase::Ptr( new Column<T>( col ) ) ); }

            /*! @brief Append one entry to each column.
             *  @throws BadArgument if the row does not have one entry per column, or an entry
             *          does not match its column.
             */
            void addRow( const std::vector<TableEntry>& row );

            size_t nColumns( void ) const { return columns.size(); }
            /*! Row count the table was created for. */
            size_t nRows( void ) const { return nRows_; }
            size_t maxColumnLength( void ) const;

            /*! @throws IndexOutOfBounds */
            const ColumnBase& column( size_t i ) const;
            /*! @throws BadArgument if column \c i does not hold cells of type T. */
            template <typename T>
            const Column<T>& column( size_t i ) const {
                const Column<T>* col = dynamic_cast<const Column<T>*>( &column( i ) );
                if( !col ) {
                    throw BadArgument( "AsciiTable: column " + std::to_string(i) + " is of another type (" 
                                       + column( i ).format().code() + ")" );
                }
                return *col;
            }

            std::vector<TableEntryFormat> formats( void ) const;

            /*! @brief Hand over the columns, leaving the table empty. */
            std::vector<ColumnBase::Ptr> release( void );

        private:
            size_t nRows_;
            std::vector<ColumnBase::Ptr> columns;

        };

        /*! @} */

    }   // table

}   // fitscodec


#endif  // FITSCODEC_TABLE_ASCIITABLE_HPP
