#ifndef FITSCODEC_TABLE_COLUMN_HPP
#define FITSCODEC_TABLE_COLUMN_HPP

#include "fitscodec/exception.hpp"
#include "fitscodec/table/tableentry.hpp"
#include "fitscodec/table/tableentryformat.hpp"

#include <memory>
#include <string>
#include <vector>

#include <boost/optional.hpp>

namespace fitscodec {

    namespace table {

        /*! @ingroup table
         *  @{
         */

        /*! What a table needs from a column, regardless of its element type.
         */
        class ColumnBase {

        public:
            typedef std::unique_ptr<ColumnBase> Ptr;

            ColumnBase( const boost::optional<std::string>& label, const TableEntryFormat& fmt )
                : label_(label), format_(fmt) {}
            virtual ~ColumnBase( void ) {}

            virtual size_t length( void ) const = 0;

            /*! @brief Text of one cell, without padding.
             *  @throws IndexOutOfBounds
             */
            virtual std::string render( size_t row ) const = 0;
            std::vector<std::string> renderAll( void ) const;

            /*! @throws BadArgument if the entry is of another kind than the column. */
            virtual void append( const TableEntry& ) = 0;
            virtual void reserve( size_t n ) = 0;
            virtual ColumnBase* clone( void ) const = 0;

            const boost::optional<std::string>& label( void ) const { return label_; }
            void setLabel( const std::string& l ) { label_ = l; }
            const TableEntryFormat& format( void ) const { return format_; }

        protected:
            boost::optional<std::string> label_;
            TableEntryFormat format_;

        };


        template <typename T> TableEntryFormat defaultFormat( void );
        template <> inline TableEntryFormat defaultFormat<std::string>( void ) { return TableEntryFormat::charFormat( 1 ); }
        template <> inline TableEntryFormat defaultFormat<int64_t>( void ) { return TableEntryFormat::intFormat( 1 ); }
        template <> inline TableEntryFormat defaultFormat<double>( void ) { return TableEntryFormat::floatFormat( 1, 6 ); }


        /*! A column of std::string, int64_t or double cells, in row order.
         */
        template <typename T>
        class Column : public ColumnBase {

        public:
            explicit Column( const boost::optional<std::string>& label = boost::none,
                             const TableEntryFormat& fmt = defaultFormat<T>() ) : ColumnBase( label, fmt ) {}

            size_t length( void ) const override { return data_.size(); }

            std::string render( size_t row ) const override {
                if( row >= data_.size() ) {
                    throw IndexOutOfBounds( row, data_.size() );
                }
                return renderEntry( TableEntry( data_[row] ), format_ );
            }

            void append( const TableEntry& e ) override {
                const T* v = boost::get<T>( &e );
                if( !v ) {
                    throw BadArgument( "Column::append: entry does not match the column type ("
                                       + format_.code() + ")" );
                }
                data_.push_back( *v );
            }

            void reserve( size_t n ) override { data_.reserve( n ); }
            ColumnBase* clone( void ) const override { return new Column<T>( *this ); }

            void push_back( const T& v ) { data_.push_back( v ); }
            const T& operator[]( size_t i ) const { return data_[i]; }
            const std::vector<T>& data( void ) const { return data_; }

        private:
            std::vector<T> data_;

        };

        /*! @} */

    }   // table

}   // fitscodec


#endif  // FITSCODEC_TABLE_COLUMN_HPP
