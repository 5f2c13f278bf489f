#include "fitscodec/table/asciitable.hpp"

#include <algorithm>

using namespace fitscodec::table;
using namespace fitscodec;
using namespace std;


vector<string> ColumnBase::renderAll( void ) const {

    vector<string> ret;
    size_t n = length();
    ret.reserve( n );
    for( size_t i = 0; i < n; ++i ) {
        ret.push_back( render( i ) );
    }
    return ret;

}


AsciiTable::AsciiTable( const AsciiTable& rhs ) : nRows_( rhs.nRows_ ) {

    columns.reserve( rhs.columns.size() );
    for( const auto& col: rhs.columns ) {
        columns.push_back( ColumnBase::Ptr( col->clone() ) );
    }

}


AsciiTable& AsciiTable::operator=( const AsciiTable& rhs ) {

    if( this != &rhs ) {
        AsciiTable tmp( rhs );
        std::swap( nRows_, tmp.nRows_ );
        std::swap( columns, tmp.columns );
    }
    return *this;

}


void AsciiTable::addColumn( ColumnBase::Ptr col ) {

    if( !col ) {
        throw BadArgument( "AsciiTable::addColumn: null column" );
    }
    col->reserve( nRows_ );
    columns.push_back( std::move(col) );

}


void AsciiTable::addRow( const vector<TableEntry>& row ) {

    if( row.size() != columns.size() ) {
        throw BadArgument( "AsciiTable::addRow: row has " + to_string(row.size()) + " entries, table has "
                           + to_string(columns.size()) + " columns" );
    }
    for( size_t i = 0; i < row.size(); ++i ) {
        columns[i]->append( row[i] );
    }

}


size_t AsciiTable::maxColumnLength( void ) const {

    size_t ret(0);
    for( const auto& col: columns ) {
        ret = std::max( ret, col->length() );
    }
    return ret;

}


const ColumnBase& AsciiTable::column( size_t i ) const {

    if( i >= columns.size() ) {
        throw IndexOutOfBounds( i, columns.size() );
    }
    return *columns[i];

}


vector<TableEntryFormat> AsciiTable::formats( void ) const {

    vector<TableEntryFormat> ret;
    for( const auto& col: columns ) {
        ret.push_back( col->format() );
    }
    return ret;

}


vector<ColumnBase::Ptr> AsciiTable::release( void ) {

    vector<ColumnBase::Ptr> ret;
    std::swap( ret, columns );
    return ret;

}
