#include "fitscodec/table/tableentryformat.hpp"

#include <ostream>

#include <boost/algorithm/string.hpp>

using namespace fitscodec::table;
using namespace std;

namespace {

    // Parse a non-empty run of decimal digits. Anything else, or overflow, fails.
    bool parseUnsigned( const string& s, size_t& value ) {
        if( s.empty() || s.size() > 9 ) return false;
        value = 0;
        for( const char& c: s ) {
            if( c < '0' || c > '9' ) return false;
            value = value*10 + (c - '0');
        }
        return true;
    }

}


TableEntryFormat::TableEntryFormat( Kind k, size_t w, size_t p ) : kind_(k), width_(w), precision_(p) {
    text_ = code();
}


TableEntryFormat TableEntryFormat::parse( const string& code ) {

    TableEntryFormat ret;
    ret.text_ = code;
    
    string trimmed = boost::trim_copy( code );
    if( trimmed.size() < 2 ) return ret;

    Kind k;
    switch( trimmed[0] ) {
        case 'A': k = CHAR; break;
        case 'I': k = INT; break;
        case 'F': k = FLOAT; break;
        default: return ret;
    }
    
    string widthText = trimmed.substr( 1 );
    string precisionText;
    size_t dot = widthText.find( '.' );
    if( dot != string::npos ) {
        if( k != FLOAT ) return ret;
        precisionText = widthText.substr( dot+1 );
        widthText.erase( dot );
    }

    size_t w(0), p(0);
    if( !parseUnsigned( widthText, w ) || (w == 0) ) return ret;
    if( (dot != string::npos) && !parseUnsigned( precisionText, p ) ) return ret;

    ret.kind_ = k;
    ret.width_ = w;
    ret.precision_ = p;
    return ret;

}


string TableEntryFormat::code( void ) const {

    switch( kind_ ) {
        case CHAR:  return "A" + to_string( width_ );
        case INT:   return "I" + to_string( width_ );
        case FLOAT: return "F" + to_string( width_ ) + "." + to_string( precision_ );
        default:    return text_;
    }

}


TableEntryFormat TableEntryFormat::withWidth( size_t w ) const {
    
    if( !valid() ) return *this;
    return TableEntryFormat( kind_, w, precision_ );
    
}


bool TableEntryFormat::operator==( const TableEntryFormat& rhs ) const {

    if( kind_ != rhs.kind_ ) return false;
    if( kind_ == INVALID ) return text_ == rhs.text_;
    return ( width_ == rhs.width_ ) && ( precision_ == rhs.precision_ );

}


ostream& fitscodec::table::operator<<( ostream& os, const TableEntryFormat& fmt ) {
    
    switch( fmt.kind() ) {
        case TableEntryFormat::CHAR:  os << "Char(" << fmt.width() << ")"; break;
        case TableEntryFormat::INT:   os << "Int(" << fmt.width() << ")"; break;
        case TableEntryFormat::FLOAT: os << "Float(" << fmt.width() << "," << fmt.precision() << ")"; break;
        default: os << "Invalid(\"" << fmt.text() << "\")";
    }
    return os;
    
}
