#include "fitscodec/table/tableentry.hpp"

#include "fitscodec/file/exceptions.hpp"

#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

using namespace fitscodec::file;
using namespace fitscodec::table;
using namespace std;

namespace {

    struct RenderVisitor : public boost::static_visitor<string> {
        explicit RenderVisitor( size_t p ) : precision( static_cast<int>(p) ) {}
        string operator()( const string& s ) const { return s; }
        string operator()( const int64_t& i ) const { return to_string( i ); }
        string operator()( const double& d ) const {
            ostringstream ss;
            ss << fixed << showpoint << setprecision( precision ) << d;
            if( !std::isfinite( d ) || readsBack( ss.str(), d ) ) {
                return ss.str();
            }
            // The declared precision loses digits: add decimals, or use the exponent form
            // when that is shorter.
            const int maxDigits = numeric_limits<double>::max_digits10;
            string sci;
            for( int p = 0; p < maxDigits; ++p ) {
                ss.str( "" );
                ss << scientific << noshowpoint << uppercase << setprecision( p ) << d;
                sci = ss.str();
                if( readsBack( sci, d ) ) break;
            }
            for( int p = precision+1; p <= maxDigits; ++p ) {
                ss.str( "" );
                ss << fixed << showpoint << setprecision( p ) << d;
                if( ss.str().size() > sci.size() ) break;
                if( readsBack( ss.str(), d ) ) return ss.str();
            }
            return sci;
        }
        static bool readsBack( const string& text, double d ) {
            double v;
            return boost::conversion::try_lexical_convert( text, v ) && ( v == d );
        }
        int precision;
    };

}


TableEntry fitscodec::table::makeEntry( const string& text, const TableEntryFormat& fmt, size_t row, size_t field,
                                        bool blankAsZero ) {

    if( fmt.kind() == TableEntryFormat::CHAR ) {
        return boost::trim_right_copy( text );
    }
    
    if( !fmt.valid() ) {
        throw SetupError( fmt.text() );
    }

    string value = boost::trim_copy( text );
    if( value.empty() ) {
        if( !blankAsZero ) {
            throw ParseError( row, field, text, "blank numeric field" );
        }
        if( fmt.kind() == TableEntryFormat::INT ) {
            return int64_t(0);
        }
        return 0.0;
    }

    try {
        if( fmt.kind() == TableEntryFormat::INT ) {
            return boost::lexical_cast<int64_t>( value );
        }
        // Fortran-style D exponents
        boost::replace_all( value, "D", "E" );
        boost::replace_all( value, "d", "E" );
        double d = boost::lexical_cast<double>( value );
        if( value.find_first_of( ".eE" ) == string::npos && fmt.precision() ) {
            d /= pow( 10.0, static_cast<double>( fmt.precision() ) );
        }
        return d;
    } catch( const boost::bad_lexical_cast& e ) {
        throw ParseError( row, field, text, e.what() );
    }

}


string fitscodec::table::renderEntry( const TableEntry& entry, const TableEntryFormat& fmt ) {

    return boost::apply_visitor( RenderVisitor( fmt.precision() ), entry );

}
