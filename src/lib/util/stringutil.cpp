#include "fitscodec/util/stringutil.hpp"

#include <cstdlib>

#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>

namespace bfs = boost::filesystem;

using namespace fitscodec::util;
using namespace std;


bool fitscodec::util::isPrintable( const string &s ) {
    for( const char& c: s ) {
        if( c < 32 || c > 126 ) return false;
    }
    return true;
}


bool fitscodec::util::nocaseLess( const string& lhs, const string& rhs ) {
    return boost::ilexicographical_compare( lhs, rhs );
}


string fitscodec::util::alignLeft( const string& s, size_t n, unsigned char c ) {

    if(s.length() > n) {
        return s.substr(0, n);
    }

    return s + string(n - s.length(), c);

}


string fitscodec::util::alignRight( const string& s, size_t n, unsigned char c ) {

    if(s.length() > n) {
        return s.substr(0, n);
    }

    return string(n - s.length(), c) + s;

}


string fitscodec::util::cleanPath( string path, string base ) {

    if( path.empty() ) return path;
    
    if( (path[0] == '~') && ((path.size() == 1) || (path[1] == '/')) ) {
        const char* home = getenv( "HOME" );
        if( home ) {
            path.replace( 0, 1, home );
        }
    }

    bfs::path p( path );
    if( p.is_relative() && !base.empty() ) {
        p = bfs::path( cleanPath( base ) ) / p;
    }
    
    return p.lexically_normal().string();

}

