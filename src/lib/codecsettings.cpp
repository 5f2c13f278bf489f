#include "fitscodec/codecsettings.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <thread>

#include <boost/algorithm/string.hpp>
#include <boost/property_tree/info_parser.hpp>

using namespace fitscodec;
using namespace std;
using boost::algorithm::iequals;

namespace {

    const char* fillTags[] = { "zero", "blank" };

    char fillFromString( const string& s ) {
        if( iequals( s, fillTags[0] ) || s == "0" ) return 0;
        if( iequals( s, fillTags[1] ) || s == " " ) return ' ';
        throw logic_error( "Unknown table fill \"" + s + "\", expected \"zero\" or \"blank\"." );
    }

    string fillToString( char c ) {
        return (c == ' ') ? fillTags[1] : fillTags[0];
    }

    template<typename T>
    T getValue( const bpt::ptree& tree, string name, const T& defaultValue ) {
        T ret;
        try {
            ret = tree.get<T>( name, defaultValue );
        } catch( exception& e ) {
            string msg = "Failed to convert entry \"" + name + "\".\n"
            + "Value: \"" +  tree.get<string>( name )
            + "\"\nReason: " + e.what();
            throw logic_error( msg );
        }
        return ret;
    }

}


CodecSettings::CodecSettings( void ) : nThreads( defaultThreads() ), tableFill(0), blankAsZero(true) {

}


CodecSettings::CodecSettings( const bpo::variables_map& vm ) : CodecSettings() {

    if( vm.count( "threads" ) ) {
        nThreads = std::max( 1U, vm["threads"].as<unsigned int>() );
    }
    if( vm.count( "table-fill" ) ) {
        tableFill = fillFromString( vm["table-fill"].as<string>() );
    }
    if( vm.count( "strict-blanks" ) ) {
        blankAsZero = false;
    }

}


unsigned int CodecSettings::defaultThreads( void ) {
    return std::max( 1U, std::min( 4U, std::thread::hardware_concurrency() ) );
}


bpo::options_description CodecSettings::getOptions( void ) {

    bpo::options_description codec( "Codec Options" );
    codec.add_options()
    ( "threads,t", bpo::value<unsigned int>(), "Number of threads used when decoding table rows."
      " Default is the number of cores, at most 4." )
    ( "table-fill", bpo::value<string>(), "Padding after the rows of an ASCII table: \"zero\" (default) or \"blank\"." )
    ( "strict-blanks", "Treat blank numeric table fields as errors instead of zero." )
    ;

    return codec;

}


void CodecSettings::parseProperties( const bpt::ptree& tree, const CodecSettings& defaults ) {

    nThreads = std::max( 1U, getValue<unsigned int>( tree, "THREADS", defaults.nThreads ) );
    tableFill = fillFromString( getValue<string>( tree, "TABLE_FILL", fillToString( defaults.tableFill ) ) );
    blankAsZero = getValue<bool>( tree, "BLANK_AS_ZERO", defaults.blankAsZero );

}


void CodecSettings::getProperties( bpt::ptree& tree, const CodecSettings& defaults, bool showAll ) const {

    if( showAll || nThreads != defaults.nThreads ) tree.put( "THREADS", nThreads );
    if( showAll || tableFill != defaults.tableFill ) tree.put( "TABLE_FILL", fillToString( tableFill ) );
    if( showAll || blankAsZero != defaults.blankAsZero ) tree.put( "BLANK_AS_ZERO", blankAsZero );

}


CodecSettings::operator string() const {
    bpt::ptree dump;
    stringstream ss;
    getProperties( dump, CodecSettings(), true );
    bpt::write_info( ss, dump );
    return ss.str();
}
