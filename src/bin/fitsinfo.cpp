#include "fitscodec/codecsettings.hpp"
#include "fitscodec/file/hdu.hpp"
#include "fitscodec/logging/logger.hpp"

#include <cstdlib>
#include <iostream>
#include <map>
#include <sstream>
#include <string>

#include <boost/program_options.hpp>
namespace bpo = boost::program_options;

using namespace fitscodec::file;
using namespace fitscodec::image;
using namespace fitscodec::logging;
using namespace fitscodec::table;
using namespace fitscodec;

using namespace std;

namespace {

    // define options specific to this binary
    bpo::options_description getOptions( void ) {

        bpo::options_description options( "Program Options" );
        options.add_options()
        ( "help,h", "Show this help." )
        ( "input-file", bpo::value< vector<string> >()->composing(), "FITS file(s) to list. (positional)" )
        ( "cards,c", "Print all header cards." )
        ( "output,o", bpo::value<string>(), "Write the (decoded) HDUs of the first input file to this file." )
        ;

        return options;
    }

    // define environment variables to use as defaults if the corresponding command-line option is not specified
    string environmentMap( const string &envName ) {

        static map<string, string> vmap;
        if( vmap.empty() ) {
            vmap["FITSCODEC_VERBOSITY"] = "verbosity";
            vmap["FITSCODEC_THREADS"] = "threads";
        }
        map<string, string>::const_iterator ci = vmap.find( envName );
        if( ci == vmap.end() ) {
            return "";
        }
        else {
            return ci->second;
        }
    }


    struct SummaryVisitor : public boost::static_visitor<string> {
        string operator()( const AsciiTable& tbl ) const {
            string ret = "ASCII table, " + to_string( tbl.nColumns() ) + " columns x " + to_string( tbl.nRows() ) + " rows (";
            vector<TableEntryFormat> fmts = tbl.formats();
            for( size_t i = 0; i < fmts.size(); ++i ) {
                if( i ) ret += ",";
                ret += fmts[i].code();
            }
            return ret + ")";
        }
        string operator()( const BinTable& tbl ) const {
            return "Binary table, " + to_string( tbl.formats.size() ) + " columns x " + to_string( tbl.nRows )
                   + " rows, " + to_string( tbl.dataSize() ) + " bytes";
        }
        string operator()( const TypedImage& img ) const {
            ostringstream oss;
            oss << "Image " << img;
            return oss.str();
        }
        string operator()( const RandomGroups& rg ) const {
            return "Random groups, " + to_string( rg.nGroups ) + " groups of " + bitpixName( rg.bitpix ) + ", "
                   + to_string( rg.nParameters ) + " parameters";
        }
    };

}


int main( int argc, char *argv[] ) {

    bpo::variables_map vm;
    bpo::options_description allOptions = getOptions();
    allOptions.add( CodecSettings::getOptions() );
    allOptions.add( Logger::getOptions() );

    bpo::positional_options_description positional;
    positional.add( "input-file", -1 );

    try {
        bpo::store( bpo::command_line_parser( argc, argv ).options( allOptions ).positional( positional )
                    .extra_parser( Logger::customParser ).run(), vm );
        // load matched environment variables according to the environmentMap() above.
        bpo::store( bpo::parse_environment( allOptions, environmentMap ), vm );
        vm.notify();
    } catch( const exception& e ) {
        cerr << "Failed to parse command-line. Reason: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    if( vm.count( "help" ) || !vm.count( "input-file" ) ) {
        cout << "Usage: fitsinfo [options] file.fits ..." << endl << allOptions << endl;
        return EXIT_SUCCESS;
    }

    int ret = EXIT_SUCCESS;
    try {
        Logger logger( vm );
        if( !vm.count( "log-file" ) && !vm.count( "log-stdout" ) ) {
            logger.addStream( cerr );
        }
        CodecSettings settings( vm );
        HduCodec codec( logger, settings );
        LOG_DEBUG << "Codec settings:\n" << string( settings ) << ende;

        const vector<string>& files = vm["input-file"].as< vector<string> >();
        for( size_t f = 0; f < files.size(); ++f ) {
            vector<Hdu> hdus;
            try {
                BlockReader reader( files[f] );
                hdus = codec.readAll( reader );
            } catch( const fitscodec::Exception& e ) {
                LOG_ERR << "Failed to read \"" << files[f] << "\": " << e.what() << ende;
                ret = EXIT_FAILURE;
                continue;
            }
            cout << files[f] << ": " << hdus.size() << " HDU" << ( (hdus.size() == 1) ? "" : "s" ) << endl;
            for( size_t i = 0; i < hdus.size(); ++i ) {
                cout << "  [" << i << "] " << hdus[i].header.cards.size() << " cards, ";
                if( hdus[i].data ) {
                    cout << boost::apply_visitor( SummaryVisitor(), *hdus[i].data ) << endl;
                } else {
                    cout << "no data" << endl;
                }
                if( vm.count( "cards" ) ) {
                    for( const auto& card: hdus[i].header.cards ) {
                        cout << "      " << card << endl;
                    }
                }
            }
            if( (f == 0) && vm.count( "output" ) ) {
                BlockWriter writer( vm["output"].as<string>() );
                for( size_t i = 0; i < hdus.size(); ++i ) {
                    codec.write( writer, hdus[i], (i == 0) );
                }
                writer.flush();
                LOG_DETAIL << "Wrote " << hdus.size() << " HDUs to " << writer.name() << ende;
            }
        }
        logger.flushAll();
    } catch( const exception& e ) {
        cerr << "fitsinfo: " << e.what() << endl;
        ret = EXIT_FAILURE;
    }

    return ret;

}
