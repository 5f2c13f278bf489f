#include "fitscodec/codecsettings.hpp"
#include "fitscodec/logging/logger.hpp"
#include "fitscodec/table/asciitablecodec.hpp"

#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

#include <boost/filesystem.hpp>
#include <boost/property_tree/info_parser.hpp>
#include <boost/test/unit_test.hpp>

using namespace fitscodec::file;
using namespace fitscodec::logging;
using namespace fitscodec::table;
using namespace fitscodec;

using namespace std;

using namespace boost::unit_test_framework;

namespace bfs = boost::filesystem;

namespace testsuite {

    namespace util {

        namespace {

            bpt::ptree parseInfo( const string& text ) {
                bpt::ptree tree;
                istringstream iss( text );
                bpt::read_info( iss, tree );
                return tree;
            }

            bpo::variables_map parseArgs( const vector<string>& args, const bpo::options_description& desc ) {
                bpo::variables_map vm;
                bpo::store( bpo::command_line_parser( args ).options( desc ).run(), vm );
                bpo::notify( vm );
                return vm;
            }

        }


        void settingsTest( void ) {

            CodecSettings defaults;
            BOOST_CHECK( defaults.nThreads >= 1 );
            BOOST_CHECK( defaults.nThreads <= 4 );
            BOOST_CHECK_EQUAL( defaults.nThreads, CodecSettings::defaultThreads() );
            BOOST_CHECK_EQUAL( int(defaults.tableFill), 0 );
            BOOST_CHECK( defaults.blankAsZero );

            CodecSettings s;
            s.parseProperties( parseInfo( "THREADS 3\nTABLE_FILL blank\nBLANK_AS_ZERO false\n" ) );
            BOOST_CHECK_EQUAL( s.nThreads, 3 );
            BOOST_CHECK_EQUAL( s.tableFill, ' ' );
            BOOST_CHECK( !s.blankAsZero );

            // only the non-default values are exported, unless all are asked for
            bpt::ptree tree;
            CodecSettings s2;
            s2.tableFill = ' ';
            s2.getProperties( tree );
            BOOST_CHECK_EQUAL( tree.size(), 1 );
            BOOST_CHECK_EQUAL( tree.get<string>( "TABLE_FILL" ), "blank" );
            tree.clear();
            s2.getProperties( tree, CodecSettings(), true );
            BOOST_CHECK_EQUAL( tree.size(), 3 );

            CodecSettings s3;
            s3.parseProperties( tree );
            BOOST_CHECK_EQUAL( s3.tableFill, ' ' );
            BOOST_CHECK_EQUAL( s3.nThreads, s2.nThreads );

            string dump = s;
            BOOST_CHECK( dump.find( "TABLE_FILL blank" ) != string::npos );
            BOOST_CHECK( dump.find( "THREADS 3" ) != string::npos );

            BOOST_CHECK_THROW( s.parseProperties( parseInfo( "TABLE_FILL pink\n" ) ), logic_error );
            BOOST_CHECK_THROW( s.parseProperties( parseInfo( "THREADS many\n" ) ), logic_error );

            // missing entries take the given defaults
            CodecSettings s4;
            s4.parseProperties( parseInfo( "THREADS 2\n" ), s );
            BOOST_CHECK_EQUAL( s4.nThreads, 2 );
            BOOST_CHECK_EQUAL( s4.tableFill, ' ' );
            BOOST_CHECK( !s4.blankAsZero );

        }


        void optionsTest( void ) {

            bpo::options_description desc = CodecSettings::getOptions();
            CodecSettings s( parseArgs( { "-t", "2", "--table-fill", "blank", "--strict-blanks" }, desc ) );
            BOOST_CHECK_EQUAL( s.nThreads, 2 );
            BOOST_CHECK_EQUAL( s.tableFill, ' ' );
            BOOST_CHECK( !s.blankAsZero );

            CodecSettings s2( parseArgs( {}, desc ) );
            BOOST_CHECK_EQUAL( s2.nThreads, CodecSettings::defaultThreads() );
            BOOST_CHECK( s2.blankAsZero );

            CodecSettings s3( parseArgs( { "--threads", "0" }, desc ) );
            BOOST_CHECK_EQUAL( s3.nThreads, 1 );

            BOOST_CHECK_THROW( CodecSettings( parseArgs( { "--table-fill", "pink" }, desc ) ), logic_error );

            desc.add( Logger::getOptions() );
            uint8_t savedMask = Logger::getDefaultMask();
            {
                bpo::variables_map vm = parseArgs( { "--verbosity", "7" }, desc );
                Logger logger( vm );
                BOOST_CHECK_EQUAL( Logger::getDefaultLevel(), 7 );
                BOOST_CHECK_EQUAL( int(logger.getMask()), LOG_UPTO(7) );
                BOOST_CHECK_EQUAL( logger.nOutputs(), 0 );
            }
            Logger::setDefaultMask( savedMask );

        }


        void loggingTest( void ) {

            Logger logger;
            logger.setLevel( LOG_LEVEL_DETAIL );
            ostringstream oss;
            logger.addStream( oss, LOG_MASK_ANY );
            BOOST_CHECK_EQUAL( logger.nOutputs(), 1 );

            LOG_DETAIL << "decoded " << 3 << " rows" << ende;
            LOG_DEBUG << "not shown" << ende;
            logger.setContext( "codec" );
            LOG_WARN << "careful" << ende;
            logger.flushAll();

            string out = oss.str();
            BOOST_CHECK( out.find( "decoded 3 rows" ) != string::npos );
            BOOST_CHECK( out.find( "[d]" ) != string::npos );
            BOOST_CHECK( out.find( "not shown" ) == string::npos );
            BOOST_CHECK( out.find( "(codec) careful" ) != string::npos );
            BOOST_CHECK( out.find( "[W]" ) != string::npos );

            // the codecs report through the logger they are given
            logger.setMask( LOG_MASK_ANY );
            AsciiTableCodec codec( logger );
            istringstream iss( string( BLOCK_SIZE, ' ' ) );
            BlockReader reader( iss );
            TableLayout layout;
            layout.rowWidth = 4;
            layout.nRows = 2;
            layout.formats = { "A4" };
            codec.decodeTable( reader, layout );
            logger.flushAll();
            BOOST_CHECK( oss.str().find( "Decoded ASCII table with 1 columns and 2 rows" ) != string::npos );

            logger.removeAllOutputs();
            BOOST_CHECK_EQUAL( logger.nOutputs(), 0 );

            bfs::path tmp = bfs::temp_directory_path() / bfs::unique_path( "fitscodec-%%%%-%%%%.log" );
            logger.addFile( tmp.string(), LOG_MASK_ANY );
            LOG_ERR << "to file" << ende;
            logger.removeAllOutputs();
            ifstream ifs( tmp.string() );
            string contents( (istreambuf_iterator<char>( ifs )), istreambuf_iterator<char>() );
            BOOST_CHECK( contents.find( "to file" ) != string::npos );
            BOOST_CHECK( contents.find( "\033[" ) == string::npos );       // no colours in files
            ifs.close();
            bfs::remove( tmp );

        }


        void add_settings_tests( test_suite* ts ) {

            ts->add( BOOST_TEST_CASE_NAME( &settingsTest, "Codec settings" ) );
            ts->add( BOOST_TEST_CASE_NAME( &optionsTest, "Command-line options" ) );
            ts->add( BOOST_TEST_CASE_NAME( &loggingTest, "Logging" ) );

        }

    }

}
