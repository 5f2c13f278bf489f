#include "fitscodec/file/bitpix.hpp"
#include "fitscodec/file/blockio.hpp"
#include "fitscodec/file/exceptions.hpp"

#include <sstream>

#include <boost/filesystem.hpp>
#include <boost/test/unit_test.hpp>
using namespace boost::unit_test;

using namespace fitscodec::file;
using namespace std;

namespace bfs = boost::filesystem;


namespace testsuite {
    namespace file {
        
        void blockReaderTest( void ) {
            
            string bytes( 2*BLOCK_SIZE, 'x' );
            bytes[BLOCK_SIZE] = 'y';
            istringstream iss( bytes );
            BlockReader reader( iss );

            BOOST_CHECK( !reader.atEnd() );
            BOOST_TEST( reader.cursor() == 0 );

            vector<char> buf( BLOCK_SIZE );
            reader.readBlocks( buf );
            BOOST_TEST( reader.cursor() == BLOCK_SIZE );
            BOOST_TEST( buf[0] == 'x' );

            // unaligned requests are rejected before anything is consumed
            BOOST_CHECK_THROW( reader.readBlocks( buf.data(), 100 ), DataIOException );
            BOOST_CHECK_THROW( reader.readBlocks( buf.data(), BLOCK_SIZE+1 ), DataIOException );
            BOOST_TEST( reader.cursor() == BLOCK_SIZE );

            reader.readBlocks( buf );
            BOOST_TEST( buf[0] == 'y' );
            BOOST_TEST( reader.cursor() == 2*BLOCK_SIZE );
            BOOST_CHECK( reader.atEnd() );

            // nothing left
            BOOST_CHECK_THROW( reader.readBlocks( buf ), DataIOException );
            
            // zero-length reads are no-ops
            BOOST_CHECK_NO_THROW( reader.readBlocks( buf.data(), 0 ) );
            
        }
        
        
        void shortReadTest( void ) {
            
            istringstream iss( string( 1000, 'x' ) );
            BlockReader reader( iss );
            vector<char> buf( BLOCK_SIZE );
            BOOST_CHECK_THROW( reader.readBlocks( buf ), DataIOException );
            BOOST_TEST( reader.cursor() == 0 );

            istringstream iss2( string( 3*BLOCK_SIZE-1, 'x' ) );
            BlockReader reader2( iss2 );
            vector<char> buf2( 3*BLOCK_SIZE );
            BOOST_CHECK_THROW( reader2.readBlocks( buf2 ), DataIOException );
            
        }


        void blockWriterTest( void ) {

            ostringstream oss;
            BlockWriter writer( oss );

            vector<char> buf( BLOCK_SIZE, 'a' );
            writer.writeBlocks( buf );
            BOOST_TEST( writer.cursor() == BLOCK_SIZE );

            BOOST_CHECK_THROW( writer.writeBlocks( buf.data(), 80 ), DataIOException );
            BOOST_TEST( writer.cursor() == BLOCK_SIZE );
            BOOST_TEST( oss.str().size() == BLOCK_SIZE );

            buf.assign( 2*BLOCK_SIZE, 'b' );
            writer.writeBlocks( buf );
            writer.flush();
            BOOST_TEST( writer.cursor() == 3*BLOCK_SIZE );
            string out = oss.str();
            BOOST_TEST( out.size() == 3*BLOCK_SIZE );
            BOOST_TEST( out[BLOCK_SIZE-1] == 'a' );
            BOOST_TEST( out[BLOCK_SIZE] == 'b' );

            BOOST_TEST( blockCount( 0 ) == 0 );
            BOOST_TEST( blockCount( 1 ) == 1 );
            BOOST_TEST( blockCount( BLOCK_SIZE ) == 1 );
            BOOST_TEST( blockCount( BLOCK_SIZE+1 ) == 2 );
            BOOST_TEST( paddedSize( 17*3 ) == BLOCK_SIZE );
            BOOST_TEST( paddedSize( 2*BLOCK_SIZE ) == 2*BLOCK_SIZE );

        }


        void blockFileTest( void ) {

            bfs::path tmp = bfs::temp_directory_path() / bfs::unique_path( "fitscodec-%%%%-%%%%.fits" );
            {
                BlockWriter writer( tmp.string() );
                vector<char> buf( BLOCK_SIZE, 'z' );
                writer.writeBlocks( buf );
                BOOST_TEST( writer.name() == tmp.string() );
            }
            BOOST_TEST( bfs::file_size( tmp ) == BLOCK_SIZE );
            {
                BlockReader reader( tmp.string() );
                vector<char> buf( BLOCK_SIZE );
                reader.readBlocks( buf );
                BOOST_TEST( buf[BLOCK_SIZE-1] == 'z' );
                BOOST_CHECK( reader.atEnd() );
            }
            bfs::remove( tmp );

            BOOST_CHECK_THROW( BlockReader( (tmp / "no_such_file.fits").string() ), DataIOException );

        }


        void bitpixTest( void ) {

            BOOST_TEST( bitpixFromCode( 8 ) == BITPIX_BYTE );
            BOOST_TEST( bitpixFromCode( 16 ) == BITPIX_SHORT );
            BOOST_TEST( bitpixFromCode( 32 ) == BITPIX_INT );
            BOOST_TEST( bitpixFromCode( 64 ) == BITPIX_LONG );
            BOOST_TEST( bitpixFromCode( -32 ) == BITPIX_FLOAT );
            BOOST_TEST( bitpixFromCode( -64 ) == BITPIX_DOUBLE );

            BOOST_CHECK_THROW( bitpixFromCode( 0 ), FormatError );
            BOOST_CHECK_THROW( bitpixFromCode( 24 ), FormatError );
            BOOST_CHECK_THROW( bitpixFromCode( -16 ), FormatError );
            BOOST_CHECK_THROW( bitpixFromCode( -8 ), FormatError );

            BOOST_TEST( byteWidth( BITPIX_BYTE ) == 1 );
            BOOST_TEST( byteWidth( BITPIX_SHORT ) == 2 );
            BOOST_TEST( byteWidth( BITPIX_INT ) == 4 );
            BOOST_TEST( byteWidth( BITPIX_LONG ) == 8 );
            BOOST_TEST( byteWidth( BITPIX_FLOAT ) == 4 );
            BOOST_TEST( byteWidth( BITPIX_DOUBLE ) == 8 );

            BOOST_TEST( bitpixName( BITPIX_FLOAT ) == "float32" );
            BOOST_TEST( bitpixName( BITPIX_BYTE ) == "uint8" );
            
            BOOST_CHECK( getBitpix<int16_t>() == BITPIX_SHORT );
            BOOST_CHECK( getBitpix<double>() == BITPIX_DOUBLE );

        }
        
        
        void add_fits_tests( test_suite* ts );      // defined in fits.cpp

        void add_tests( test_suite* ts ) {
            
            ts->add( BOOST_TEST_CASE_NAME( &blockReaderTest, "BlockReader" ) );
            ts->add( BOOST_TEST_CASE_NAME( &shortReadTest, "Short reads" ) );
            ts->add( BOOST_TEST_CASE_NAME( &blockWriterTest, "BlockWriter" ) );
            ts->add( BOOST_TEST_CASE_NAME( &blockFileTest, "Block I/O on files" ) );
            ts->add( BOOST_TEST_CASE_NAME( &bitpixTest, "Bitpix" ) );

            add_fits_tests( ts );

        }

    }
}
