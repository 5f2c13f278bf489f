#include "fitscodec/file/exceptions.hpp"
#include "fitscodec/image/imagecodec.hpp"

#include "testsuite.hpp"

#include <sstream>
#include <string>

#include <boost/test/unit_test.hpp>

using namespace fitscodec::file;
using namespace fitscodec::image;
using namespace fitscodec::util;
using namespace testsuite;

using namespace std;
using namespace boost::unit_test;


namespace testsuite {

    namespace image {

        void decodeIntTest( void ) {

            const unsigned char raw[] = { 0x00, 0x00, 0x00, 0x01,       // 1
                                          0xFF, 0xFF, 0xFF, 0xFE,       // -2
                                          0x00, 0x01, 0x00, 0x00,       // 65536
                                          0x01, 0x02, 0x03, 0x04 };     // 0x01020304
            istringstream iss( blockPadded( string( reinterpret_cast<const char*>( raw ), sizeof(raw) ), 0 ) );
            BlockReader reader( iss );

            TypedImage img = decodeImage( reader, BITPIX_INT, { 2, 2 } );
            BOOST_TEST( reader.cursor() == BLOCK_SIZE );
            BOOST_CHECK( img.bitpix() == BITPIX_INT );

            // column-major: NAXIS1 varies fastest
            const Array<int32_t>& arr = img.get<int32_t>();
            BOOST_TEST( arr( 0, 0 ) == 1 );
            BOOST_TEST( arr( 1, 0 ) == -2 );
            BOOST_TEST( arr( 0, 1 ) == 65536 );
            BOOST_TEST( arr( 1, 1 ) == 0x01020304 );

        }


        void decodeFloatTest( void ) {

            const unsigned char raw32[] = { 0x3F, 0x80, 0x00, 0x00,     // 1.0
                                            0xC0, 0x20, 0x00, 0x00 };   // -2.5
            istringstream iss( blockPadded( string( reinterpret_cast<const char*>( raw32 ), sizeof(raw32) ), 0 ) );
            BlockReader reader( iss );
            TypedImage img = decodeImage( reader, BITPIX_FLOAT, { 2 } );
            BOOST_TEST( img.get<float>()( 0 ) == 1.0f );
            BOOST_TEST( img.get<float>()( 1 ) == -2.5f );
            BOOST_CHECK_THROW( img.get<double>(), TypeMismatch );

            const unsigned char raw64[] = { 0x40, 0x00, 0, 0, 0, 0, 0, 0 };     // 2.0
            istringstream iss2( blockPadded( string( reinterpret_cast<const char*>( raw64 ), sizeof(raw64) ), 0 ) );
            BlockReader reader2( iss2 );
            img = decodeImage( reader2, BITPIX_DOUBLE, { 1, 1, 1 } );
            BOOST_TEST( img.dimensions().size() == 3 );
            BOOST_TEST( img.get<double>()( 0, 0, 0 ) == 2.0 );

        }


        void decodeMultiBlockTest( void ) {

            // 100x50 int16 = 10000 bytes -> 4 blocks
            string bytes;
            for( size_t i = 0; i < 100*50; ++i ) {
                bytes.push_back( char( i >> 8 ) );
                bytes.push_back( char( i & 0xFF ) );
            }
            istringstream iss( blockPadded( bytes, 0 ) + string( BLOCK_SIZE, 'x' ) );
            BlockReader reader( iss );
            TypedImage img = decodeImage( reader, BITPIX_SHORT, { 100, 50 } );
            BOOST_TEST( reader.cursor() == 4*BLOCK_SIZE );          // the padding is consumed, nothing more
            const Array<int16_t>& arr = img.get<int16_t>();
            BOOST_TEST( arr( 0, 0 ) == 0 );
            BOOST_TEST( arr( 99, 0 ) == 99 );
            BOOST_TEST( arr( 0, 1 ) == 100 );
            BOOST_TEST( arr( 99, 49 ) == 4999 );

            // stream too short for the image
            istringstream iss2( string( BLOCK_SIZE, 0 ) );
            BlockReader reader2( iss2 );
            BOOST_CHECK_THROW( decodeImage( reader2, BITPIX_DOUBLE, { 400 } ), DataIOException );

        }


        void encodeTest( void ) {

            Array<int16_t> arr( 3 );
            arr( 0 ) = 1;
            arr( 1 ) = -1;
            arr( 2 ) = 256;

            ostringstream oss;
            BlockWriter writer( oss );
            encodeImage( writer, TypedImage( arr ) );
            string bytes = oss.str();
            BOOST_TEST( bytes.size() == BLOCK_SIZE );
            const unsigned char expected[] = { 0x00, 0x01, 0xFF, 0xFF, 0x01, 0x00 };
            BOOST_TEST( compare_strings( bytes.substr( 0, 6 ), string( reinterpret_cast<const char*>( expected ), 6 ) ) );
            BOOST_CHECK( bytes.find_first_not_of( '\0', 6 ) == string::npos );         // zero padding

            Array<double> arr2( 3, 4, 5 );
            double v(0.1);
            for( auto& d: arr2 ) d = (v *= -1.5);
            ostringstream oss2;
            BlockWriter writer2( oss2 );
            encodeImage( writer2, TypedImage( arr2 ) );
            BOOST_TEST( oss2.str().size() == BLOCK_SIZE );

            istringstream iss( oss2.str() );
            BlockReader reader( iss );
            TypedImage img = decodeImage( reader, BITPIX_DOUBLE, arr2.dimensions() );
            BOOST_CHECK( img.get<double>() == arr2 );

        }


        void add_codec_tests( test_suite* ts ) {

            ts->add( BOOST_TEST_CASE_NAME( &decodeIntTest, "Decode integer image" ) );
            ts->add( BOOST_TEST_CASE_NAME( &decodeFloatTest, "Decode float image" ) );
            ts->add( BOOST_TEST_CASE_NAME( &decodeMultiBlockTest, "Decode multi-block image" ) );
            ts->add( BOOST_TEST_CASE_NAME( &encodeTest, "Encode image" ) );

        }

    }

}
