#include "fitscodec/file/exceptions.hpp"
#include "fitscodec/image/typedimage.hpp"

#include <sstream>
#include <string>

#include <boost/test/unit_test.hpp>

using namespace fitscodec::file;
using namespace fitscodec::image;
using namespace fitscodec::util;

using namespace std;
using namespace boost::unit_test;


namespace testsuite {

    namespace image {

        void typeMismatchTest( void ) {

            Array<float> arr( 2, 3 );
            float v(0.25);
            for( auto& f: arr ) f = (v *= 2);

            TypedImage img( arr );
            BOOST_CHECK( img.bitpix() == BITPIX_FLOAT );
            BOOST_TEST( img.nElements() == 6 );
            BOOST_TEST( img.blockLength() == 24 );
            BOOST_TEST( img.dimensions().size() == 2 );
            BOOST_TEST( img.dimensions()[0] == 2 );
            BOOST_TEST( img.dimensions()[1] == 3 );
            BOOST_CHECK( img.holds<float>() );
            BOOST_CHECK( !img.holds<int32_t>() );

            // the float accessor returns the data untouched
            BOOST_CHECK( img.get<float>() == arr );
            BOOST_TEST( img.get<float>()( 1, 2 ) == 16.0f );

            try {
                img.get<int32_t>();
                BOOST_ERROR( "get<int32_t> on a float image should throw" );
            } catch( const TypeMismatch& e ) {
                BOOST_CHECK( e.stored() == BITPIX_FLOAT );
                BOOST_CHECK( e.requested() == BITPIX_INT );
                string msg = e.what();
                BOOST_CHECK( msg.find( "float32" ) != string::npos );
                BOOST_CHECK( msg.find( " int32" ) != string::npos );
            }
            BOOST_CHECK_THROW( img.get<double>(), TypeMismatch );
            BOOST_CHECK_THROW( img.get<uint8_t>(), fitscodec::RecoverableException );

        }


        void takeArrayTest( void ) {

            Array<int64_t> arr( 5 );
            int64_t i(-2);
            for( auto& a: arr ) a = (i++) * (int64_t(1) << 40);

            TypedImage img( arr );
            BOOST_CHECK_THROW( takeArray<int32_t>( std::move(img) ), TypeMismatch );

            TypedImage img2( arr );
            Array<int64_t> out = takeArray<int64_t>( std::move(img2) );
            BOOST_CHECK( out == arr );
            BOOST_TEST( img2.nElements() == 0 );

        }


        void printTest( void ) {

            ostringstream oss;
            oss << TypedImage( Array<int16_t>( 4, 5 ) );
            BOOST_TEST( oss.str() == "TypedImage(int16, 4x5)" );

            oss.str( "" );
            oss << TypedImage( Array<double>( 7 ) );
            BOOST_TEST( oss.str() == "TypedImage(float64, 7)" );

            oss.str( "" );
            oss << TypedImage();
            BOOST_TEST( oss.str() == "TypedImage(uint8, empty)" );

        }


        void add_typedimage_tests( test_suite* ts ) {

            ts->add( BOOST_TEST_CASE_NAME( &typeMismatchTest, "Type mismatch" ) );
            ts->add( BOOST_TEST_CASE_NAME( &takeArrayTest, "takeArray" ) );
            ts->add( BOOST_TEST_CASE_NAME( &printTest, "Print" ) );

        }

    }

}
