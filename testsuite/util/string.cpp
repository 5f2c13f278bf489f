#include "fitscodec/util/stringutil.hpp"

#include <cstdlib>

#include <boost/test/unit_test.hpp>

using namespace fitscodec::util;

using namespace std;

using namespace boost::unit_test_framework;

namespace testsuite {

    namespace util {

        void stringTest( void ) {

            BOOST_CHECK_EQUAL( alignLeft( "ab", 5 ), "ab   " );
            BOOST_CHECK_EQUAL( alignLeft( "abcdef", 3 ), "abc" );
            BOOST_CHECK_EQUAL( alignRight( "ab", 5, '0' ), "000ab" );
            BOOST_CHECK_EQUAL( alignRight( "T" ).size(), 20 );

            BOOST_CHECK( isPrintable( "Hello, World! ~" ) );
            BOOST_CHECK( isPrintable( "" ) );
            BOOST_CHECK( !isPrintable( "tab\t" ) );
            BOOST_CHECK( !isPrintable( string( 1, char(127) ) ) );
            BOOST_CHECK( !isPrintable( string( 1, char(0xC3) ) ) );

            BOOST_CHECK( nocaseLess( "abc", "ABD" ) );
            BOOST_CHECK( !nocaseLess( "ABC", "abc" ) );
            BOOST_CHECK( !nocaseLess( "abc", "ABC" ) );

            BOOST_CHECK_EQUAL( hexString( 255 ), "0xff" );
            BOOST_CHECK_EQUAL( hexString( 16, false ), "10" );

            BOOST_CHECK_EQUAL( cleanPath( "non/existing/../path" ), "non/path" );
            BOOST_CHECK_EQUAL( cleanPath( "file.fits", "/tmp/data/.." ), "/tmp/file.fits" );
            BOOST_CHECK_EQUAL( cleanPath( "/abs/./file.fits", "/tmp" ), "/abs/file.fits" );
            const char* home = getenv( "HOME" );
            if( home ) {
                BOOST_CHECK_EQUAL( cleanPath( "~/x/../y.fits" ), cleanPath( string( home ) + "/y.fits" ) );
            }

        }

        void add_string_tests( test_suite* ts ) {

            ts->add( BOOST_TEST_CASE_NAME( &stringTest, "String manipulations" ) );

        }

    }

}
