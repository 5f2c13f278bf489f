#include <boost/test/unit_test.hpp>

#include "fitscodec/util/endian.hpp"

using namespace fitscodec::util;

using namespace std;

using namespace boost::unit_test_framework;

namespace testsuite {

    namespace util {

        void endianTest( void ) {

            uint32_t u32( 0x01020304 );
            swapEndian( u32 );
            BOOST_CHECK_EQUAL( u32, 0x04030201 );

            uint8_t u8( 0xAB );
            swapEndian( u8 );
            BOOST_CHECK_EQUAL( u8, 0xAB );

            int16_t s16[] = { 0x0102, -2 };
            swapEndian( s16, 2 );
            BOOST_CHECK_EQUAL( s16[0], 0x0201 );
            BOOST_CHECK_EQUAL( s16[1], int16_t(0xFEFF) );

            double d( -1234.5678 );
            double d2( d );
            swapEndian( d2 );
            BOOST_CHECK( d2 != d );
            swapEndian( d2 );
            BOOST_CHECK_EQUAL( d2, d );

            // bigEndian gives the on-disk byte order, whatever the host order is
            int32_t v( 0x0A0B0C0D );
            bigEndian( &v );
            const uint8_t* p = reinterpret_cast<const uint8_t*>( &v );
            BOOST_CHECK_EQUAL( p[0], 0x0A );
            BOOST_CHECK_EQUAL( p[1], 0x0B );
            BOOST_CHECK_EQUAL( p[2], 0x0C );
            BOOST_CHECK_EQUAL( p[3], 0x0D );

        }

        void add_array_tests( test_suite* ts );         // defined in array.cpp
        void add_settings_tests( test_suite* ts );      // defined in settings.cpp
        void add_string_tests( test_suite* ts );        // defined in string.cpp

        void add_tests( test_suite* ts ) {

            ts->add( BOOST_TEST_CASE_NAME( &endianTest, "Endian" ) );

            add_array_tests( ts );
            add_settings_tests( ts );
            add_string_tests( ts );

        }

    }

}
