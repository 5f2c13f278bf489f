#include "fitscodec/exception.hpp"
#include "fitscodec/util/array.hpp"

#include <limits>

#include <boost/test/unit_test.hpp>

using namespace fitscodec::util;
using namespace fitscodec;

using namespace std;

using namespace boost::unit_test_framework;

namespace testsuite {

    namespace util {

        void arrayTest( void ) {

            Array<int> empty;
            BOOST_CHECK_EQUAL( empty.nDimensions(), 0 );
            BOOST_CHECK_EQUAL( empty.nElements(), 0 );

            Array<int> array( 3, 4 );
            BOOST_CHECK_EQUAL( array.nDimensions(), 2 );
            BOOST_CHECK_EQUAL( array.nElements(), 12 );
            BOOST_CHECK_EQUAL( array.dimSize( 0 ), 3 );
            BOOST_CHECK_EQUAL( array.dimSize( 1 ), 4 );
            BOOST_CHECK_EQUAL( array.dimSize( 2 ), 0 );

            int cnt( 0 );
            for( auto& a: array ) a = cnt++;

            // column-major, the first index is the fastest
            BOOST_CHECK_EQUAL( array( 1, 0 ), 1 );
            BOOST_CHECK_EQUAL( array( 0, 1 ), 3 );
            BOOST_CHECK_EQUAL( array( 2, 3 ), 11 );
            BOOST_CHECK_EQUAL( array( vector<size_t>( { 2, 1 } ) ), 5 );
            BOOST_CHECK_EQUAL( array.offset( { 1, 2 } ), 7 );
            BOOST_CHECK_EQUAL( array.get()[7], 7 );

            BOOST_CHECK_THROW( array( 3, 0 ), IndexOutOfBounds );
            BOOST_CHECK_THROW( array( 0, 4 ), IndexOutOfBounds );
            BOOST_CHECK_THROW( array( 1 ), BadArgument );
            BOOST_CHECK_THROW( array( 1, 1, 1 ), BadArgument );

            const Array<int>& carray = array;
            BOOST_CHECK_EQUAL( carray( 2, 2 ), 8 );

            Array<int> copy( array );
            BOOST_CHECK( copy == array );
            copy( 0, 0 ) = -1;
            BOOST_CHECK( copy != array );                    // copies do not share data
            BOOST_CHECK_EQUAL( array( 0, 0 ), 0 );

            Array<float> other( 3, 4 );
            BOOST_CHECK( array.sameSizes( other ) );
            other.resize( { 4, 3 } );
            BOOST_CHECK( !array.sameSizes( other ) );
            BOOST_CHECK_EQUAL( other.nElements(), 12 );

            // element counts that do not fit are refused, a zero dimension is always empty
            const size_t huge = numeric_limits<size_t>::max() / 4;
            BOOST_CHECK_THROW( Array<double>( huge, 8 ), BadArgument );
            BOOST_CHECK_THROW( other.resize( { 3, huge } ), BadArgument );
            Array<double> none( huge, 0 );
            BOOST_CHECK_EQUAL( none.nElements(), 0 );

            copy.zero();
            BOOST_CHECK_EQUAL( copy( 2, 3 ), 0 );

            Array<double> cube( vector<size_t>( { 2, 3, 4 } ) );
            BOOST_CHECK_EQUAL( cube.nElements(), 24 );
            BOOST_CHECK_EQUAL( cube.offset( { 1, 2, 3 } ), 1 + 2*2 + 3*6 );

        }

        void add_array_tests( test_suite* ts ) {

            ts->add( BOOST_TEST_CASE_NAME( &arrayTest, "Array" ) );

        }

    }

}
