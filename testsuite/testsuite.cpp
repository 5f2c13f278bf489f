#include <boost/test/included/unit_test.hpp>
using namespace boost::unit_test;


namespace testsuite  {
    namespace file   { void add_tests( test_suite* ts ); }
    namespace image  { void add_tests( test_suite* ts ); }
    namespace table  { void add_tests( test_suite* ts ); }
    namespace util   { void add_tests( test_suite* ts ); }
}


test_suite* init_unit_test_suite( int , char* [] ) {

    framework::master_test_suite().p_name.value = "Fitscodec Testsuite";

    test_suite* file_tests = BOOST_TEST_SUITE( "File" );
    testsuite::file::add_tests( file_tests );
    framework::master_test_suite().add( file_tests );

    test_suite* image_tests = BOOST_TEST_SUITE( "Image" );
    testsuite::image::add_tests( image_tests );
    framework::master_test_suite().add( image_tests );

    test_suite* table_tests = BOOST_TEST_SUITE( "Table" );
    testsuite::table::add_tests( table_tests );
    framework::master_test_suite().add( table_tests );

    test_suite* util_tests = BOOST_TEST_SUITE( "Util" );
    testsuite::util::add_tests( util_tests );
    framework::master_test_suite().add( util_tests );


    return 0;
}
