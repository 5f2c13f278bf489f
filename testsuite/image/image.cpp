#include <boost/test/unit_test.hpp>

using namespace boost::unit_test;

namespace testsuite {

    namespace image {
        
        void add_typedimage_tests( test_suite* ts );    // defined in typedimage.cpp
        void add_codec_tests( test_suite* ts );         // defined in codec.cpp

        void add_tests( test_suite* ts ) {

            add_typedimage_tests( ts );
            add_codec_tests( ts );

        }

    }

}
