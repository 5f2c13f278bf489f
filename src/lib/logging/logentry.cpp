#include "fitscodec/logging/logentry.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>

using namespace std;
using namespace fitscodec::logging;
using namespace boost::posix_time;


std::ostream &operator<<( std::ostream &os, const fitscodec::logging::LogEntry &le ) {
    
    os << (int)le.getMask() << '|' << to_iso_extended_string(le.getTime()) << '|' << le.getMessage();
    
    return os;
}
