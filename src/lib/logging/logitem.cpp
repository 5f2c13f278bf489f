#include "fitscodec/logging/logitem.hpp"

#include "fitscodec/logging/logger.hpp"

using namespace fitscodec::logging;

void LogItem::endEntry(void) {
    entry.finalize();
    if( logger) {
        logger->append( *this );
    }
}
