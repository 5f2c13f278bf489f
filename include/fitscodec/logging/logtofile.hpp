#ifndef FITSCODEC_LOGGING_LOGTOFILE_HPP
#define FITSCODEC_LOGGING_LOGTOFILE_HPP

#include "fitscodec/logging/logtostream.hpp"

#include <fstream>

namespace fitscodec {

    namespace logging {

        
        class LogToFile : public LogToStream {
            
        public:
            LogToFile( const std::string &filename, uint8_t m=LOG_MASK_ANY, bool replace=false, unsigned int flushPeriod=1);
            ~LogToFile() { flushBuffer(); fout.close(); }
            
        private:
            
            std::ofstream fout;

        };

    } // end namespace logging

} // end namespace fitscodec



#endif // FITSCODEC_LOGGING_LOGTOFILE_HPP
