#ifndef FITSCODEC_LOGGING_LOGTOSTREAM_HPP
#define FITSCODEC_LOGGING_LOGTOSTREAM_HPP

#include "fitscodec/logging/logoutput.hpp"

#include <ostream>


namespace fitscodec {

    namespace logging {

        
        class LogToStream : public LogOutput {


        public:
            LogToStream( std::ostream &os, uint8_t m=LOG_MASK_ANY, unsigned int flushPeriod=1);
            ~LogToStream();

            void flushBuffer( void ) override;

            void setColor( bool c ) { color = c; }
            void setLocalTime( bool lt ) { localtime = lt; }

        private:
            void writeFormatted( const LogItem& );

            std::ostream& out;
            bool color,localtime;

        };

    } // end namespace logging

} // end namespace fitscodec



#endif // FITSCODEC_LOGGING_LOGTOSTREAM_HPP
