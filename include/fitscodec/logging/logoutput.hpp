#ifndef FITSCODEC_LOGGING_LOGOUTPUT_HPP
#define FITSCODEC_LOGGING_LOGOUTPUT_HPP

#include "fitscodec/logging/logitem.hpp"

#include <atomic>
#include <deque>
#include <mutex>
#include <vector>


namespace fitscodec {

    namespace logging {


#ifdef LOG_UPTO
#undef LOG_UPTO
#endif
#define LOG_UPTO(lvl)   ((1<<lvl)-1)  // all levels up to lvl


        class LogOutput {
            
            unsigned int flushPeriod;
            
        protected:

            uint8_t mask;
            std::mutex queueMutex;
            std::deque<LogItemPtr> itemQueue;
            std::atomic<unsigned int> itemCount;
            
            std::string name_;

            virtual void flushBuffer( void ) {};
            
            LogOutput( uint8_t m=LOG_MASK_ANY, unsigned int flushPeriod=1 );

        public:
            virtual ~LogOutput();

            
            inline void setName( const std::string& n ) { name_ = n; }
            inline std::string name(void) const { return name_; }
            
            inline void setLevel( uint8_t l ) { mask = LOG_UPTO(l); }
            inline void setMask( uint8_t m ) { mask = m; }
            inline uint8_t getMask(void) const { return mask; }

            void addItem( LogItemPtr );
            void addItems( const std::vector<LogItemPtr>& );

            friend class Logger;

        };
        typedef std::shared_ptr<LogOutput> LogOutputPtr;




    } // end namespace logging

} // end namespace fitscodec



#endif // FITSCODEC_LOGGING_LOGOUTPUT_HPP
