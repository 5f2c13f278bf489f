#ifndef FITSCODEC_LOGGING_LOGGER_HPP
#define FITSCODEC_LOGGING_LOGGER_HPP

#include "fitscodec/logging/logitem.hpp"
#include "fitscodec/logging/logoutput.hpp"

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

namespace bpo = boost::program_options;


namespace fitscodec {

    namespace logging {
        
        /*! Collects log items and forwards them to any number of outputs (streams, files or other loggers).
         *
         *  Items are composed with the LLOG_xxx/LOG_xxx macros and published with the \c ende manipulator:
         *  @code
         *  LOG_DETAIL << "Read " << n << " rows" << ende;
         *  @endcode
         */
        class Logger : public LogOutput {
        public:

            Logger(void);
            explicit Logger( const bpo::variables_map& );
            ~Logger();
            
            void append( LogItem& );
            void flushBuffer( void ) override;
            void flushAll( void );

            void addStream( std::ostream&, uint8_t m=0, unsigned int flushPeriod=1 );
            void addFile( const std::string &filename, uint8_t m=0, bool replace=false, unsigned int flushPeriod=1 );
            void removeAllOutputs( void );
            size_t nOutputs( void );
            void setContext( const std::string& c ) { context = c; };
            
            LogItem& getItem( LogMask m=LOG_MASK_NORMAL ) {
                threadItem.setLogger( this );
                threadItem.entry.setMask(m);
                threadItem.context = context;
                return threadItem;
            }

            static int getDefaultLevel(void);
            static inline void setDefaultMask( uint8_t m ) { defaultLevelMask = m; }
            static inline uint8_t getDefaultMask(void) { return defaultLevelMask; }
            
            static std::pair<std::string, std::string> customParser( const std::string& s );
            static bpo::options_description getOptions( void );

        private:
            std::string context;
            
            typedef std::map<std::string, LogOutputPtr> OutputMap;
            OutputMap outputs;
            std::mutex outputMutex;
            
            static uint8_t defaultLevelMask;
            static thread_local LogItem threadItem;
        };

    }

}

#define LLOG_TRACE(mylog) mylog.getItem(fitscodec::logging::LOG_MASK_TRACE)
#define LLOG_DEBUG(mylog) mylog.getItem(fitscodec::logging::LOG_MASK_DEBUG)
#define LLOG_DETAIL(mylog) mylog.getItem(fitscodec::logging::LOG_MASK_DETAIL)
#define LLOG_NOTICE(mylog) mylog.getItem(fitscodec::logging::LOG_MASK_NOTICE)
#define LLOG(mylog) mylog.getItem()
#define LLOG_WARN(mylog) mylog.getItem(fitscodec::logging::LOG_MASK_WARNING)
#define LLOG_ERR(mylog) mylog.getItem(fitscodec::logging::LOG_MASK_ERROR)
#define LLOG_FATAL(mylog) mylog.getItem(fitscodec::logging::LOG_MASK_FATAL)

#define LOG_TRACE LLOG_TRACE(logger)
#define LOG_DEBUG LLOG_DEBUG(logger)
#define LOG_DETAIL LLOG_DETAIL(logger)
#define LOG_NOTICE LLOG_NOTICE(logger)
#define LOG  LLOG(logger)
#define LOG_WARN  LLOG_WARN(logger)
#define LOG_ERR  LLOG_ERR(logger)
#define LOG_FATAL  LLOG_FATAL(logger)




#endif //   FITSCODEC_LOGGING_LOGGER_HPP
