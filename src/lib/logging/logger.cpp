#include "fitscodec/logging/logger.hpp"

#include "fitscodec/logging/logtofile.hpp"
#include "fitscodec/logging/logtostream.hpp"
#include "fitscodec/util/stringutil.hpp"

#include <algorithm>
#include <iostream>

using namespace fitscodec::logging;
using namespace fitscodec::util;
using namespace std;

uint8_t Logger::defaultLevelMask = LOG_UPTO(LOG_LEVEL_NORMAL);
thread_local LogItem Logger::threadItem;

int Logger::getDefaultLevel( void ) {
    if( defaultLevelMask == 0 ) return 0;
    int cnt(1);
    uint8_t tmp = defaultLevelMask;
    while( (tmp>>=1) ) cnt++;
    return cnt;
}


pair<string, string> Logger::customParser( const string& s ) { // custom parser to handle multiple -q/-v flags (e.g. -vvvv)

    if( s.find( "-v" ) == 0 || s.find( "--verbose" ) == 0 ) { //
        int count = std::count( s.begin(), s.end(), 'v' );
        while( count-- ) defaultLevelMask = (defaultLevelMask<<1)+1;
    }
    else if( s.find( "-q" ) == 0 || s.find( "--quiet" ) == 0 ) { //
        int count = std::count( s.begin(), s.end(), 'q' );
        while( count-- ) defaultLevelMask >>= 1;
    }
    return make_pair( string(), string() );                 // no need to return anything, we handle the verbosity directly.
}


bpo::options_description Logger::getOptions( void ) {

    bpo::options_description logging( "Logging Options" );
    logging.add_options()
    ( "verbosity", bpo::value< int >(), "Specify verbosity level (0-8, 0 means no output)."
      " The environment variable FITSCODEC_VERBOSITY will be used as default if it exists." )
    ( "verbose,v", bpo::value<vector<string>>()->implicit_value( vector<string>( 1, "1" ), "" )
      ->composing(), "More output. (ignored if --verbosity is specified)" )
    ( "quiet,q", bpo::value<vector<string>>()->implicit_value( vector<string>( 1, "-1" ), "" )
      ->composing(), "Less output. (ignored if --verbosity is specified)" )

    ( "log-file,L", bpo::value< vector<string> >()->composing(), "Print output to file." )
    ( "log-stdout,d", "Write output from all channels to stdout."
      " --log-file can not be used together with this option." )
    ;

    return logging;
}



Logger::Logger( const bpo::variables_map& vm ) : LogOutput( defaultLevelMask, 1 ) {

    if( vm.count( "verbosity" ) > 0 ) {         // if --verbosity N is specified, use it.
        defaultLevelMask = LOG_UPTO(vm["verbosity"].as<int>());
    }
    
    mask = defaultLevelMask;
    
    if( vm.count( "log-stdout" ) ) {
        addStream( cout, mask );
    }
    else if( vm.count( "log-file" ) ) {
        for( auto & filename : vm["log-file"].as<vector<string>>() ) {
            addFile( filename, mask, false );
        }
    }

}



Logger::Logger(void) : LogOutput(defaultLevelMask,1) {

}


Logger::~Logger() {

    this->flushAll();
    
    // clear them now so that the flushBuffer call from the LogOutput destructor does not attempt to access deleted items.
    outputs.clear();

}


void Logger::append( LogItem &i ) {
    
    if( mask && !(i.entry.getMask() & mask) ) {
        return;
    }

    LogItemPtr tmpItem( new LogItem() );
    tmpItem->setLogger( this );
    tmpItem->entry = i.entry;
    tmpItem->context = i.context;
    
    addItem( tmpItem );

}


void Logger::flushBuffer( void ) {

    unique_lock<mutex> lock( queueMutex );
    vector<LogItemPtr> tmpQueue( itemQueue.begin(), itemQueue.end() );
    itemQueue.clear();
    itemCount = 0;
    lock.unlock();

    unique_lock<mutex> lock2( outputMutex );
    for( auto &it: outputs ) {
        it.second->addItems( tmpQueue );
    }
    
}


void Logger::flushAll( void ) {

    flushBuffer();

    unique_lock<mutex> lock( outputMutex );
    for( auto &it: outputs ) {
        it.second->flushBuffer();
    }

    
}


void Logger::addStream( ostream& strm, uint8_t m, unsigned int flushPeriod ) {
    
    if( m == 0 ) {
        m = getMask();
    }
    string name = hexString(&strm);
    unique_lock<mutex> lock( outputMutex );
    OutputMap::iterator it = outputs.find( name );
    if( it == outputs.end() ) {
        std::shared_ptr<LogOutput> output( new LogToStream( strm, m, flushPeriod) );
        output->setName( name );
        outputs.insert(make_pair(name,output));
    }
    
}


void Logger::addFile( const std::string &filename, uint8_t m, bool replace, unsigned int flushPeriod ) {
    
    if( m == 0 ) {
        m = getMask();
    }
    string name = cleanPath( filename );
    unique_lock<mutex> lock( outputMutex );
    OutputMap::iterator it = outputs.find( name );
    if( it == outputs.end() ) {
        std::shared_ptr<LogOutput> output( new LogToFile( name, m, replace, flushPeriod) );
        output->setName( name );
        outputs.insert(make_pair(name,output));

    }

}


void Logger::removeAllOutputs( void ) {

    unique_lock<mutex> lock( outputMutex );
    for( auto &op: outputs ) {
        op.second->flushBuffer();
    }
    outputs.clear();

}


size_t Logger::nOutputs( void ) {

    unique_lock<mutex> lock( outputMutex );
    return outputs.size();

}
