#include "fitscodec/file/blockio.hpp"

#include "fitscodec/file/exceptions.hpp"
#include "fitscodec/util/stringutil.hpp"

using namespace fitscodec::file;
using namespace fitscodec::util;
using namespace std;

namespace {

    void checkAligned( size_t nBytes, const string& what ) {
        if( nBytes % BLOCK_SIZE ) {
            throw DataIOException( what + ": " + to_string(nBytes) + " bytes is not a multiple of the FITS block size ("
                                   + to_string(BLOCK_SIZE) + ")" );
        }
    }

    ifstream* openForReading( const string& filename ) {
        unique_ptr<ifstream> ifs( new ifstream( cleanPath(filename), ifstream::binary ) );
        if( !ifs->good() ) {
            throw DataIOException( "Failed to open file for reading: " + filename );
        }
        return ifs.release();
    }

    ofstream* openForWriting( const string& filename ) {
        unique_ptr<ofstream> ofs( new ofstream( cleanPath(filename), ofstream::binary | ofstream::trunc ) );
        if( !ofs->good() ) {
            throw DataIOException( "Failed to open file for writing: " + filename );
        }
        return ofs.release();
    }

}


BlockReader::BlockReader( istream& is ) : strm(is), cursor_(0), name_("stream") {

}


BlockReader::BlockReader( const string& filename ) : file_( openForReading(filename) ), strm(*file_),
    cursor_(0), name_(filename) {

}


void BlockReader::readBlocks( char* buf, size_t nBytes ) {

    checkAligned( nBytes, "Read from " + name_ );
    if( !nBytes ) return;

    strm.read( buf, nBytes );
    size_t nRead = strm.gcount();
    if( nRead != nBytes ) {
        throw DataIOException( "Read failed: " + name_ + " ended after " + to_string(cursor_+nRead)
                               + " bytes, expected " + to_string(cursor_+nBytes) );
    }
    if( !strm.good() ) {
        throw DataIOException( "Read failed: " + name_ + " at offset " + to_string(cursor_) );
    }
    cursor_ += nBytes;

}


bool BlockReader::atEnd( void ) {

    if( !strm.good() ) return true;
    return ( strm.peek() == istream::traits_type::eof() );

}


BlockWriter::BlockWriter( ostream& os ) : strm(os), cursor_(0), name_("stream") {

}


BlockWriter::BlockWriter( const string& filename ) : file_( openForWriting(filename) ), strm(*file_),
    cursor_(0), name_(filename) {

}


void BlockWriter::writeBlocks( const char* buf, size_t nBytes ) {

    checkAligned( nBytes, "Write to " + name_ );
    if( !nBytes ) return;

    strm.write( buf, nBytes );
    if( !strm.good() ) {
        throw DataIOException( "Write failed: " + name_ + " at offset " + to_string(cursor_) );
    }
    cursor_ += nBytes;

}


void BlockWriter::flush( void ) {

    strm.flush();
    if( !strm.good() ) {
        throw DataIOException( "Flush failed: " + name_ );
    }

}
