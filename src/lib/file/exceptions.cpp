#include "fitscodec/file/exceptions.hpp"

#include <sstream>

using namespace fitscodec::file;
using namespace std;

namespace {

    string parseMessage( size_t row, size_t field, const string& text, const string& reason ) {
        ostringstream ss;
        ss << "Failed to parse field " << (field+1) << " of row " << row << ": \"" << text << "\"";
        if( !reason.empty() ) {
            ss << " (" << reason << ")";
        }
        return ss.str();
    }

}


ParseError::ParseError( size_t row, size_t field, const string& text, const string& reason )
    : FormatError( parseMessage( row, field, text, reason ) ), row_(row), field_(field), text_(text) {

}


TypeMismatch::TypeMismatch( Bitpix stored, Bitpix requested )
    : fitscodec::RecoverableException( "Image holds " + bitpixName(stored) + " data, requested as " + bitpixName(requested) ),
      stored_(stored), requested_(requested) {

}
