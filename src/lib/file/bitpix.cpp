#include "fitscodec/file/bitpix.hpp"

#include "fitscodec/file/exceptions.hpp"

using namespace fitscodec::file;
using namespace std;


Bitpix fitscodec::file::bitpixFromCode( int code ) {

    switch( code ) {
        case BITPIX_BYTE:   return BITPIX_BYTE;
        case BITPIX_SHORT:  return BITPIX_SHORT;
        case BITPIX_INT:    return BITPIX_INT;
        case BITPIX_LONG:   return BITPIX_LONG;
        case BITPIX_FLOAT:  return BITPIX_FLOAT;
        case BITPIX_DOUBLE: return BITPIX_DOUBLE;
        default: throw FormatError( "Unsupported BITPIX value: " + to_string(code) );
    }

}


size_t fitscodec::file::byteWidth( Bitpix bp ) {

    switch( bp ) {
        case BITPIX_BYTE:   return 1;
        case BITPIX_SHORT:  return 2;
        case BITPIX_INT:    return 4;
        case BITPIX_LONG:   return 8;
        case BITPIX_FLOAT:  return 4;
        case BITPIX_DOUBLE: return 8;
    }
    throw FormatError( "Unsupported BITPIX value: " + to_string( static_cast<int>(bp) ) );

}


string fitscodec::file::bitpixName( Bitpix bp ) {

    switch( bp ) {
        case BITPIX_BYTE:   return "uint8";
        case BITPIX_SHORT:  return "int16";
        case BITPIX_INT:    return "int32";
        case BITPIX_LONG:   return "int64";
        case BITPIX_FLOAT:  return "float32";
        case BITPIX_DOUBLE: return "float64";
    }
    return "BITPIX(" + to_string( static_cast<int>(bp) ) + ")";

}
