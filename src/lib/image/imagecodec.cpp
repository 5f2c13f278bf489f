#include "fitscodec/image/imagecodec.hpp"

#include "fitscodec/util/endian.hpp"

#include <cstring>

using namespace fitscodec::file;
using namespace fitscodec::image;
using namespace fitscodec::util;
using namespace std;

namespace {

    template <typename T>
    TypedImage readArray( BlockReader& reader, const vector<size_t>& dims ) {

        Array<T> arr( dims );
        size_t nBytes = arr.nElements()*sizeof(T);
        vector<char> buf( paddedSize( nBytes ) );
        reader.readBlocks( buf );
        if( nBytes ) {
            memcpy( arr.get(), buf.data(), nBytes );
            bigEndian( arr.get(), arr.nElements() );
        }
        return TypedImage( std::move(arr) );

    }

    struct EncodeVisitor : public boost::static_visitor<vector<char>> {
        template <typename T>
        vector<char> operator()( const Array<T>& arr ) const {
            size_t nBytes = arr.nElements()*sizeof(T);
            vector<char> buf( paddedSize( nBytes ), 0 );
            if( nBytes ) {
                memcpy( buf.data(), arr.get(), nBytes );
                bigEndian( reinterpret_cast<T*>( buf.data() ), arr.nElements() );
            }
            return buf;
        }
    };

}


TypedImage fitscodec::image::decodeImage( BlockReader& reader, Bitpix bitpix, const vector<size_t>& dims ) {

    switch( bitpix ) {
        case BITPIX_BYTE:   return readArray<uint8_t>( reader, dims );
        case BITPIX_SHORT:  return readArray<int16_t>( reader, dims );
        case BITPIX_INT:    return readArray<int32_t>( reader, dims );
        case BITPIX_LONG:   return readArray<int64_t>( reader, dims );
        case BITPIX_FLOAT:  return readArray<float>( reader, dims );
        case BITPIX_DOUBLE: return readArray<double>( reader, dims );
    }
    throw FormatError( "Unsupported BITPIX value: " + to_string( static_cast<int>(bitpix) ) );

}


void fitscodec::image::encodeImage( BlockWriter& writer, const TypedImage& img ) {

    vector<char> buf = boost::apply_visitor( EncodeVisitor(), img.variant() );
    writer.writeBlocks( buf );

}
