#include "fitscodec/image/typedimage.hpp"

using namespace fitscodec::file;
using namespace fitscodec::image;
using namespace fitscodec::util;
using namespace std;

namespace {

    struct BitpixVisitor : public boost::static_visitor<Bitpix> {
        template <typename T>
        Bitpix operator()( const Array<T>& ) const { return getBitpix<T>(); }
    };

    struct DimensionsVisitor : public boost::static_visitor<const vector<size_t>&> {
        template <typename T>
        const vector<size_t>& operator()( const Array<T>& a ) const { return a.dimensions(); }
    };

    struct ElementsVisitor : public boost::static_visitor<size_t> {
        template <typename T>
        size_t operator()( const Array<T>& a ) const { return a.nElements(); }
    };

}


Bitpix TypedImage::bitpix( void ) const {
    return boost::apply_visitor( BitpixVisitor(), data_ );
}


const vector<size_t>& TypedImage::dimensions( void ) const {
    return boost::apply_visitor( DimensionsVisitor(), data_ );
}


size_t TypedImage::nElements( void ) const {
    return boost::apply_visitor( ElementsVisitor(), data_ );
}


ostream& fitscodec::image::operator<<( ostream& os, const TypedImage& img ) {
    
    os << "TypedImage(" << bitpixName( img.bitpix() ) << ", ";
    const vector<size_t>& dims = img.dimensions();
    if( dims.empty() ) {
        os << "empty";
    }
    for( size_t i = 0; i < dims.size(); ++i ) {
        if( i ) os << "x";
        os << dims[i];
    }
    os << ")";
    return os;

}
