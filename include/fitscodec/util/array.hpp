#ifndef FITSCODEC_UTIL_ARRAY_HPP
#define FITSCODEC_UTIL_ARRAY_HPP

#include "fitscodec/exception.hpp"

#include <algorithm>
#include <cstddef>
#include <limits>
#include <vector>

namespace fitscodec {

    namespace util {

        /*! @defgroup util Util
         *  @{
         */

        /*! @brief An owned data-block of arbitrary dimensions
         *  @details Elements are stored in column-major order, i.e. the first index varies fastest.
         *           This is the storage order of FITS data arrays, so a FITS array maps onto an
         *           Array without transposing, with dimSize(0) == NAXIS1.
         */
        template <class T = double>
        class Array {

        public:

            typedef size_t size_type;
            typedef T value_type;
            typedef T& reference;
            typedef const T& const_reference;
            typedef typename std::vector<T>::iterator iterator;
            typedef typename std::vector<T>::const_iterator const_iterator;

            Array( void ) {}
            explicit Array( const std::vector<size_t>& sizes ) { resize( sizes ); }
            template <typename ...S> explicit Array( size_t s0, S ...sizes ) { resize( s0, sizes... ); }

            void resize( const std::vector<size_t>& sizes ) {
                size_t n = 0;
                if( !sizes.empty() && (std::find( sizes.begin(), sizes.end(), 0 ) == sizes.end()) ) {
                    n = 1;
                    for( auto& s: sizes ) {
                        if( n > std::numeric_limits<size_t>::max() / sizeof(T) / s ) {
                            throw BadArgument( "Array: the dimensions are too large." );
                        }
                        n *= s;
                    }
                }
                dimSizes = sizes;
                data_.assign( n, T() );
            }
            template <typename ...S> void resize( S ...sizes ) { resize( {static_cast<size_t>( sizes )...} ); }

            size_t nDimensions( void ) const { return dimSizes.size(); }
            size_t nElements( void ) const { return data_.size(); }
            const std::vector<size_t>& dimensions( void ) const { return dimSizes; }
            size_t dimSize( size_t i = 0 ) const {
                if( i < dimSizes.size() ) {
                    return dimSizes[i];
                }
                return 0;
            }

            /*! Linear offset of an element, the first index varies fastest. */
            size_t offset( const std::vector<size_t>& indices ) const {
                if( indices.size() != dimSizes.size() ) {
                    throw BadArgument( "Array: " + std::to_string(indices.size()) + " indices given for a "
                                       + std::to_string(dimSizes.size()) + "-dimensional array" );
                }
                size_t off(0), stride(1);
                for( size_t i = 0; i < indices.size(); ++i ) {
                    if( indices[i] >= dimSizes[i] ) {
                        throw IndexOutOfBounds( indices[i], dimSizes[i]-1 );
                    }
                    off += indices[i]*stride;
                    stride *= dimSizes[i];
                }
                return off;
            }

            T& operator()( const std::vector<size_t>& indices ) { return data_[offset( indices )]; }
            const T& operator()( const std::vector<size_t>& indices ) const { return data_[offset( indices )]; }
            template <typename ...S> T& operator()( S ...s ) { return data_[offset( {static_cast<size_t>( s )...} )]; }
            template <typename ...S> const T& operator()( S ...s ) const { return data_[offset( {static_cast<size_t>( s )...} )]; }

            T* get( void ) { return data_.data(); }
            const T* get( void ) const { return data_.data(); }

            iterator begin( void ) { return data_.begin(); }
            iterator end( void ) { return data_.end(); }
            const_iterator begin( void ) const { return data_.begin(); }
            const_iterator end( void ) const { return data_.end(); }

            void zero( void ) { std::fill( data_.begin(), data_.end(), T() ); }

            template <typename U>
            bool sameSizes( const Array<U>& rhs ) const { return dimSizes == rhs.dimensions(); }

            bool operator==( const Array<T>& rhs ) const {
                return ( dimSizes == rhs.dimSizes ) && ( data_ == rhs.data_ );
            }
            bool operator!=( const Array<T>& rhs ) const { return !( *this == rhs ); }

        private:
            std::vector<size_t> dimSizes;
            std::vector<T> data_;

        };

        /*! @} */

    }   // util

}   // fitscodec


#endif  // FITSCODEC_UTIL_ARRAY_HPP
