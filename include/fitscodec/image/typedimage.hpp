#ifndef FITSCODEC_IMAGE_TYPEDIMAGE_HPP
#define FITSCODEC_IMAGE_TYPEDIMAGE_HPP

#include "fitscodec/file/bitpix.hpp"
#include "fitscodec/file/exceptions.hpp"
#include "fitscodec/util/array.hpp"

#include <cstdint>
#include <ostream>
#include <vector>

#include <boost/variant.hpp>

namespace fitscodec {

    namespace image {

        /*! @ingroup image
         *  @{
         */

        /*! An image array holding exactly one of the FITS element types.
         *
         *  The element type is fixed when the image is constructed and is never converted:
         *  asking for the data as another type raises TypeMismatch.
         */
        class TypedImage {

        public:
            typedef boost::variant< util::Array<uint8_t>,
                                    util::Array<int16_t>,
                                    util::Array<int32_t>,
                                    util::Array<int64_t>,
                                    util::Array<float>,
                                    util::Array<double> > variant_t;

            TypedImage( void ) {}
            template <typename T>
            TypedImage( const util::Array<T>& a ) : data_( a ) {}
            template <typename T>
            TypedImage( util::Array<T>&& a ) : data_( std::move(a) ) {}

            file::Bitpix bitpix( void ) const;
            const std::vector<size_t>& dimensions( void ) const;
            size_t nElements( void ) const;

            /*! @brief Size in bytes of the data, not rounded to the FITS block size. */
            size_t blockLength( void ) const { return nElements() * file::byteWidth( bitpix() ); }

            /*! @brief Read-only access to the stored array.
             *  @throws file::TypeMismatch if the image does not hold elements of type T.
             */
            template <typename T>
            const util::Array<T>& get( void ) const {
                const util::Array<T>* a = boost::get< util::Array<T> >( &data_ );
                if( !a ) {
                    throw file::TypeMismatch( bitpix(), file::getBitpix<T>() );
                }
                return *a;
            }

            template <typename T>
            bool holds( void ) const { return boost::get< util::Array<T> >( &data_ ) != nullptr; }

            const variant_t& variant( void ) const { return data_; }

            template <typename T>
            friend util::Array<T> takeArray( TypedImage&& img );

        private:
            variant_t data_;

        };


        /*! @brief Consume the image and return its array.
         *  @details The image is emptied whether or not the requested type matches.
         *  @throws file::TypeMismatch if the image does not hold elements of type T.
         */
        template <typename T>
        util::Array<T> takeArray( TypedImage&& img ) {
            TypedImage tmp( std::move(img) );
            img.data_ = util::Array<uint8_t>();
            util::Array<T>* a = boost::get< util::Array<T> >( &tmp.data_ );
            if( !a ) {
                throw file::TypeMismatch( tmp.bitpix(), file::getBitpix<T>() );
            }
            return std::move( *a );
        }

        std::ostream& operator<<( std::ostream&, const TypedImage& );

        /*! @} */

    }   // image

}   // fitscodec


#endif  // FITSCODEC_IMAGE_TYPEDIMAGE_HPP
