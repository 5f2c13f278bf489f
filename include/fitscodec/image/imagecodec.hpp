#ifndef FITSCODEC_IMAGE_IMAGECODEC_HPP
#define FITSCODEC_IMAGE_IMAGECODEC_HPP

#include "fitscodec/file/bitpix.hpp"
#include "fitscodec/file/blockio.hpp"
#include "fitscodec/image/typedimage.hpp"

#include <vector>

namespace fitscodec {

    namespace image {

        /*! @ingroup image
         *  @{
         */

        /*! @fn TypedImage decodeImage( file::BlockReader& reader, file::Bitpix bitpix, const std::vector<size_t>& dims )
         *  @brief Read a big-endian image payload, including its block padding.
         *  @param dims Axis lengths in header order (NAXIS1 first).
         */
        TypedImage decodeImage( file::BlockReader& reader, file::Bitpix bitpix, const std::vector<size_t>& dims );

        /*! @fn void encodeImage( file::BlockWriter& writer, const TypedImage& img )
         *  @brief Write the image as big-endian data, zero-padded to a whole number of blocks.
         */
        void encodeImage( file::BlockWriter& writer, const TypedImage& img );

        /*! @} */

    }   // image

}   // fitscodec


#endif  // FITSCODEC_IMAGE_IMAGECODEC_HPP
