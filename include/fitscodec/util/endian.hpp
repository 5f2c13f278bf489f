#ifndef FITSCODEC_UTIL_ENDIAN_HPP
#define FITSCODEC_UTIL_ENDIAN_HPP

#include <cstdlib>
#include <utility>

#define FITSCODEC_LITTLE_ENDIAN 1234
#define FITSCODEC_BIG_ENDIAN    4321

// FITSCODEC_BYTE_ORDER is defined from cmake as one of the above values.
#ifndef FITSCODEC_BYTE_ORDER
#define FITSCODEC_BYTE_ORDER FITSCODEC_LITTLE_ENDIAN
#endif

namespace fitscodec {

    namespace util {

        /*!  @ingroup util
         *  @{
         */

        /*!  @file      endian.hpp
         *   @brief     byte-swapping
         */

        
        /*! @fn void swapEndian(T& x)
         *  @brief Reverse the byte-order of x
         *  @param x input
         */
        template <class T> void swapEndian(T& x) {

            size_t nBytes = sizeof(T);
            if(nBytes > 1) {
                size_t mid = nBytes >> 1;
                nBytes--;
                char* p = reinterpret_cast<char*>(&x);
                for(size_t j = 0; j < mid; ++j) {
                    std::swap(p[j], p[nBytes - j]);
                }
            }

        }

        /*! @fn void swapEndian(T* x, size_t n = 1)
         *  @brief Reverse the byte-order of x[n]
         *  @param x input
         *  @param n number of elements to iterate over.
         */
        template <class T> void swapEndian(T* x, size_t n = 1) {
            size_t nBytes = sizeof(T);
            if(nBytes > 1) {
                while(n--) {
                    swapEndian(*x++);
                }
            }
        }

        
        /*! @fn void bigEndian(T* x, size_t n = 1)
         *  @brief Convert x[n] between host byte-order and big-endian (the FITS byte-order).
         *  The conversion is its own inverse.
         */
        template <class T> void bigEndian(T* x, size_t n = 1) {
#if FITSCODEC_BYTE_ORDER == FITSCODEC_LITTLE_ENDIAN
            swapEndian( x, n );
#endif
        }


        /*! @} */

        
    } // namespace util

} // namespace fitscodec

#endif // FITSCODEC_UTIL_ENDIAN_HPP
