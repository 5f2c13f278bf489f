#ifndef FITSCODEC_UTIL_STRINGUTIL_HPP
#define FITSCODEC_UTIL_STRINGUTIL_HPP

#include <cstdint>
#include <sstream>
#include <string>

namespace fitscodec {

    namespace util {


        /*!  @ingroup util
         *  @{
         */


        /*!  @file      stringutil.hpp
         *   @brief     Collection of functions for string-manipulation
         */


        /*! @fn bool isPrintable( const std::string &s )
         *  @brief True if every character is printable ASCII (32-126).
         */
        bool isPrintable( const std::string &s );
        bool nocaseLess( const std::string& lhs, const std::string& rhs );

        /*! @fn std::string alignLeft( const std::string& s, size_t n=20, unsigned char c=' ' )
         *  @brief Append char 'c' to the right of s, and form a block of width n
         *  @param s input string
         *  @param n block width
         *  @param c fill-character
         */
        std::string alignLeft( const std::string& s, size_t n = 20, unsigned char c = ' ' );

        /*! @fn std::string alignRight( const std::string& s, size_t n=20, unsigned char c=' ' )
        *  @brief Append char 'c' to the left of s, and form a block of width n
        *  @param s input string
        *  @param n block width
        *  @param c fill-character
        */
        std::string alignRight( const std::string& s, size_t n = 20, unsigned char c = ' ' );

        /*! @fn std::string cleanPath( std::string path, std::string base = "" )
         *  @brief Expand a leading "~/" and normalize the path, relative to \c base if given.
         */
        std::string cleanPath( std::string path, std::string base = "" );


        template <typename T>
        std::string hexString( const T& v, bool prefix = true ) {

            std::ostringstream oss;
            if( prefix ) {
                oss << "0x";
            }
            oss << ( std::hex ) << ( std::noshowbase ) << ( uint64_t )v;
            return oss.str();

        }
        template <typename T>
        std::string hexString( const T* v, bool prefix = true ) {
            return hexString( reinterpret_cast<uintptr_t>(v), prefix );
        }


        /*! @} */


    }

}

#endif // FITSCODEC_UTIL_STRINGUTIL_HPP
