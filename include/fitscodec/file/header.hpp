#ifndef FITSCODEC_FILE_HEADER_HPP
#define FITSCODEC_FILE_HEADER_HPP

#include "fitscodec/file/blockio.hpp"

#include <string>
#include <vector>

namespace fitscodec {

    namespace file {

        /*! @ingroup file
         *  @{
         */

        /*! The header of one HDU: a sequence of 80-character cards (without the END card).
         *
         *  The static members create and split single cards, the instance members look up
         *  keywords and read/write the header as whole blocks.
         */
        struct Header {
            
            static const size_t CARD_SIZE = 80;

            std::vector<std::string> cards;

            template <typename T>
            static std::string makeValue( const T& t, bool quote=true );
            static std::string makeValue( const char* s, bool quote=true );
            template <typename T>
            static T getValue( const std::string& v );

            /*! @brief Return an 8-character keyword, upper-case and padded with spaces.
             *  @throws std::domain_error if the key contains characters not allowed in a keyword.
             */
            static std::string makeKey( std::string key );

            template <typename T>
            static std::string makeCard( const std::string& key, const T& value, const std::string& comment="" );
            static std::string makeCard( const std::string& key, const char* value, const std::string& comment="" );
            /*! Card without a value field, e.g. COMMENT or HISTORY. */
            static std::string makeCommentCard( const std::string& key, const std::string& text="" );

            static void splitCard( const std::string& card, std::string& key, std::string& value, std::string& comment );

            std::string getCard( std::string key ) const;
            bool has( const std::string& key ) const { return !getCard( key ).empty(); }

            /*! @brief Value of a keyword.
             *  @throws FormatError if the keyword is missing or its value does not convert to T.
             */
            template <typename T>
            T get( const std::string& key ) const;
            template <typename T>
            T get( const std::string& key, const T& defaultValue ) const;

            /*! Append a card, unless a card with the same (single-valued) keyword exists. */
            void add( const std::string& card );
            /*! Replace the card with the same keyword, or append it. @returns true if appended. */
            bool emplace( const std::string& card );
            void remove( const std::string& key );

            /*! @brief Read cards, one block at a time, until the END card.
             *  @throws FormatError if a card contains non-ASCII characters.
             *  @throws DataIOException if the stream ends before END.
             */
            static Header read( BlockReader& reader );

            /*! @brief Write the cards, an END card and blank cards up to the end of the block. */
            void write( BlockWriter& writer ) const;

        };

        /*! @} */

    } // end namespace file

} // end namespace fitscodec

#endif // FITSCODEC_FILE_HEADER_HPP
