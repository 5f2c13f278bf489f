#ifndef FITSCODEC_FILE_BLOCKIO_HPP
#define FITSCODEC_FILE_BLOCKIO_HPP

#include <fstream>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace fitscodec {

    namespace file {

        /*! @ingroup file
         *  @{
         */

        /*! FITS files are read and written in units of this many bytes. */
        const size_t BLOCK_SIZE = 2880;

        inline size_t blockCount( size_t nBytes ) { return (nBytes + BLOCK_SIZE - 1) / BLOCK_SIZE; }
        inline size_t paddedSize( size_t nBytes ) { return blockCount( nBytes ) * BLOCK_SIZE; }


        /*! Reads whole blocks from a stream, keeping track of how far it has read.
         *
         *  The reader either borrows a stream owned by the caller, or opens (and
         *  closes on destruction) a file of its own.
         */
        class BlockReader {

        public:
            explicit BlockReader( std::istream& );
            explicit BlockReader( const std::string& filename );

            /*! @brief Fill \c buf with the next \c nBytes bytes.
             *  @throws DataIOException if \c nBytes is not a multiple of BLOCK_SIZE,
             *          the stream fails, or fewer than \c nBytes bytes are available.
             */
            void readBlocks( char* buf, size_t nBytes );
            void readBlocks( std::vector<char>& buf ) { readBlocks( buf.data(), buf.size() ); }
            
            /*! @brief True when the stream has no further bytes (i.e. no more HDUs). */
            bool atEnd( void );

            size_t cursor( void ) const { return cursor_; }
            const std::string& name( void ) const { return name_; }

        private:
            std::unique_ptr<std::ifstream> file_;
            std::istream& strm;
            size_t cursor_;
            std::string name_;

        };


        /*! The write counterpart of BlockReader.
         */
        class BlockWriter {

        public:
            explicit BlockWriter( std::ostream& );
            explicit BlockWriter( const std::string& filename );

            /*! @brief Write \c nBytes bytes from \c buf.
             *  @throws DataIOException if \c nBytes is not a multiple of BLOCK_SIZE or the stream fails.
             */
            void writeBlocks( const char* buf, size_t nBytes );
            void writeBlocks( const std::vector<char>& buf ) { writeBlocks( buf.data(), buf.size() ); }
            
            void flush( void );

            size_t cursor( void ) const { return cursor_; }
            const std::string& name( void ) const { return name_; }

        private:
            std::unique_ptr<std::ofstream> file_;
            std::ostream& strm;
            size_t cursor_;
            std::string name_;

        };

        /*! @} */

    } // end namespace file

} // end namespace fitscodec

#endif // FITSCODEC_FILE_BLOCKIO_HPP
