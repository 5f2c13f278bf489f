#ifndef FITSCODEC_FILE_EXCEPTIONS_HPP
#define FITSCODEC_FILE_EXCEPTIONS_HPP

#include "fitscodec/exception.hpp"
#include "fitscodec/file/bitpix.hpp"

namespace fitscodec {

    namespace file {

        /*! Stream failure, short read or a request that is not a whole number of blocks.
         */
        class DataIOException : public fitscodec::UnrecoverableException {
        public:
            DataIOException ( const std::string &msg ) : fitscodec::UnrecoverableException ( msg ) {}
            DataIOException ( const char* message = "DataIOException" ) : fitscodec::UnrecoverableException ( message ) {}
            virtual ~DataIOException ( void ) throw () {}
        };


        /*! The bytes or keywords do not describe valid FITS content. Aborts the current HDU.
         */
        class FormatError : public fitscodec::UnrecoverableException {
        public:
            FormatError ( const std::string &msg ) : fitscodec::UnrecoverableException ( msg ) {}
            FormatError ( const char* message = "FormatError" ) : fitscodec::UnrecoverableException ( message ) {}
            virtual ~FormatError ( void ) throw () {}
        };


        /*! An ASCII-table field format code could not be parsed. Raised before any row is read.
         */
        class SetupError : public FormatError {
        public:
            explicit SetupError ( const std::string& code )
                : FormatError ( "Invalid table field format code: \"" + code + "\"" ), code_( code ) {}
            virtual ~SetupError ( void ) throw () {}
            const std::string& code( void ) const { return code_; }
        private:
            std::string code_;
        };


        /*! The text of an ASCII-table field could not be converted to the type of its column.
         *  row() and field() are 0-based, the message numbers fields from 1 like TFORMn.
         */
        class ParseError : public FormatError {
        public:
            ParseError ( size_t row, size_t field, const std::string& text, const std::string& reason="" );
            virtual ~ParseError ( void ) throw () {}
            size_t row( void ) const { return row_; }
            size_t field( void ) const { return field_; }
            const std::string& text( void ) const { return text_; }
        private:
            size_t row_;
            size_t field_;
            std::string text_;
        };


        /*! Image data was requested as another element type than the one stored.
         *  This is routine: callers are expected to catch it and branch on it.
         */
        class TypeMismatch : public fitscodec::RecoverableException {
        public:
            TypeMismatch ( Bitpix stored, Bitpix requested );
            virtual ~TypeMismatch ( void ) throw () {}
            Bitpix stored( void ) const { return stored_; }
            Bitpix requested( void ) const { return requested_; }
        private:
            Bitpix stored_;
            Bitpix requested_;
        };

    }

}

#endif // FITSCODEC_FILE_EXCEPTIONS_HPP
