#ifndef FITSCODEC_EXCEPTION_HPP
#define FITSCODEC_EXCEPTION_HPP

#include <exception>
#include <sstream>
#include <string>

namespace fitscodec {


    /*!  @file      exception.hpp
     *   @details   Any specialized exceptions should be derived from these ones rather than
     *              the std exceptions directly, so that error handling/reporting can be done
     *              on the library level.
     *   @name      Exceptions
     */

    /*!  @class     Exception
     *   @brief     Base class for all exceptions.
     */
    class Exception : public std::exception {
    public:
        Exception( void ) : message( "Exception" ) {}
        Exception( const std::string &message ) : message( message ) {}
        virtual ~Exception( void ) throw() {}

        virtual const char *what( void ) const throw() {
            return message.c_str();
        }

    private:
        std::string message;
    };


    /*!  @class     RecoverableException
     *   @brief     Exception that the caller is expected to handle locally, without aborting the surrounding operation.
     */
    class RecoverableException : public Exception {
    public:
        RecoverableException( void ) : Exception( "RecoverableException" ) {}
        RecoverableException( const std::string &message ) : Exception( message ) {}
        virtual ~RecoverableException( void ) throw() {}
    };


    /*!  @class     UnrecoverableException
     *   @brief     Exception that will rise again if the failed operation is retried.
     */
    class UnrecoverableException : public Exception {
    public:
        UnrecoverableException( void ) : Exception( "UnrecoverableException" ) {}
        UnrecoverableException( const std::string &message ) : Exception( message ) {}
        virtual ~UnrecoverableException( void ) throw() {}
    };


    /*!  @class     BadArgument
     *   @brief     Exception that indicates that something has been invoked with
     *              bad arguments.
     */
    class BadArgument : public UnrecoverableException {
    public:
        BadArgument( void ) : UnrecoverableException( "BadArgument" ) {}
        BadArgument( const std::string &message ) : UnrecoverableException( message ) {}

        virtual ~BadArgument( void ) throw() {}
    };


    /*!  @class     IndexOutOfBounds
     *   @brief     Exception that indicates that an index argument was out of bounds.
     */
    class IndexOutOfBounds : public BadArgument {
    public:
        IndexOutOfBounds( size_t index, size_t maxAllowed )
            : BadArgument( makeMessage( index, maxAllowed ) ), index( index ), maxAllowed( maxAllowed ) {}

        virtual ~IndexOutOfBounds( void ) throw() {}

        size_t getIndex( void ) const throw() {
            return index;
        }
        size_t getMaxAllowed( void ) const throw() {
            return maxAllowed;
        }

    private:
        static std::string makeMessage( size_t index, size_t maxAllowed ) {
            std::ostringstream ss;
            ss << "Index out of bounds (" << index << " > " << maxAllowed << ")";
            return ss.str();
        }
        size_t index;
        size_t maxAllowed;
    };


}

#endif // FITSCODEC_EXCEPTION_HPP
