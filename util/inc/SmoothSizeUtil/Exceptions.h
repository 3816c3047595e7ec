/** SmoothSize exceptions.

    All exceptions thrown by SmoothSize code derive from
    SmoothSize::Exception which is both a std::exception and a
    boost::exception.  Throw them with THROW() so that file and line
    information is attached, or more simply with raise<E>() which
    formats a message.
 */

#ifndef SMOOTHSIZEUTIL_EXCEPTIONS
#define SMOOTHSIZEUTIL_EXCEPTIONS

#include "SmoothSizeUtil/String.h"

#include <boost/exception/all.hpp>
#include <boost/throw_exception.hpp>

#include <exception>
#include <string>

#define THROW(e) BOOST_THROW_EXCEPTION(e)

namespace SmoothSize {

    /// Attach a human readable message to an exception.
    typedef boost::error_info<struct tag_errmsg, std::string> errmsg;

    /// Base of all SmoothSize exceptions.
    struct Exception : virtual public std::exception, virtual boost::exception {
        char const* what() const throw();
    };

    /// Something went wrong reading or writing a file or stream.
    struct IOError : virtual public Exception {};

    /// An argument or configuration value is not acceptable.
    struct ValueError : virtual public Exception {};

    /// A query falls outside of a bounded collection.
    struct IndexError : virtual public Exception {};

    /// Format message with String::format() and throw it as type E.
    template <class E, typename... Args>
    [[noreturn]] void raise(const std::string& form, Args... args)
    {
        THROW(E() << errmsg{String::format(form, args...)});
    }

    /// Return just the message attached to an exception, if any.
    std::string errmsg_of(const Exception& err);

}  // namespace SmoothSize

#endif
