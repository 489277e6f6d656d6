//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  coloop/coroutine/error.hpp
//

//
//  IAPPA CM Revision # : $Revision$
//  IAPPA CM Tag        : $Name:  $
//  Last user to change : $Author$
//  Date of change      : $Date$
//  File Path           : $Source$
//  Source of funding   : IAPPA
//
//  CAUTION:  CONTROLLED SOURCE.  DO NOT MODIFY ANYTHING ABOVE THIS LINE.
//

#ifndef COLOOP_COROUTINE_ERROR_HPP
#define COLOOP_COROUTINE_ERROR_HPP

#include "coloop/coroutine/config.hpp"
#include <stdexcept>
#include <string>
#include <system_error>


/*
    Coloop Coroutine Library
*/
namespace Coloop    {
namespace Coroutine {


/*
    Usage Error

    Thrown when a caller violates an interface contract (e.g., waiting for
    a descriptor that already has a waiter, or running a Scheduler from one
    of its own tasks).
*/
class COLOOP_COROUTINE_DECL Usage_error : public std::logic_error {
public:
    // Construct
    explicit Usage_error(const std::string& what);
    explicit Usage_error(const char* what);
};


/*
    Invalid Argument Error
*/
class COLOOP_COROUTINE_DECL Invalid_argument_error : public Usage_error {
public:
    // Construct
    explicit Invalid_argument_error(const std::string& what);
    explicit Invalid_argument_error(const char* what);
};


/*
    Closed Channel Error

    Reported by every write to a closed channel, and by every read of a
    closed channel that has no buffered values.
*/
class COLOOP_COROUTINE_DECL Closed_channel_error : public std::runtime_error {
public:
    // Construct
    Closed_channel_error();
    explicit Closed_channel_error(const std::string& what);
};


/*
    Closed Resource Error
*/
class COLOOP_COROUTINE_DECL Closed_resource_error : public std::runtime_error {
public:
    // Construct
    Closed_resource_error();
    explicit Closed_resource_error(const std::string& what);
};


/*
    Timeout Error
*/
class COLOOP_COROUTINE_DECL Timeout_error : public std::runtime_error {
public:
    // Construct
    Timeout_error();
    explicit Timeout_error(const std::string& what);
};


/*
    Cancelled Error

    Delivered to a task at the suspension point at which it was cancelled.
*/
class COLOOP_COROUTINE_DECL Cancelled_error : public std::runtime_error {
public:
    // Construct
    Cancelled_error();
    explicit Cancelled_error(const std::string& what);
};


/*
    I/O Error

    An operating system call failed.  The error code carries the errno value
    in the generic category.
*/
class COLOOP_COROUTINE_DECL Io_error : public std::system_error {
public:
    // Construct
    Io_error(int errnum, const std::string& what);
    Io_error(std::error_code, const std::string& what);
};


/*
    Error Reporting
*/
[[noreturn]] COLOOP_COROUTINE_DECL void throw_io_error(int errnum, const char* what);
[[noreturn]] COLOOP_COROUTINE_DECL void throw_last_io_error(const char* what);


}   // Coroutine
}   // Coloop

#endif  // COLOOP_COROUTINE_ERROR_HPP

//  $CUSTOM_FOOTER$
