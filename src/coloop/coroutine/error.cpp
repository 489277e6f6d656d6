//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  src/coloop/coroutine/error.cpp
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

#include "coloop/coroutine/error.hpp"
#include <cerrno>


/*
    Coloop Coroutine Library
*/
namespace Coloop    {
namespace Coroutine {


/*
    Usage Error
*/
Usage_error::Usage_error(const std::string& what)
    : std::logic_error{what}
{
}


Usage_error::Usage_error(const char* what)
    : std::logic_error{what}
{
}


/*
    Invalid Argument Error
*/
Invalid_argument_error::Invalid_argument_error(const std::string& what)
    : Usage_error{what}
{
}


Invalid_argument_error::Invalid_argument_error(const char* what)
    : Usage_error{what}
{
}


/*
    Closed Channel Error
*/
Closed_channel_error::Closed_channel_error()
    : std::runtime_error{"channel is closed"}
{
}


Closed_channel_error::Closed_channel_error(const std::string& what)
    : std::runtime_error{what}
{
}


/*
    Closed Resource Error
*/
Closed_resource_error::Closed_resource_error()
    : std::runtime_error{"resource is closed"}
{
}


Closed_resource_error::Closed_resource_error(const std::string& what)
    : std::runtime_error{what}
{
}


/*
    Timeout Error
*/
Timeout_error::Timeout_error()
    : std::runtime_error{"operation timed out"}
{
}


Timeout_error::Timeout_error(const std::string& what)
    : std::runtime_error{what}
{
}


/*
    Cancelled Error
*/
Cancelled_error::Cancelled_error()
    : std::runtime_error{"task cancelled"}
{
}


Cancelled_error::Cancelled_error(const std::string& what)
    : std::runtime_error{what}
{
}


/*
    I/O Error
*/
Io_error::Io_error(int errnum, const std::string& what)
    : std::system_error{errnum, std::generic_category(), what}
{
}


Io_error::Io_error(std::error_code ec, const std::string& what)
    : std::system_error{ec, what}
{
}


/*
    Error Reporting
*/
void
throw_io_error(int errnum, const char* what)
{
    throw Io_error(errnum, what);
}


void
throw_last_io_error(const char* what)
{
    throw_io_error(errno, what);
}


}   // Coroutine
}   // Coloop

//  $CUSTOM_FOOTER$
