//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  test/unit/error.cpp
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

// Test that header file is self-contained.
#include "coloop/coroutine/error.hpp"

#include "boost/core/lightweight_test.hpp"
#include <cerrno>
#include <string>


namespace Coloop    {
namespace Coroutine {


struct error_test {

    //--------------------------------------------
    // Hierarchy
    //--------------------------------------------

    void
    testUsageErrors()
    {
        BOOST_TEST_THROWS(throw Usage_error("misuse"), std::logic_error);
        BOOST_TEST_THROWS(throw Invalid_argument_error("bad"), Usage_error);
        BOOST_TEST_EQ(std::string(Usage_error("misuse").what()), "misuse");
    }

    void
    testRuntimeErrors()
    {
        BOOST_TEST_THROWS(throw Closed_channel_error(), std::runtime_error);
        BOOST_TEST_THROWS(throw Closed_resource_error(), std::runtime_error);
        BOOST_TEST_THROWS(throw Timeout_error(), std::runtime_error);
        BOOST_TEST_THROWS(throw Cancelled_error(), std::runtime_error);
        BOOST_TEST(std::string(Closed_channel_error().what()).size() > 0);
        BOOST_TEST(std::string(Cancelled_error().what()).size() > 0);
    }

    //--------------------------------------------
    // I/O errors
    //--------------------------------------------

    void
    testIoError()
    {
        try {
            throw_io_error(ESPIPE, "seek");
            BOOST_TEST(false);
        } catch (const Io_error& e) {
            BOOST_TEST_EQ(e.code().value(), ESPIPE);
            BOOST_TEST(e.code().category() == std::generic_category());
            BOOST_TEST(std::string(e.what()).find("seek") != std::string::npos);
        }
    }

    void
    testLastIoError()
    {
        errno = EBADF;
        try {
            throw_last_io_error("read");
            BOOST_TEST(false);
        } catch (const std::system_error& e) {
            BOOST_TEST_EQ(e.code().value(), EBADF);
        }
    }

    void
    run()
    {
        testUsageErrors();
        testRuntimeErrors();
        testIoError();
        testLastIoError();
    }
};


}   // Coroutine
}   // Coloop


int
main()
{
    Coloop::Coroutine::error_test().run();
    return boost::report_errors();
}

//  $CUSTOM_FOOTER$
