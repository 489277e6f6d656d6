//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  test/unit/timer.cpp
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
#include "coloop/coroutine/task.hpp"

#include "boost/core/lightweight_test.hpp"
#include <chrono>
#include <utility>


namespace Coloop    {
namespace Coroutine {


using namespace std::literals::chrono_literals;


struct timer_test {

    //--------------------------------------------
    // Construction
    //--------------------------------------------

    void
    testDefault()
    {
        Timer t;

        BOOST_TEST(!t);
        BOOST_TEST(!t.is_active());
        BOOST_TEST(!t.is_ready());
        BOOST_TEST(t.will_block());
        BOOST_TEST(!t.try_read());
        BOOST_TEST_THROWS(t.read(), Usage_error);
    }

    void
    testNegativeDuration()
    {
        Scheduler   sched;
        const Timer t{sched, -5ms};

        BOOST_TEST(!t);
        BOOST_TEST(!t.is_active());
    }

    void
    testMove()
    {
        Scheduler   sched;
        Timer       a{sched, 1h};
        const Timer b{std::move(a)};

        BOOST_TEST(!a);
        BOOST_TEST(b);
        BOOST_TEST(b.is_active());
        BOOST_TEST(a != b);
    }

    //--------------------------------------------
    // Expiry
    //--------------------------------------------

    void
    testExpiry()
    {
        Scheduler   sched;
        const Time  start = Clock::now();
        Timer       t{sched, 10ms};
        Time        fired;

        auto reader = [](Timer& t, Time& fired) -> Task {
            fired = co_await t.read();
        };

        BOOST_TEST(t.is_active());
        BOOST_TEST(!t.is_ready());

        sched.spawn(reader(t, fired));
        sched.run();

        BOOST_TEST(fired - start >= 10ms);
        BOOST_TEST(!t.is_active());
        BOOST_TEST(!t.is_ready());
    }

    void
    testFiresOnce()
    {
        Scheduler   sched;
        Timer       t{sched, 1ms};
        int         nfired = 0;

        auto waiter = [](Timer& t, int& n) -> Task {
            co_await sleep(20ms);
            while (t.try_read())
                ++n;
        };

        sched.spawn(waiter(t, nfired));
        sched.run();
        BOOST_TEST_EQ(nfired, 1);
    }

    void
    testStop()
    {
        Scheduler   sched;
        Timer       t{sched, 5ms};
        bool        ready = true;

        auto waiter = [](Timer& t, bool& ready) -> Task {
            co_await sleep(20ms);
            ready = t.is_ready();
        };

        BOOST_TEST(t.stop());
        BOOST_TEST(!t.stop());
        BOOST_TEST(!t.is_active());

        sched.spawn(waiter(t, ready));
        sched.run();
        BOOST_TEST(!ready);
    }

    void
    testReset()
    {
        Scheduler   sched;
        Timer       t{sched, 1h};
        const Time  start = Clock::now();
        Time        fired;

        auto reader = [](Timer& t, Time& fired) -> Task {
            fired = co_await t.read();
        };

        BOOST_TEST(t.reset(5ms));
        BOOST_TEST(t.is_active());

        sched.spawn(reader(t, fired));
        sched.run();
        BOOST_TEST(fired - start >= 5ms);
        BOOST_TEST(fired - start < 1min);

        // Restart after expiry.
        BOOST_TEST(!t.reset(1ms));
        BOOST_TEST(t.is_active());
        BOOST_TEST(t.reset(-1ms));
        BOOST_TEST(!t.is_active());
    }

    void
    testResetDiscardsUnreadExpiry()
    {
        Scheduler   sched;
        Timer       t{sched, 1ms};
        bool        ready = true;

        auto waiter = [](Timer& t, bool& ready) -> Task {
            co_await sleep(10ms);
            BOOST_TEST(t.is_ready());
            t.reset(1h);
            ready = t.is_ready();
            t.stop();
        };

        sched.spawn(waiter(t, ready));
        sched.run();
        BOOST_TEST(!ready);
    }

    void
    testDefaultReset()
    {
        Timer t;
        Timer       u;

        BOOST_TEST_THROWS(u.reset(1ms), Usage_error);
        BOOST_TEST(!t.is_active());
    }

    void
    run()
    {
        testDefault();
        testNegativeDuration();
        testMove();
        testExpiry();
        testFiresOnce();
        testStop();
        testReset();
        testResetDiscardsUnreadExpiry();
        testDefaultReset();
    }
};


}   // Coroutine
}   // Coloop


int
main()
{
    Coloop::Coroutine::timer_test().run();
    return boost::report_errors();
}

//  $CUSTOM_FOOTER$
