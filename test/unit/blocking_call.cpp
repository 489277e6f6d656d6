//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  test/unit/blocking_call.cpp
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
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>


namespace Coloop    {
namespace Coroutine {


using namespace std::literals::chrono_literals;


struct blocking_call_test {

    //--------------------------------------------
    // Results
    //--------------------------------------------

    void
    testReturnsValue()
    {
        Scheduler   sched{2};
        int         result = 0;

        auto task = [](int& result) -> Task {
            result = co_await blocking_call([]() { return 6 * 7; });
        };

        sched.spawn(task(result));
        sched.run();
        BOOST_TEST_EQ(result, 42);
    }

    void
    testVoidCall()
    {
        Scheduler           sched{1};
        std::atomic<bool>   called{false};
        bool                done = false;

        auto task = [](std::atomic<bool>& called, bool& done) -> Task {
            co_await blocking_call([&called]() { called = true; });
            done = true;
        };

        sched.spawn(task(called, done));
        sched.run();
        BOOST_TEST(called);
        BOOST_TEST(done);
    }

    void
    testRunsOffSchedulerThread()
    {
        Scheduler               sched{1};
        const std::thread::id   self = std::this_thread::get_id();
        std::thread::id         worker;

        auto task = [](std::thread::id& worker) -> Task {
            worker = co_await blocking_call([]() { return std::this_thread::get_id(); });
        };

        sched.spawn(task(worker));
        sched.run();
        BOOST_TEST(worker != self);
        BOOST_TEST(worker != std::thread::id());
    }

    void
    testRethrows()
    {
        Scheduler   sched{1};
        std::string what;

        auto task = [](std::string& what) -> Task {
            try {
                co_await blocking_call([]() -> int { throw std::runtime_error("worker failed"); });
            } catch (const std::runtime_error& e) {
                what = e.what();
            }
        };

        sched.spawn(task(what));
        sched.run();
        BOOST_TEST_EQ(what, "worker failed");
    }

    //--------------------------------------------
    // Concurrency
    //--------------------------------------------

    void
    testOtherTasksRun()
    {
        Scheduler   sched{1};
        std::string trace;

        auto slow = [](std::string& out) -> Task {
            co_await blocking_call([]() { std::this_thread::sleep_for(30ms); });
            out += 's';
        };

        auto fast = [](std::string& out) -> Task {
            co_await sleep(1ms);
            out += 'f';
        };

        sched.spawn(slow(trace));
        sched.spawn(fast(trace));
        sched.run();
        BOOST_TEST_EQ(trace, "fs");
    }

    void
    testManyCalls()
    {
        Scheduler   sched{4};
        int         total = 0;

        auto task = [](int n, int& total) -> Task {
            total += co_await blocking_call([n]() { return n; });
        };

        for (int i = 1; i <= 20; ++i)
            sched.spawn(task(i, total));

        sched.run();
        BOOST_TEST_EQ(total, 210);
    }

    void
    testCancel()
    {
        Scheduler           sched{1};
        std::atomic<bool>   finished{false};
        bool                cancelled = false;

        auto task = [](std::atomic<bool>& finished, bool& cancelled) -> Task {
            try {
                co_await blocking_call([&finished]() {
                    std::this_thread::sleep_for(20ms);
                    finished = true;
                });
            } catch (const Cancelled_error&) {
                cancelled = true;
            }
        };

        const Task_handle h = sched.spawn(task(finished, cancelled));

        sched.poll();
        BOOST_TEST(h.state() == Task::State::suspended_work);
        BOOST_TEST(h.cancel());
        sched.run();
        BOOST_TEST(cancelled);
        BOOST_TEST(h.is_done());
    }

    void
    run()
    {
        testReturnsValue();
        testVoidCall();
        testRunsOffSchedulerThread();
        testRethrows();
        testOtherTasksRun();
        testManyCalls();
        testCancel();
    }
};


}   // Coroutine
}   // Coloop


int
main()
{
    Coloop::Coroutine::blocking_call_test().run();
    return boost::report_errors();
}

//  $CUSTOM_FOOTER$
