//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  test/unit/stream.cpp
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
#include "coloop/coroutine/stream.hpp"

#include "boost/core/lightweight_test.hpp"
#include <chrono>
#include <initializer_list>
#include <cstdio>
#include <cstdlib>
#include <fcntl.h>
#include <string>
#include <unistd.h>
#include <utility>


namespace Coloop    {
namespace Coroutine {


using namespace std::literals::chrono_literals;


/*
    Stream Pair

    The two ends of a pipe, each owned by a stream.
*/
struct Stream_pair {
    static Stream_pair
    make()
    {
        int fds[2];

        if (::pipe2(fds, O_NONBLOCK) < 0)
            throw_last_io_error("pipe2");

        return Stream_pair{Resource_stream{fds[0]}, Resource_stream{fds[1]}};
    }

    Resource_stream in;
    Resource_stream out;
};


/*
    Create an unlinked temporary file holding the given contents.
*/
int
make_file(const std::string& contents)
{
    char        name[] = "/tmp/coloop_stream_XXXXXX";
    const int   fd = ::mkstemp(name);

    if (fd < 0)
        throw_last_io_error("mkstemp");

    ::unlink(name);
    if (::write(fd, contents.data(), contents.size()) != static_cast<ssize_t>(contents.size()))
        throw_last_io_error("write");

    return fd;
}


struct stream_test {

    //--------------------------------------------
    // Construction and modes
    //--------------------------------------------

    void
    testInvalidDescriptor()
    {
        BOOST_TEST_THROWS(Resource_stream{-1}, Usage_error);

        int fds[2];
        BOOST_TEST_EQ(::pipe(fds), 0);
        ::close(fds[0]);
        ::close(fds[1]);
        BOOST_TEST_THROWS(Resource_stream{fds[0]}, Usage_error);
    }

    void
    testPipeModes()
    {
        Stream_pair p = Stream_pair::make();

        BOOST_TEST(p.in.is_readable());
        BOOST_TEST(!p.in.is_writable());
        BOOST_TEST(p.out.is_writable());
        BOOST_TEST(!p.out.is_readable());
        BOOST_TEST(!p.in.is_seekable());
        BOOST_TEST(!p.in.size());
        BOOST_TEST(p.in.metadata());
        BOOST_TEST_EQ(p.in.metadata()->mode, "r");
        BOOST_TEST(!p.in.metadata()->isseekable);
        BOOST_TEST_THROWS(p.in.rewind(), Io_error);
        BOOST_TEST_THROWS(p.in.tell(), Io_error);
    }

    void
    testModeOverride()
    {
        int fds[2];

        BOOST_TEST_EQ(::pipe(fds), 0);

        Resource_stream in{fds[0]};
        Resource_stream out{fds[1], std::string("r")};

        BOOST_TEST(out.is_readable());
        BOOST_TEST(!out.is_writable());
        BOOST_TEST_EQ(out.metadata()->mode, "r");
        BOOST_TEST_THROWS(out.write("x").await_ready(), Usage_error);
    }

    //--------------------------------------------
    // Reading and writing
    //--------------------------------------------

    void
    testRoundTrip()
    {
        Scheduler   sched;
        Stream_pair p = Stream_pair::make();
        std::string got;
        std::size_t nwritten = 0;

        auto writer = [](Resource_stream& s, std::size_t& n) -> Task {
            co_await sleep(5ms);
            n = co_await s.write("hello");
        };

        auto reader = [](Resource_stream& s, std::string& out) -> Task {
            out = co_await s.read(100);
        };

        sched.spawn(reader(p.in, got));
        sched.spawn(writer(p.out, nwritten));
        sched.run();

        BOOST_TEST_EQ(nwritten, 5u);
        BOOST_TEST_EQ(got, "hello");
        BOOST_TEST(sched.multiplexer().is_empty());
    }

    void
    testReadAtMost()
    {
        Scheduler   sched;
        Stream_pair p = Stream_pair::make();
        std::string first;
        std::string second;

        auto reader = [](Resource_stream& s, std::string& a, std::string& b) -> Task {
            a = co_await s.read(3);
            b = co_await s.read(100);
        };

        BOOST_TEST(p.in.will_block());
        BOOST_TEST_EQ(::write(p.out.descriptor(), "abcdef", 6), 6);
        BOOST_TEST(!p.in.will_block());

        sched.spawn(reader(p.in, first, second));
        sched.run();
        BOOST_TEST_EQ(first, "abc");
        BOOST_TEST_EQ(second, "def");
    }

    void
    testZeroLength()
    {
        Scheduler   sched;
        Stream_pair p = Stream_pair::make();
        std::string got{"unset"};

        auto reader = [](Resource_stream& s, std::string& out) -> Task {
            out = co_await s.read(0);
        };

        sched.spawn(reader(p.in, got));
        BOOST_TEST_EQ(sched.poll(), 1u);
        BOOST_TEST(got.empty());
    }

    void
    testNegativeLength()
    {
        Scheduler   sched;
        Stream_pair p = Stream_pair::make();
        bool        caught = false;

        auto reader = [](Resource_stream& s, bool& caught) -> Task {
            try {
                co_await s.read(-1);
            } catch (const Invalid_argument_error&) {
                caught = true;
            }
        };

        sched.spawn(reader(p.in, caught));
        sched.run();
        BOOST_TEST(caught);
    }

    void
    testEndOfFile()
    {
        Scheduler   sched;
        Stream_pair p = Stream_pair::make();
        std::string got{"unset"};

        auto reader = [](Resource_stream& s, std::string& out) -> Task {
            out = co_await s.read(10);
        };

        p.out.close();
        BOOST_TEST(!p.in.eof());
        sched.spawn(reader(p.in, got));
        sched.run();
        BOOST_TEST(got.empty());
        BOOST_TEST(p.in.eof());
    }

    void
    testBlockingPipe()
    {
        Scheduler           sched;
        int                 fds[2];
        const std::string   payload(1 << 20, 'x');
        std::string         got;
        int                 nwrites = 0;

        BOOST_TEST_EQ(::pipe(fds), 0);

        Resource_stream in{fds[0]};
        Resource_stream out{fds[1]};

        BOOST_TEST(::fcntl(fds[0], F_GETFL) & O_NONBLOCK);
        BOOST_TEST(::fcntl(fds[1], F_GETFL) & O_NONBLOCK);

        auto writer = [](Resource_stream& s, std::string rest, int& n) -> Task {
            while (!rest.empty()) {
                const std::size_t nbytes = co_await s.write(rest);
                rest.erase(0, nbytes);
                ++n;
            }
        };

        auto reader = [](Resource_stream& s, std::size_t total, std::string& out) -> Task {
            while (out.size() < total)
                out += co_await s.read(65536);
        };

        sched.spawn(writer(out, payload, nwrites));
        sched.spawn(reader(in, payload.size(), got));
        sched.run();

        BOOST_TEST(got == payload);
        BOOST_TEST_GT(nwrites, 1);
        BOOST_TEST(sched.multiplexer().is_empty());
    }

    //--------------------------------------------
    // Closing
    //--------------------------------------------

    void
    testClosedStream()
    {
        Scheduler   sched;
        Stream_pair p = Stream_pair::make();
        int         ncaught = 0;

        auto user = [](Resource_stream& in, Resource_stream& out, int& n) -> Task {
            try {
                co_await in.read(1);
            } catch (const Closed_resource_error&) {
                ++n;
            }
            try {
                co_await out.write("x");
            } catch (const Closed_resource_error&) {
                ++n;
            }
        };

        p.in.close();
        p.in.close();
        p.out.close();
        BOOST_TEST(p.in.is_closed());
        BOOST_TEST(!p.in.is_readable());
        BOOST_TEST(!p.in.metadata());
        BOOST_TEST(!p.in.size());
        BOOST_TEST(p.in.eof());
        BOOST_TEST_THROWS(p.in.tell(), Closed_resource_error);
        BOOST_TEST_THROWS(p.in.seek(0), Closed_resource_error);

        sched.spawn(user(p.in, p.out, ncaught));
        sched.run();
        BOOST_TEST_EQ(ncaught, 2);
    }

    void
    testCloseWakesReader()
    {
        Scheduler   sched;
        Stream_pair p = Stream_pair::make();
        bool        caught = false;

        auto reader = [](Resource_stream& s, bool& caught) -> Task {
            try {
                co_await s.read(10);
            } catch (const Closed_resource_error&) {
                caught = true;
            }
        };

        auto closer = [](Resource_stream& s) -> Task {
            co_await sleep(5ms);
            s.close();
        };

        sched.spawn(reader(p.in, caught));
        sched.spawn(closer(p.in));
        sched.run();
        BOOST_TEST(caught);
        BOOST_TEST(sched.multiplexer().is_empty());
    }

    void
    testDetach()
    {
        Stream_pair p   = Stream_pair::make();
        const int   fd  = p.in.descriptor();

        BOOST_TEST_EQ(p.in.detach(), fd);
        BOOST_TEST(p.in.is_closed());
        BOOST_TEST_EQ(p.in.detach(), -1);

        // The descriptor survives the stream.
        BOOST_TEST(::fcntl(fd, F_GETFD) >= 0);
        ::close(fd);
    }

    void
    testDetachRestoresFlags()
    {
        int fds[2];

        BOOST_TEST_EQ(::pipe(fds), 0);
        {
            Resource_stream in{fds[0]};

            BOOST_TEST(::fcntl(fds[0], F_GETFL) & O_NONBLOCK);
            BOOST_TEST_EQ(in.detach(), fds[0]);
        }

        BOOST_TEST_EQ(::fcntl(fds[0], F_GETFL) & O_NONBLOCK, 0);
        ::close(fds[0]);
        ::close(fds[1]);
    }

    void
    testMove()
    {
        Stream_pair     p   = Stream_pair::make();
        const int       fd  = p.in.descriptor();
        Resource_stream s{std::move(p.in)};

        BOOST_TEST(p.in.is_closed());
        BOOST_TEST_EQ(s.descriptor(), fd);
        BOOST_TEST(s.is_readable());
    }

    //--------------------------------------------
    // Regular files
    //--------------------------------------------

    void
    testRegularFile()
    {
        Scheduler       sched;
        Resource_stream file{make_file("hello world")};
        std::string     first;
        std::string     rest;
        std::string     after;

        auto reader = [](Resource_stream& s, std::string& a, std::string& b, std::string& c) -> Task {
            a = co_await s.read(5);
            b = co_await s.read(100);
            c = co_await s.read(100);
        };

        BOOST_TEST(file.is_seekable());
        BOOST_TEST(file.is_readable());
        BOOST_TEST(file.is_writable());
        BOOST_TEST_EQ(*file.size(), 11);
        BOOST_TEST_EQ(file.tell(), 11);
        BOOST_TEST(!file.will_block());

        file.rewind();
        BOOST_TEST_EQ(file.tell(), 0);

        sched.spawn(reader(file, first, rest, after));
        sched.run();
        BOOST_TEST_EQ(first, "hello");
        BOOST_TEST_EQ(rest, " world");
        BOOST_TEST(after.empty());
        BOOST_TEST(file.eof());
        BOOST_TEST_EQ(file.tell(), 11);

        file.seek(-5, SEEK_END);
        BOOST_TEST(!file.eof());
        BOOST_TEST_EQ(file.tell(), 6);
        BOOST_TEST_THROWS(file.seek(-100, SEEK_SET), Io_error);
    }

    void
    testRegularFileWrite()
    {
        Scheduler       sched;
        Resource_stream file{make_file("")};
        std::size_t     n = 0;

        auto writer = [](Resource_stream& s, std::size_t& n) -> Task {
            n = co_await s.write("abc");
            n += co_await s.write("de");
        };

        sched.spawn(writer(file, n));
        sched.run();
        BOOST_TEST_EQ(n, 5u);
        BOOST_TEST_EQ(*file.size(), 5);
    }

    //--------------------------------------------
    // Whole contents
    //--------------------------------------------

    void
    testContentsPipe()
    {
        Scheduler   sched;
        Stream_pair p = Stream_pair::make();
        std::string got;

        auto reader = [](Resource_stream& s, std::string& out) -> Task {
            out = co_await s.contents();
        };

        auto writer = [](Resource_stream& s) -> Task {
            co_await s.write("abc");
            co_await sleep(5ms);
            co_await s.write("def");
            co_await sleep(5ms);
            s.close();
        };

        sched.spawn(reader(p.in, got));
        sched.spawn(writer(p.out));
        sched.run();
        BOOST_TEST_EQ(got, "abcdef");
        BOOST_TEST(p.in.eof());
        BOOST_TEST(sched.multiplexer().is_empty());
    }

    void
    testContentsRegularFile()
    {
        Scheduler       sched;
        Resource_stream file{make_file("hello world")};
        std::string     atend{"unset"};
        std::string     tail;
        std::string     whole;

        auto reader = [](Resource_stream& s, std::string& a, std::string& b, std::string& c) -> Task {
            a = co_await s.contents();
            s.seek(6);
            b = co_await s.contents();
            c = co_await s.to_string();
        };

        sched.spawn(reader(file, atend, tail, whole));
        sched.run();
        BOOST_TEST(atend.empty());
        BOOST_TEST_EQ(tail, "world");
        BOOST_TEST_EQ(whole, "hello world");
        BOOST_TEST(file.eof());
    }

    void
    testToString()
    {
        Scheduler       sched;
        Stream_pair     p       = Stream_pair::make();
        Resource_stream empty{make_file("")};
        std::string     piped;
        std::string     closed{"unset"};
        std::string     blank{"unset"};

        auto reader = [](Resource_stream& in, Resource_stream& out, Resource_stream& f,
                         std::string& a, std::string& b, std::string& c) -> Task {
            a = co_await in.to_string();
            b = co_await out.to_string();
            c = co_await f.to_string();
        };

        BOOST_TEST_EQ(::write(p.out.descriptor(), "xyz", 3), 3);
        p.out.close();
        sched.spawn(reader(p.in, p.out, empty, piped, closed, blank));
        sched.run();
        BOOST_TEST_EQ(piped, "xyz");
        BOOST_TEST(closed.empty());
        BOOST_TEST(blank.empty());
    }

    void
    testContentsClosed()
    {
        Scheduler   sched;
        Stream_pair p = Stream_pair::make();
        bool        caught = false;
        std::string quiet{"unset"};

        auto user = [](Resource_stream& s, bool& caught, std::string& out) -> Task {
            try {
                co_await s.contents();
            } catch (const Closed_resource_error&) {
                caught = true;
            }
            out = co_await s.to_string();
        };

        p.in.close();
        sched.spawn(user(p.in, caught, quiet));
        sched.run();
        BOOST_TEST(caught);
        BOOST_TEST(quiet.empty());
    }

    void
    testCloseWakesContentsReader()
    {
        Scheduler   sched;
        Stream_pair p = Stream_pair::make();
        bool        caught = false;

        auto reader = [](Resource_stream& s, bool& caught) -> Task {
            try {
                co_await s.contents();
            } catch (const Closed_resource_error&) {
                caught = true;
            }
        };

        auto closer = [](Resource_stream& in, Resource_stream& out) -> Task {
            co_await out.write("partial");
            co_await sleep(5ms);
            in.close();
        };

        sched.spawn(reader(p.in, caught));
        sched.spawn(closer(p.in, p.out));
        sched.run();
        BOOST_TEST(caught);
        BOOST_TEST(sched.multiplexer().is_empty());
    }

    //--------------------------------------------
    // Selection
    //--------------------------------------------

    void
    testSelectWithChannel()
    {
        Scheduler           sched;
        Stream_pair         p       = Stream_pair::make();
        const Channel<int>  silent  = make_channel<int>(1);
        Channel_size        pos     = 99;
        std::string         got;

        auto selector = [](Resource_stream& s, Channel<int> c, Channel_size& pos, std::string& out) -> Task {
            const std::initializer_list<const Selectable*> selectables{&c, &s};
            pos = co_await select(selectables);
            out = co_await s.read(10);
        };

        auto writer = [](Resource_stream& s) -> Task {
            co_await sleep(5ms);
            co_await s.write("ping");
        };

        sched.spawn(selector(p.in, silent, pos, got));
        sched.spawn(writer(p.out));
        sched.run();
        BOOST_TEST_EQ(pos, 1);
        BOOST_TEST_EQ(got, "ping");
        BOOST_TEST(sched.multiplexer().is_empty());
    }

    void
    run()
    {
        testInvalidDescriptor();
        testPipeModes();
        testModeOverride();
        testRoundTrip();
        testReadAtMost();
        testZeroLength();
        testNegativeLength();
        testEndOfFile();
        testBlockingPipe();
        testClosedStream();
        testCloseWakesReader();
        testDetach();
        testDetachRestoresFlags();
        testMove();
        testRegularFile();
        testRegularFileWrite();
        testContentsPipe();
        testContentsRegularFile();
        testToString();
        testContentsClosed();
        testCloseWakesContentsReader();
        testSelectWithChannel();
    }
};


}   // Coroutine
}   // Coloop


int
main()
{
    Coloop::Coroutine::stream_test().run();
    return boost::report_errors();
}

//  $CUSTOM_FOOTER$
