//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  src/coloop/coroutine/multiplexer.cpp
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

#include "coloop/coroutine/task.hpp"
#include <algorithm>
#include <cerrno>
#include <limits>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>


/*
    Coloop Coroutine Library
*/
namespace Coloop    {
namespace Coroutine {


/*
    Scheduler Multiplexer Handles
*/
Scheduler::Multiplexer::Handles::Handles()
{
    epfd = ::epoll_create1(EPOLL_CLOEXEC);
    if (epfd < 0)
        throw_last_io_error("epoll_create1");

    evfd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (evfd < 0) {
        const int errnum = errno;
        close(epfd);
        throw_io_error(errnum, "eventfd");
    }

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = evfd;
    if (::epoll_ctl(epfd, EPOLL_CTL_ADD, evfd, &ev) < 0) {
        const int errnum = errno;
        close(evfd);
        close(epfd);
        throw_io_error(errnum, "epoll_ctl");
    }
}


Scheduler::Multiplexer::Handles::~Handles()
{
    close(evfd);
    close(epfd);
}


void
Scheduler::Multiplexer::Handles::clear_interrupt() const
{
    std::uint64_t count;

    if (::read(evfd, &count, sizeof count) < 0 && errno != EAGAIN)
        throw_last_io_error("eventfd read");
}


void
Scheduler::Multiplexer::Handles::close(int fd)
{
    if (fd >= 0)
        ::close(fd);
}


int
Scheduler::Multiplexer::Handles::interrupter() const
{
    return evfd;
}


int
Scheduler::Multiplexer::Handles::poller() const
{
    return epfd;
}


void
Scheduler::Multiplexer::Handles::signal_interrupt() const
{
    const std::uint64_t one{1};

    // A saturated counter still wakes the poller.
    if (::write(evfd, &one, sizeof one) < 0 && errno != EAGAIN)
        throw_last_io_error("eventfd write");
}


/*
    Scheduler Multiplexer
*/
Scheduler::Multiplexer::Multiplexer(int maxevents)
    : eventmax{maxevents}
{
    if (maxevents <= 0)
        throw Invalid_argument_error("maximum event count must be positive");
}


void
Scheduler::Multiplexer::add(int fd, Io_direction dir, Task::Promise* taskp, Channel_size pos)
{
    if (fd < 0)
        throw Usage_error("invalid descriptor");

    const auto p = interests.find(fd);

    if (p == interests.end()) {
        Interest interest;

        waiter(&interest, dir) = Waiter{taskp, pos};
        if (control(EPOLL_CTL_ADD, fd, interest) < 0) {
            const int errnum = errno;
            if (errnum == EPERM)
                interest.ispolled = false;  // regular file
            else if (errnum == EBADF)
                throw Usage_error("invalid descriptor");
            else
                throw_io_error(errnum, "epoll_ctl ADD");
        }
        interests.emplace(fd, interest);
    } else {
        Interest&   interest    = p->second;
        Waiter&     w           = waiter(&interest, dir);

        if (w)
            throw Usage_error("descriptor already has a waiter in this direction");

        w = Waiter{taskp, pos};
        if (interest.ispolled && control(EPOLL_CTL_MOD, fd, interest) < 0) {
            const int errnum = errno;
            w = Waiter{};
            if (errnum == EBADF || errnum == ENOENT)
                throw Usage_error("invalid descriptor");
            throw_io_error(errnum, "epoll_ctl MOD");
        }
    }

    ++nwaiters;
}


void
Scheduler::Multiplexer::collect(int fd, std::uint32_t flags, Event_vector* readyp)
{
    const std::uint32_t readmask    = EPOLLIN | EPOLLRDHUP | EPOLLHUP | EPOLLERR;
    const std::uint32_t writemask   = EPOLLOUT | EPOLLHUP | EPOLLERR;

    if (flags & readmask)
        fire(fd, Io_direction::readable, readyp);
    if (flags & writemask)
        fire(fd, Io_direction::writable, readyp);
}


void
Scheduler::Multiplexer::collect_unpolled(Event_vector* readyp)
{
    std::vector<int> fds;

    for (const auto& entry : interests) {
        if (!entry.second.ispolled)
            fds.push_back(entry.first);
    }

    for (int fd : fds) {
        fire(fd, Io_direction::readable, readyp);
        fire(fd, Io_direction::writable, readyp);
    }
}


int
Scheduler::Multiplexer::control(int op, int fd, const Interest& interest) const
{
    epoll_event ev{};

    ev.events = events(interest);
    ev.data.fd = fd;
    return ::epoll_ctl(handles.poller(), op, fd, &ev);
}


std::uint32_t
Scheduler::Multiplexer::events(const Interest& interest)
{
    std::uint32_t mask{0};

    if (interest.reader)
        mask |= EPOLLIN | EPOLLRDHUP;
    if (interest.writer)
        mask |= EPOLLOUT;

    return mask;
}


void
Scheduler::Multiplexer::fire(int fd, Io_direction dir, Event_vector* readyp)
{
    const auto p = interests.find(fd);

    if (p != interests.end()) {
        const Waiter w = waiter(&p->second, dir);
        if (w) {
            readyp->push_back(Event{fd, dir, w.taskp, w.pos});
            remove(fd, dir);
        }
    }
}


void
Scheduler::Multiplexer::interrupt() const
{
    handles.signal_interrupt();
}


bool
Scheduler::Multiplexer::is_empty() const
{
    return interests.empty();
}


bool
Scheduler::Multiplexer::is_registered(int fd, Io_direction dir) const
{
    const auto p = interests.find(fd);

    if (p == interests.end())
        return false;

    const Interest& interest = p->second;
    return (dir == Io_direction::readable) ? bool(interest.reader) : bool(interest.writer);
}


Scheduler::Multiplexer::Event_vector
Scheduler::Multiplexer::poll(optional<Duration> maxwait)
{
    Event_vector                ready;
    std::vector<epoll_event>    evs(eventmax);

    collect_unpolled(&ready);

    const int timeout   = ready.empty() ? timeout_ms(maxwait) : 0;
    const int n         = ::epoll_wait(handles.poller(), evs.data(), eventmax, timeout);

    if (n < 0) {
        if (errno != EINTR)
            throw_last_io_error("epoll_wait");
        return ready;
    }

    for (int i = 0; i < n; ++i) {
        const int fd = evs[i].data.fd;

        if (fd == handles.interrupter())
            handles.clear_interrupt();
        else
            collect(fd, evs[i].events, &ready);
    }

    return ready;
}


bool
Scheduler::Multiplexer::remove(int fd, Io_direction dir)
{
    const auto p = interests.find(fd);

    if (p == interests.end())
        return false;

    Interest&   interest    = p->second;
    Waiter&     w           = waiter(&interest, dir);

    if (!w)
        return false;

    w = Waiter{};
    --nwaiters;

    // The kernel forgets a descriptor once it is closed, so these may fail.
    if (!interest.reader && !interest.writer) {
        if (interest.ispolled)
            control(EPOLL_CTL_DEL, fd, interest);
        interests.erase(p);
    } else if (interest.ispolled) {
        control(EPOLL_CTL_MOD, fd, interest);
    }

    return true;
}


int
Scheduler::Multiplexer::size() const
{
    return nwaiters;
}


int
Scheduler::Multiplexer::timeout_ms(optional<Duration> maxwait)
{
    using std::chrono::milliseconds;

    if (!maxwait)
        return -1;

    if (*maxwait <= Duration::zero())
        return 0;

    const auto ms = std::chrono::ceil<milliseconds>(*maxwait).count();
    return static_cast<int>(std::min<decltype(ms)>(ms, std::numeric_limits<int>::max()));
}


Scheduler::Multiplexer::Waiter&
Scheduler::Multiplexer::waiter(Interest* interestp, Io_direction dir)
{
    return (dir == Io_direction::readable) ? interestp->reader : interestp->writer;
}


}   // Coroutine
}   // Coloop

//  $CUSTOM_FOOTER$
