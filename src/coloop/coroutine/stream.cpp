//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  src/coloop/coroutine/stream.cpp
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

#include "coloop/coroutine/stream.hpp"
#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <unistd.h>


/*
    Coloop Coroutine Library
*/
namespace Coloop    {
namespace Coroutine {


/*
    Resource Stream Read Awaitable
*/
Resource_stream::Read_awaitable::Read_awaitable(Resource_stream* sp, std::ptrdiff_t maxbytes)
    : streamp{sp}
    , nbytes{maxbytes}
{
}


bool
Resource_stream::Read_awaitable::await_ready()
{
    streamp->check_open();

    if (nbytes < 0)
        throw Invalid_argument_error("negative read length");

    if (!streamp->is_readable())
        throw Usage_error("stream is not readable");

    return nbytes == 0;
}


bool
Resource_stream::Read_awaitable::await_suspend(Task::Handle h)
{
    taskp = &h.promise();
    if (taskp->deliver_cancel())
        return false;

    streamp->wait(Io_direction::readable, taskp, 0);
    taskp->suspend(Task::State::suspended_readable, this);
    return true;
}


std::string
Resource_stream::Read_awaitable::await_resume()
{
    if (taskp)
        taskp->rethrow_error();

    return (nbytes > 0) ? streamp->read_some(nbytes) : std::string();
}


void
Resource_stream::Read_awaitable::dequeue(Task::Promise*, Channel_size)
{
    streamp->forget(Io_direction::readable);
}


/*
    Resource Stream Write Awaitable
*/
Resource_stream::Write_awaitable::Write_awaitable(Resource_stream* sp, std::string bytes)
    : streamp{sp}
    , data{std::move(bytes)}
{
}


bool
Resource_stream::Write_awaitable::await_ready()
{
    streamp->check_open();

    if (!streamp->is_writable())
        throw Usage_error("stream is not writable");

    return data.empty();
}


bool
Resource_stream::Write_awaitable::await_suspend(Task::Handle h)
{
    taskp = &h.promise();
    if (taskp->deliver_cancel())
        return false;

    streamp->wait(Io_direction::writable, taskp, 0);
    taskp->suspend(Task::State::suspended_writable, this);
    return true;
}


std::size_t
Resource_stream::Write_awaitable::await_resume()
{
    if (taskp)
        taskp->rethrow_error();

    return data.empty() ? 0 : streamp->write_some(data);
}


void
Resource_stream::Write_awaitable::dequeue(Task::Promise*, Channel_size)
{
    streamp->forget(Io_direction::writable);
}


/*
    Resource Stream Contents Awaitable
*/
Resource_stream::Contents_awaitable::Contents_awaitable(Resource_stream* sp, bool quiet)
    : streamp{sp}
    , isquiet{quiet}
{
}


bool
Resource_stream::Contents_awaitable::await_ready()
{
    if (!isquiet)
        return start();

    try {
        return start();
    } catch (const Io_error&) {
        data.clear();
        return true;
    }
}


bool
Resource_stream::Contents_awaitable::await_suspend(Task::Handle h)
{
    taskp = &h.promise();
    if (taskp->deliver_cancel())
        return false;

    streamp->wait(Io_direction::readable, taskp, 0);
    taskp->suspend(Task::State::suspended_readable, this);
    return true;
}


std::string
Resource_stream::Contents_awaitable::await_resume()
{
    if (taskp)
        taskp->rethrow_error();

    if (!error && streamp->is_closed())
        error = std::make_exception_ptr(Closed_resource_error("stream is closed or detached"));

    if (error) {
        if (isquiet)
            return std::string();
        std::rethrow_exception(error);
    }

    return std::move(data);
}


void
Resource_stream::Contents_awaitable::dequeue(Task::Promise* tp, Channel_size fired)
{
    streamp->forget(Io_direction::readable);
    if (fired == none || streamp->is_closed())
        return;

    try {
        if (!drain()) {
            streamp->wait(Io_direction::readable, tp, 0);
            tp->suspend(Task::State::suspended_readable, this);
        }
    } catch (const Io_error&) {
        error = std::current_exception();
    }
}


/*
    Read whatever input is available, returning true at end of input.
*/
bool
Resource_stream::Contents_awaitable::drain()
{
    for (;;) {
        const std::string chunk = streamp->read_some(chunksize);

        if (chunk.empty())
            return streamp->eof();

        data += chunk;
    }
}


bool
Resource_stream::Contents_awaitable::start()
{
    if (isquiet) {
        if (!streamp->is_readable())
            return true;

        const optional<Offset> n = streamp->size();

        if (n && *n == 0)
            return true;

        if (streamp->is_seekable())
            streamp->rewind();
    } else {
        streamp->check_open();
        if (!streamp->is_readable())
            throw Usage_error("stream is not readable");
    }

    return drain();
}


/*
    Resource Stream
*/
Resource_stream::Resource_stream(int desc, optional<std::string> modestr)
    : fd{desc}
    , modeover{std::move(modestr)}
{
    if (fd < 0 || ::fcntl(fd, F_GETFD) < 0)
        throw Usage_error("not an open descriptor");

    origflags = ::fcntl(fd, F_GETFL);
    if (origflags < 0)
        throw_last_io_error("fcntl");

    // A system call on the descriptor must never block the scheduling thread.
    if (!(origflags & O_NONBLOCK) && ::fcntl(fd, F_SETFL, origflags | O_NONBLOCK) < 0)
        throw_last_io_error("unable to make descriptor non-blocking");
}


Resource_stream::Resource_stream(Resource_stream&& other)
    : fd{other.fd}
    , origflags{other.origflags}
    , modeover{std::move(other.modeover)}
    , iseof{other.iseof}
{
    assert(!other.reader.taskp && !other.writer.taskp);
    other.fd = -1;
}


Resource_stream&
Resource_stream::operator=(Resource_stream&& other)
{
    Resource_stream temp{std::move(other)};

    swap(*this, temp);
    return *this;
}


Resource_stream::~Resource_stream()
{
    close();
}


void
Resource_stream::check_open() const
{
    if (fd < 0)
        throw Closed_resource_error("stream is closed or detached");
}


/*
    Closing gives up the descriptor whether or not the system reports an
    error, so a second close is a no-op.
*/
void
Resource_stream::close()
{
    if (fd < 0)
        return;

    ::close(release());
}


bool
Resource_stream::dequeue_select(Task::Promise* taskp, Channel_size pos) const
{
    if (reader.taskp != taskp || reader.pos != pos)
        return false;

    forget(Io_direction::readable);
    return true;
}


Resource_stream::Contents_awaitable
Resource_stream::contents()
{
    return Contents_awaitable{this, false};
}


int
Resource_stream::descriptor() const
{
    return fd;
}


/*
    Detaching hands the descriptor back with the flags it arrived with.
*/
int
Resource_stream::detach()
{
    if (fd < 0)
        return -1;

    if (::fcntl(fd, F_SETFL, origflags) < 0)
        throw_last_io_error("unable to restore descriptor flags");

    return release();
}


void
Resource_stream::enqueue_select(Task::Promise* taskp, Channel_size pos) const
{
    check_open();
    wait(Io_direction::readable, taskp, pos);
}


bool
Resource_stream::eof() const
{
    return fd < 0 || iseof;
}


void
Resource_stream::forget(Io_direction dir) const
{
    Waiter& w = waiter(dir);

    if (w.taskp && fd >= 0)
        w.taskp->scheduler()->multiplexer().remove(fd, dir);

    w = Waiter{};
}


bool
Resource_stream::is_closed() const
{
    return fd < 0;
}


bool
Resource_stream::is_readable() const
{
    if (fd < 0)
        return false;

    const std::string m = mode();
    return m.find_first_of("r+") != std::string::npos;
}


bool
Resource_stream::is_seekable() const
{
    return fd >= 0 && ::lseek(fd, 0, SEEK_CUR) >= 0;
}


bool
Resource_stream::is_writable() const
{
    if (fd < 0)
        return false;

    const std::string m = mode();
    return m.find_first_of("waxc+") != std::string::npos;
}


optional<Resource_stream::Metadata>
Resource_stream::metadata() const
{
    optional<Metadata> meta;

    if (fd >= 0)
        meta = Metadata{mode(), is_seekable()};

    return meta;
}


std::string
Resource_stream::mode() const
{
    if (modeover)
        return *modeover;

    const int flags = ::fcntl(fd, F_GETFL);

    if (flags < 0)
        throw_last_io_error("fcntl");

    switch (flags & O_ACCMODE) {
    case O_RDONLY:  return "r";
    case O_WRONLY:  return (flags & O_APPEND) ? "a" : "w";
    default:        return (flags & O_APPEND) ? "a+" : "r+";
    }
}


/*
    Give up the descriptor, then resume the tasks waiting on it, which find
    the stream closed.
*/
int
Resource_stream::release()
{
    const int       desc    = fd;
    const Waiter    r       = reader;
    const Waiter    w       = writer;

    forget(Io_direction::readable);
    forget(Io_direction::writable);
    fd = -1;

    if (r.taskp)
        r.taskp->notify_complete(r.pos);

    if (w.taskp)
        w.taskp->notify_complete(w.pos);

    return desc;
}


Resource_stream::Read_awaitable
Resource_stream::read(std::ptrdiff_t maxbytes)
{
    return Read_awaitable{this, maxbytes};
}


std::string
Resource_stream::read_some(std::ptrdiff_t maxbytes)
{
    std::string buf(static_cast<std::size_t>(maxbytes), '\0');

    // The stream may have been closed after the task became ready.
    check_open();

    const ssize_t n = ::read(fd, &buf[0], buf.size());

    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
            return std::string();
        throw_last_io_error("read");
    }

    if (n == 0)
        iseof = true;

    buf.resize(static_cast<std::size_t>(n));
    return buf;
}


void
Resource_stream::rewind()
{
    check_open();

    if (!is_seekable())
        throw_io_error(ESPIPE, "stream is not seekable");

    seek(0, SEEK_SET);
}


void
Resource_stream::seek(Offset offset, int whence)
{
    check_open();

    if (::lseek(fd, static_cast<off_t>(offset), whence) < 0)
        throw_last_io_error("unable to seek");

    iseof = false;
}


optional<Resource_stream::Offset>
Resource_stream::size() const
{
    optional<Offset>    n;
    struct stat         st;

    if (fd < 0)
        return n;

    if (::fstat(fd, &st) < 0)
        throw_last_io_error("fstat");

    if (S_ISREG(st.st_mode))
        n = static_cast<Offset>(st.st_size);

    return n;
}


Resource_stream::Offset
Resource_stream::tell() const
{
    check_open();

    const off_t pos = ::lseek(fd, 0, SEEK_CUR);

    if (pos < 0)
        throw_last_io_error("unable to determine stream position");

    return static_cast<Offset>(pos);
}


Resource_stream::Contents_awaitable
Resource_stream::to_string()
{
    return Contents_awaitable{this, true};
}


void
Resource_stream::wait(Io_direction dir, Task::Promise* taskp, Channel_size pos) const
{
    taskp->scheduler()->multiplexer().add(fd, dir, taskp, pos);
    waiter(dir) = Waiter{taskp, pos};
}


Resource_stream::Waiter&
Resource_stream::waiter(Io_direction dir) const
{
    return (dir == Io_direction::readable) ? reader : writer;
}


bool
Resource_stream::will_block() const
{
    if (fd < 0)
        return false;

    pollfd pfd{fd, POLLIN, 0};
    const int n = ::poll(&pfd, 1, 0);

    if (n < 0)
        throw_last_io_error("poll");

    return n == 0;
}


Resource_stream::Write_awaitable
Resource_stream::write(std::string bytes)
{
    return Write_awaitable{this, std::move(bytes)};
}


std::size_t
Resource_stream::write_some(const std::string& bytes)
{
    check_open();

    const ssize_t n = ::write(fd, bytes.data(), bytes.size());

    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
            return 0;
        throw_last_io_error("write");
    }

    return static_cast<std::size_t>(n);
}


void
swap(Resource_stream& x, Resource_stream& y)
{
    using std::swap;

    assert(!x.reader.taskp && !x.writer.taskp);
    assert(!y.reader.taskp && !y.writer.taskp);
    swap(x.fd, y.fd);
    swap(x.origflags, y.origflags);
    swap(x.modeover, y.modeover);
    swap(x.iseof, y.iseof);
}


}   // Coroutine
}   // Coloop

//  $CUSTOM_FOOTER$
