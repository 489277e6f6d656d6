//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  coloop/coroutine/stream.hpp
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

#ifndef COLOOP_COROUTINE_STREAM_HPP
#define COLOOP_COROUTINE_STREAM_HPP

#include "coloop/coroutine/task.hpp"
#include <cstdint>
#include <cstdio>
#include <string>


/*
    Coloop Coroutine Library
*/
namespace Coloop    {
namespace Coroutine {


/*
    Resource Stream

    Owns a file descriptor and performs task-suspending reads and writes on
    it.  The descriptor is switched to non-blocking mode while the stream
    owns it.  Each read or write waits for readiness, then makes a single
    system call.  A stream is readable in a select when input is available.
*/
class COLOOP_COROUTINE_DECL Resource_stream : public Selectable {
public:
    // Names/Types
    class Read_awaitable;
    class Write_awaitable;
    class Contents_awaitable;
    using Offset = std::int64_t;

    struct Metadata {
        std::string mode;
        bool        isseekable;
    };

    // Construct/Copy/Destroy
    explicit Resource_stream(int fd, optional<std::string> mode = boost::none);
    Resource_stream(const Resource_stream&) = delete;
    Resource_stream& operator=(const Resource_stream&) = delete;
    Resource_stream(Resource_stream&&);
    Resource_stream& operator=(Resource_stream&&);
    friend void swap(Resource_stream&, Resource_stream&);
    ~Resource_stream();

    // Reading and Writing
    Read_awaitable      read(std::ptrdiff_t maxbytes);
    Write_awaitable     write(std::string bytes);
    Contents_awaitable  contents();
    Contents_awaitable  to_string();

    // Positioning
    void    seek(Offset, int whence = SEEK_SET);
    void    rewind();
    Offset  tell() const;
    bool    eof() const;

    // Observers
    int                 descriptor() const;
    bool                is_closed() const;
    bool                is_seekable() const;
    bool                is_readable() const;
    bool                is_writable() const;
    optional<Offset>    size() const;
    optional<Metadata>  metadata() const;

    // Closing
    void    close();
    int     detach();

    // Polling
    bool will_block() const override;

    // Select Waiting
    void enqueue_select(Task::Promise*, Channel_size pos) const override;
    bool dequeue_select(Task::Promise*, Channel_size pos) const override;

private:
    // Names/Types
    struct Waiter {
        Task::Promise*  taskp{nullptr};
        Channel_size    pos{0};
    };

    // Task Waiting
    void            wait(Io_direction, Task::Promise*, Channel_size pos) const;
    void            forget(Io_direction) const;
    int             release();
    Waiter&         waiter(Io_direction) const;

    // System Calls
    void            check_open() const;
    std::string     mode() const;
    std::string     read_some(std::ptrdiff_t maxbytes);
    std::size_t     write_some(const std::string&);

    // Data
    int                     fd;
    int                     origflags{0};
    optional<std::string>   modeover;
    bool                    iseof{false};
    mutable Waiter          reader;
    mutable Waiter          writer;
};


/*
    Resource Stream Read Awaitable
*/
class COLOOP_COROUTINE_DECL Resource_stream::Read_awaitable : public Task::Wait {
public:
    // Awaitable Operations
    bool        await_ready();
    bool        await_suspend(Task::Handle);
    std::string await_resume();

    // Event Processing
    void dequeue(Task::Promise*, Channel_size fired) override;

private:
    // Construct
    Read_awaitable(Resource_stream*, std::ptrdiff_t maxbytes);

    // Friends
    friend class Resource_stream;

    // Data
    Resource_stream*    streamp;
    std::ptrdiff_t      nbytes;
    Task::Promise*      taskp{nullptr};
};


/*
    Resource Stream Write Awaitable
*/
class COLOOP_COROUTINE_DECL Resource_stream::Write_awaitable : public Task::Wait {
public:
    // Awaitable Operations
    bool        await_ready();
    bool        await_suspend(Task::Handle);
    std::size_t await_resume();

    // Event Processing
    void dequeue(Task::Promise*, Channel_size fired) override;

private:
    // Construct
    Write_awaitable(Resource_stream*, std::string bytes);

    // Friends
    friend class Resource_stream;

    // Data
    Resource_stream*    streamp;
    std::string         data;
    Task::Promise*      taskp{nullptr};
};


/*
    Resource Stream Contents Awaitable

    Reads until end of input, suspending whenever no input is available.
    A quiet read (to_string) starts from the beginning of a seekable stream
    and yields an empty string instead of failing.
*/
class COLOOP_COROUTINE_DECL Resource_stream::Contents_awaitable : public Task::Wait {
public:
    // Awaitable Operations
    bool        await_ready();
    bool        await_suspend(Task::Handle);
    std::string await_resume();

    // Event Processing
    void dequeue(Task::Promise*, Channel_size fired) override;

private:
    // Constants
    static constexpr std::ptrdiff_t chunksize{32768};

    // Construct
    Contents_awaitable(Resource_stream*, bool isquiet);

    // Friends
    friend class Resource_stream;

    // Reading
    bool start();
    bool drain();

    // Data
    Resource_stream*    streamp;
    bool                isquiet;
    std::string         data;
    exception_ptr       error;
    Task::Promise*      taskp{nullptr};
};


}   // Coroutine
}   // Coloop

#endif  // COLOOP_COROUTINE_STREAM_HPP

//  $CUSTOM_FOOTER$
