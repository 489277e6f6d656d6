//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  coloop/coroutine/task.hpp
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

#ifndef COLOOP_COROUTINE_TASK_HPP
#define COLOOP_COROUTINE_TASK_HPP

#include "coloop/coroutine/config.hpp"
#include "coloop/coroutine/error.hpp"
#include "boost/operators.hpp"
#include "boost/optional.hpp"
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <initializer_list>
#include <limits>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>


/*
    Coloop Coroutine Library
*/
namespace Coloop    {
namespace Coroutine {


/*
    Names/Types
*/
template<class T>   class Channel;
template<class T>   class Read_channel;
template<class T>   class Write_channel;
template<class R>   class Work_awaitable;
class Channel_base;
class Selectable;
class Scheduler;
class Task_handle;
class Timer;
using Channel_size  = std::ptrdiff_t;
using Task_id       = std::uint64_t;
using Clock         = std::chrono::steady_clock;
using Time          = Clock::time_point;
using Duration      = std::chrono::nanoseconds;
using Time_channel  = Channel<Time>;
using boost::optional;
using std::exception_ptr;


/*
    Channel Capacity
*/
const Channel_size unbounded_capacity = std::numeric_limits<Channel_size>::max();


/*
    I/O Direction
*/
enum class Io_direction : int { readable, writable };


/*
    Task

    A Task is a lightweight cooperative thread implemented by a stackless
    coroutine.  The tasks owned by a Scheduler share a single operating
    system thread, and a task runs without interruption until it reaches a
    suspension point (a co_await on one of the awaitables below).
*/
class COLOOP_COROUTINE_DECL Task {
public:
    // Names/Types
    class Promise;
    class Wait;
    class Control;
    using promise_type          = Promise;
    using Handle                = std::coroutine_handle<Promise>;
    using Initial_suspend       = std::suspend_always;
    using Final_suspend         = std::suspend_always;
    using Control_ptr           = std::shared_ptr<Control>;
    using Failure_handler       = std::function<void(Task_id, exception_ptr)>;
    using Failure_handler_ptr   = std::shared_ptr<Failure_handler>;

    enum class State : int {
        ready,
        running,
        suspended_readable,
        suspended_writable,
        suspended_timer,
        suspended_channel,
        suspended_select,
        suspended_task,
        suspended_work,
        finished,
        failed
    };

    // Construct/Copy/Destroy
    explicit Task(Handle = nullptr);
    Task(Task&&);
    Task& operator=(Task&&);
    friend void swap(Task&, Task&);
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;
    ~Task();

    // Observers
    Handle  handle() const;
    bool    is_done() const;

    // Execution
    void resume();

    // Conversions
    explicit operator bool() const;

private:
    // Data
    Handle coro;
};


/*
    Task Wait

    The condition on which a suspended task is blocked.  Whoever wakes the
    task first removes the registration that fired, then dequeue() removes
    whatever registrations remain.  On a completion, dequeue() may suspend
    the task again on the same wait, and the task then stays blocked.
*/
class COLOOP_COROUTINE_DECL Task::Wait {
public:
    // Constants
    static constexpr Channel_size none{-1};

    // Event Processing
    virtual void dequeue(Promise*, Channel_size fired) = 0;
    virtual void expire(Promise*);

protected:
    // Copy/Destroy
    Wait() = default;
    Wait(const Wait&) = default;
    Wait& operator=(const Wait&) = default;
    ~Wait() = default;
};


/*
    Task Control

    The bookkeeping for a spawned task that outlives its coroutine frame,
    shared by the task and by every handle to it.
*/
class COLOOP_COROUTINE_DECL Task::Control {
public:
    // Construct/Copy/Destroy
    Control(Task_id, Failure_handler_ptr);
    Control(const Control&) = delete;
    Control& operator=(const Control&) = delete;
    ~Control();

    // Observers
    Task_id     id() const;
    State       state() const;
    bool        is_done() const;
    Promise*    task() const;
    Scheduler*  scheduler() const;

    // Failure Access
    exception_ptr observe();

    // Joining
    void enqueue_joiner(Promise*);
    bool dequeue_joiner(Promise*);

    // Lifetime
    void bind(Scheduler*, Promise*);
    void update(State);
    void finish(exception_ptr);
    void release();

private:
    // Failure Reporting
    static bool is_cancellation(exception_ptr);

    // Data
    Task_id             taskid;
    State               taskstate{State::ready};
    Promise*            taskp{nullptr};
    Scheduler*          schedp{nullptr};
    exception_ptr       failure;
    bool                isobserved{false};
    std::deque<Promise*> joiners;
    Failure_handler_ptr reportp;
};


/*
    Task Promise
*/
class COLOOP_COROUTINE_DECL Task::Promise {
public:
    // Construct/Copy
    Promise() = default;
    Promise(const Promise&) = delete;
    Promise& operator=(const Promise&) = delete;

    // Scheduling
    void                bind(Scheduler*, Control_ptr);
    Scheduler*          scheduler() const;
    const Control_ptr&  control() const;
    Task_id             id() const;
    State               state() const;
    bool                is_started() const;
    void                make_running();

    // Suspension
    bool            deliver_cancel();
    void            suspend(State, Wait*);
    void            start_timer(Duration);
    void            rethrow_error();
    void            rethrow_if_cancelled();
    Channel_size    selected() const;

    /*
        Event Processing

        Notifications arriving after the task has already been woken are
        ignored.
    */
    void notify_complete(Channel_size pos = 0);
    void notify_error(exception_ptr, Channel_size fired = 0);
    void notify_timer_expired();

    // Cancellation
    bool cancel();
    bool is_cancel_pending() const;
    void abandon();

    // Result
    exception_ptr failure() const;

    // Coroutine Functions
    Task            get_return_object();
    Initial_suspend initial_suspend() const;
    Final_suspend   final_suspend() const noexcept;
    void            return_void();
    void            unhandled_exception();

private:
    // Event Processing
    void wake();

    // Data
    Scheduler*      schedp{nullptr};
    Control_ptr     ctrl;
    Wait*           waitp{nullptr};
    exception_ptr   wakeerr;
    exception_ptr   bodyerr;
    Channel_size    selpos{0};
    bool            isstarted{false};
    bool            iscancel{false};
    bool            istimer{false};
};


/*
    Task Handle

    Refers to a spawned task.  A handle remains valid after the task has
    finished, and after its Scheduler has been destroyed.
*/
class COLOOP_COROUTINE_DECL Task_handle : boost::totally_ordered<Task_handle> {
public:
    // Names/Types
    class Join_awaitable;

    // Construct/Copy
    Task_handle() = default;
    explicit Task_handle(Task::Control_ptr);

    // Observers
    Task_id     id() const;
    Task::State state() const;
    bool        is_done() const;

    // Cancellation
    bool cancel() const;

    // Result
    exception_ptr   exception() const;
    Join_awaitable  join() const;

    // Conversions
    explicit operator bool() const;

    // Comparisons
    friend bool operator==(const Task_handle&, const Task_handle&);
    friend bool operator< (const Task_handle&, const Task_handle&);

    // Friends
    friend class Scheduler;

private:
    // Data
    Task::Control_ptr ctrl;
};


/*
    Task Handle Join Awaitable
*/
class COLOOP_COROUTINE_DECL Task_handle::Join_awaitable : public Task::Wait {
public:
    // Awaitable Operations
    bool await_ready() const;
    bool await_suspend(Task::Handle);
    void await_resume();

    // Event Processing
    void dequeue(Task::Promise*, Channel_size fired) override;

private:
    // Construct
    explicit Join_awaitable(Task::Control_ptr);

    // Friends
    friend class Task_handle;

    // Data
    Task::Control_ptr   ctrl;
    Task::Promise*      taskp{nullptr};
};


/*
    Selectable

    Something whose readiness can be polled without suspending, and on
    whose readiness a task can wait as part of a select.
*/
class COLOOP_COROUTINE_DECL Selectable {
public:
    // Copy/Destroy
    Selectable() = default;
    Selectable(const Selectable&) = default;
    Selectable& operator=(const Selectable&) = default;
    virtual ~Selectable() = default;

    // Polling
    virtual bool will_block() const = 0;

    // Select Waiting
    virtual void enqueue_select(Task::Promise*, Channel_size pos) const = 0;
    virtual bool dequeue_select(Task::Promise*, Channel_size pos) const = 0;
};


/*
    Select Awaitable

    Suspends the calling task until one of a set of selectables becomes
    ready, yielding the position of the first ready selectable.  If several
    are ready when the select begins, the leftmost wins.
*/
class COLOOP_COROUTINE_DECL Select_awaitable : public Task::Wait {
public:
    // Names/Types
    using Selectable_vector = std::vector<const Selectable*>;

    // Construct
    explicit Select_awaitable(Selectable_vector);

    // Awaitable Operations
    bool            await_ready();
    bool            await_suspend(Task::Handle);
    Channel_size    await_resume();

    // Event Processing
    void dequeue(Task::Promise*, Channel_size fired) override;

private:
    // Data
    Selectable_vector       selectables;
    optional<Channel_size>  winner;
    Task::Promise*          taskp{nullptr};
};


/*
    Selection
*/
Select_awaitable                                COLOOP_COROUTINE_DECL select(std::initializer_list<const Selectable*>);
Select_awaitable                                COLOOP_COROUTINE_DECL select(std::vector<const Selectable*>);
template<Channel_size N> Select_awaitable       select(const Selectable* const (&)[N]);
optional<Channel_size>                          COLOOP_COROUTINE_DECL try_select(std::initializer_list<const Selectable*>);
optional<Channel_size>                          COLOOP_COROUTINE_DECL try_select(const std::vector<const Selectable*>&);


/*
    Channel Base

    The element-independent part of a channel: its closed flag and the
    tasks waiting in a select for it to become readable.
*/
class COLOOP_COROUTINE_DECL Channel_base {
public:
    // Construct/Copy
    Channel_base() = default;
    Channel_base(const Channel_base&) = delete;
    Channel_base& operator=(const Channel_base&) = delete;

    // Observers
    bool is_closed() const;

    // Select Waiting
    void enqueue_select(Task::Promise*, Channel_size pos);
    bool dequeue_select(Task::Promise*, Channel_size pos);

protected:
    // Destroy
    ~Channel_base() = default;

    // Event Processing
    void notify_selector();
    void notify_selectors();
    void mark_closed();

private:
    // Names/Types
    struct Selector {
        Task::Promise*  taskp;
        Channel_size    pos;
    };

    // Data
    std::deque<Selector>    selectors;
    bool                    isclosed{false};
};


/*
    Channel

    A typed conduit between tasks.  A channel of zero capacity (the default)
    pairs each write with a read, a channel of positive capacity buffers up
    to that many values, and an unbounded channel never blocks writers.
    Waiting readers and writers are served first-come, first-served.
*/
template<class T> Channel<T> make_channel(Channel_size capacity = 0);


template<class T>
class Channel : public Selectable, boost::totally_ordered<Channel<T>> {
public:
    // Names/Types
    class Read_awaitable;
    class Write_awaitable;
    using Value = T;

    // Construct/Copy
    Channel() = default;
    template<class U> friend Channel<U> make_channel(Channel_size);
    inline friend void swap(Channel& x, Channel& y) {
        using std::swap;
        swap(x.pimpl, y.pimpl);
    }

    // Size and Capacity
    Channel_size    size() const;
    Channel_size    capacity() const;
    bool            is_empty() const;
    bool            is_full() const;

    // Non-Blocking Channel Operations
    Write_awaitable write(const T&) const;
    Write_awaitable write(T&&) const;
    Read_awaitable  read() const;
    bool            try_write(const T&) const;
    bool            try_write(T&&) const;
    optional<T>     try_read() const;

    // Closing
    void close() const;
    bool is_closed() const;

    // Polling
    bool is_readable() const;
    bool is_writable() const;
    bool will_block() const override;

    // Select Waiting
    void enqueue_select(Task::Promise*, Channel_size pos) const override;
    bool dequeue_select(Task::Promise*, Channel_size pos) const override;

    // Conversions
    explicit operator bool() const;

    // Comparisons
    inline friend bool operator==(const Channel& x, const Channel& y) {
        return x.pimpl == y.pimpl;
    }

    inline friend bool operator< (const Channel& x, const Channel& y) {
        return x.pimpl < y.pimpl;
    }

    // Friends
    friend class Read_channel<T>;
    friend class Write_channel<T>;

private:
    // Names/Types
    class Buffer {
    public:
        // Construct/Copy
        explicit Buffer(Channel_size maxsize);
        Buffer(const Buffer&) = delete;
        Buffer& operator=(const Buffer&) = delete;

        // Size and Capacity
        Channel_size    size() const;
        Channel_size    capacity() const;
        bool            is_empty() const;
        bool            is_full() const;

        // Queue Operations
        void    push(T&&);
        T       pop();

    private:
        // Data
        std::queue<T>   elemq;
        Channel_size    sizemax;
    };

    class Writer {
    public:
        // Construct
        Writer(Task::Promise* tp, T* vp) : taskp{tp}, valuep{vp} {}

        // Observers
        Task::Promise*  task() const { return taskp; }
        T*              value() const { return valuep; }

    private:
        // Data
        Task::Promise*  taskp;
        T*              valuep;
    };

    class Reader {
    public:
        // Construct
        Reader(Task::Promise* tp, optional<T>* vp) : taskp{tp}, valuep{vp} {}

        // Observers
        Task::Promise*  task() const { return taskp; }
        optional<T>*    value() const { return valuep; }

    private:
        // Data
        Task::Promise*  taskp;
        optional<T>*    valuep;
    };

    template<class U>
    class Io_queue {
    public:
        // Size
        bool is_empty() const;

        // Queue Operations
        void    push(const U&);
        U       pop();
        bool    erase(Task::Promise*);

    private:
        // Data
        std::deque<U> waiters;
    };

    using Writer_queue = Io_queue<Writer>;
    using Reader_queue = Io_queue<Reader>;

    class Impl : public Channel_base {
    public:
        // Construct
        explicit Impl(Channel_size maxsize);

        // Size and Capacity
        Channel_size    size() const;
        Channel_size    capacity() const;
        bool            is_empty() const;
        bool            is_full() const;

        // Non-Blocking Reads/Writes
        bool write(T* valuep);
        bool read(optional<T>* valuep);

        // Blocking Reads/Writes
        void enqueue_write(Task::Promise*, T* valuep);
        bool dequeue_write(Task::Promise*);
        void enqueue_read(Task::Promise*, optional<T>* valuep);
        bool dequeue_read(Task::Promise*);

        // Closing
        void close();

        // Polling
        bool is_readable() const;
        bool is_writable() const;
        bool will_block() const;

    private:
        // Data
        Buffer          buffer;
        Writer_queue    writers;
        Reader_queue    readers;
    };

    using Impl_ptr = std::shared_ptr<Impl>;

    // Construct
    explicit Channel(Impl_ptr);

    // Data
    Impl_ptr pimpl;
};


/*
    Channel Read Awaitable
*/
template<class T>
class Channel<T>::Read_awaitable : public Task::Wait {
public:
    // Awaitable Operations
    bool    await_ready();
    bool    await_suspend(Task::Handle);
    T       await_resume();

    // Event Processing
    void dequeue(Task::Promise*, Channel_size fired) override;

private:
    // Construct
    explicit Read_awaitable(Impl*);

    // Friends
    friend class Channel;
    friend class Read_channel<T>;

    // Data
    Impl*           chanp;
    optional<T>     value;
    Task::Promise*  taskp{nullptr};
};


/*
    Channel Write Awaitable
*/
template<class T>
class Channel<T>::Write_awaitable : public Task::Wait {
public:
    // Awaitable Operations
    bool await_ready();
    bool await_suspend(Task::Handle);
    void await_resume();

    // Event Processing
    void dequeue(Task::Promise*, Channel_size fired) override;

private:
    // Construct
    Write_awaitable(Impl*, T&&);

    // Friends
    friend class Channel;
    friend class Write_channel<T>;

    // Data
    Impl*           chanp;
    T               value;
    Task::Promise*  taskp{nullptr};
};


/*
    Read Channel

    The reading end of a channel.
*/
template<class T>
class Read_channel : public Selectable, boost::totally_ordered<Read_channel<T>> {
public:
    // Names/Types
    using Value             = T;
    using Read_awaitable    = typename Channel<T>::Read_awaitable;

    // Construct/Copy
    Read_channel() = default;
    Read_channel(const Channel<T>&);
    inline friend void swap(Read_channel& x, Read_channel& y) {
        using std::swap;
        swap(x.pimpl, y.pimpl);
    }

    // Size and Capacity
    Channel_size    size() const;
    Channel_size    capacity() const;
    bool            is_empty() const;
    bool            is_full() const;

    // Non-Blocking Channel Operations
    Read_awaitable  read() const;
    optional<T>     try_read() const;

    // Closing
    void close() const;
    bool is_closed() const;

    // Polling
    bool is_readable() const;
    bool will_block() const override;

    // Select Waiting
    void enqueue_select(Task::Promise*, Channel_size pos) const override;
    bool dequeue_select(Task::Promise*, Channel_size pos) const override;

    // Conversions
    explicit operator bool() const;

    // Comparisons
    inline friend bool operator==(const Read_channel& x, const Read_channel& y) {
        return x.pimpl == y.pimpl;
    }

    inline friend bool operator< (const Read_channel& x, const Read_channel& y) {
        return x.pimpl < y.pimpl;
    }

private:
    // Data
    typename Channel<T>::Impl_ptr pimpl;
};


/*
    Write Channel

    The writing end of a channel.
*/
template<class T>
class Write_channel : boost::totally_ordered<Write_channel<T>> {
public:
    // Names/Types
    using Value             = T;
    using Write_awaitable   = typename Channel<T>::Write_awaitable;

    // Construct/Copy
    Write_channel() = default;
    Write_channel(const Channel<T>&);
    inline friend void swap(Write_channel& x, Write_channel& y) {
        using std::swap;
        swap(x.pimpl, y.pimpl);
    }

    // Size and Capacity
    Channel_size    size() const;
    Channel_size    capacity() const;
    bool            is_empty() const;
    bool            is_full() const;

    // Non-Blocking Channel Operations
    Write_awaitable write(const T&) const;
    Write_awaitable write(T&&) const;
    bool            try_write(const T&) const;
    bool            try_write(T&&) const;

    // Closing
    void close() const;
    bool is_closed() const;

    // Polling
    bool is_writable() const;

    // Conversions
    explicit operator bool() const;

    // Comparisons
    inline friend bool operator==(const Write_channel& x, const Write_channel& y) {
        return x.pimpl == y.pimpl;
    }

    inline friend bool operator< (const Write_channel& x, const Write_channel& y) {
        return x.pimpl < y.pimpl;
    }

private:
    // Data
    typename Channel<T>::Impl_ptr pimpl;
};


/*
    Yield Awaitable
*/
class COLOOP_COROUTINE_DECL Yield_awaitable {
public:
    // Awaitable Operations
    bool await_ready() const;
    bool await_suspend(Task::Handle);
    void await_resume();

private:
    // Data
    Task::Promise* taskp{nullptr};
};


/*
    Sleep Awaitable
*/
class COLOOP_COROUTINE_DECL Sleep_awaitable : public Task::Wait {
public:
    // Construct
    explicit Sleep_awaitable(Duration);

    // Awaitable Operations
    bool await_ready() const;
    bool await_suspend(Task::Handle);
    void await_resume();

    // Event Processing
    void dequeue(Task::Promise*, Channel_size fired) override;
    void expire(Task::Promise*) override;

private:
    // Data
    Duration        delay;
    Task::Promise*  taskp{nullptr};
};


/*
    I/O Readiness Awaitable

    Suspends the calling task until a descriptor is ready in one direction,
    or until an optional timeout expires (reported as a Timeout_error).
*/
class COLOOP_COROUTINE_DECL Io_awaitable : public Task::Wait {
public:
    // Construct
    Io_awaitable(int fd, Io_direction, optional<Duration> timeout);

    // Awaitable Operations
    bool await_ready() const;
    bool await_suspend(Task::Handle);
    void await_resume();

    // Event Processing
    void dequeue(Task::Promise*, Channel_size fired) override;

private:
    // Data
    int                 fd;
    Io_direction        direction;
    optional<Duration>  timeout;
    Task::Promise*      taskp{nullptr};
};


/*
    Suspension Points
*/
Yield_awaitable COLOOP_COROUTINE_DECL yield();
Sleep_awaitable COLOOP_COROUTINE_DECL sleep(Duration);
Io_awaitable    COLOOP_COROUTINE_DECL readable(int fd);
Io_awaitable    COLOOP_COROUTINE_DECL readable(int fd, Duration timeout);
Io_awaitable    COLOOP_COROUTINE_DECL writable(int fd);
Io_awaitable    COLOOP_COROUTINE_DECL writable(int fd, Duration timeout);


/*
    Work Result
*/
template<class R>
class Work_result {
public:
    // Result Access
    template<class F> void  assign(F&);
    R                       get();

private:
    // Data
    optional<R> value;
};


template<>
class Work_result<void> {
public:
    // Result Access
    template<class F> void  assign(F&);
    void                    get();
};


/*
    Work Awaitable

    Runs a function on one of the Scheduler's worker threads, suspending
    the calling task until the function returns.
*/
template<class R>
class Work_awaitable : public Task::Wait {
public:
    // Construct
    template<class Fun> explicit Work_awaitable(Fun);

    // Awaitable Operations
    bool    await_ready() const;
    bool    await_suspend(Task::Handle);
    R       await_resume();

    // Event Processing
    void dequeue(Task::Promise*, Channel_size fired) override;

private:
    // Names/Types
    struct Work {
        // Execution
        void    run();
        void    complete();

        // Data
        std::function<R()>  fun;
        Work_result<R>      result;
        exception_ptr       error;
        Task::Promise*      taskp{nullptr};
    };

    // Data
    std::shared_ptr<Work>   workp;
    Task::Promise*          taskp{nullptr};
};


/*
    Blocking Calls
*/
template<class Fun> Work_awaitable<std::invoke_result_t<Fun&>> blocking_call(Fun);


/*
    Timer

    Delivers the expiry time on a channel of capacity one after a duration
    has elapsed.
*/
class COLOOP_COROUTINE_DECL Timer : public Selectable, boost::totally_ordered<Timer> {
public:
    // Names/Types
    using Read_awaitable = Time_channel::Read_awaitable;

    // Construct/Copy/Destroy
    Timer() = default;
    Timer(Scheduler&, Duration);
    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;
    Timer(Timer&&);
    Timer& operator=(Timer&&);
    friend void swap(Timer&, Timer&);
    ~Timer();

    // Timer Functions
    bool stop();
    bool reset(Duration);
    bool is_active() const;
    bool is_ready() const;

    // Non-Blocking Read
    Read_awaitable  read() const;
    optional<Time>  try_read() const;

    // Polling
    bool will_block() const override;

    // Select Waiting
    void enqueue_select(Task::Promise*, Channel_size pos) const override;
    bool dequeue_select(Task::Promise*, Channel_size pos) const override;

    // Conversions
    explicit operator bool() const;

    // Comparisons
    friend bool operator==(const Timer&, const Timer&);
    friend bool operator< (const Timer&, const Timer&);

private:
    // Construct
    static Time_channel make_timer(Scheduler*, Duration);
    static bool         is_valid(Duration);

    // Data
    Scheduler*      schedp{nullptr};
    Time_channel    chan;
};


/*
    Scheduler

    A Scheduler multiplexes tasks onto the calling thread, resuming each
    ready task in turn and waiting on descriptors, timers, and worker
    threads when no task is ready.
*/
class COLOOP_COROUTINE_DECL Scheduler {
public:
    // Names/Types
    using Work_function         = std::function<void()>;
    using Completion_function   = std::function<void()>;

    /*
        Multiplexer

        Waits for readiness on a set of descriptors, each with at most one
        waiting task per direction.  Registrations are one-shot.
        Descriptors the operating system cannot poll (e.g., regular files)
        are always ready.
    */
    class Multiplexer {
    public:
        // Names/Types
        struct Event {
            int             fd;
            Io_direction    direction;
            Task::Promise*  taskp;
            Channel_size    pos;
        };

        using Event_vector = std::vector<Event>;

        // Construct/Copy
        explicit Multiplexer(int maxevents = COLOOP_COROUTINE_MAX_EVENTS);
        Multiplexer(const Multiplexer&) = delete;
        Multiplexer& operator=(const Multiplexer&) = delete;

        // Registration
        void    add(int fd, Io_direction, Task::Promise*, Channel_size pos = 0);
        bool    remove(int fd, Io_direction);
        bool    is_registered(int fd, Io_direction) const;
        bool    is_empty() const;
        int     size() const;

        // Event Waiting
        Event_vector    poll(optional<Duration> maxwait);
        void            interrupt() const;

    private:
        // Names/Types
        struct Waiter {
            explicit operator bool() const { return taskp != nullptr; }
            Task::Promise*  taskp{nullptr};
            Channel_size    pos{0};
        };

        struct Interest {
            Waiter  reader;
            Waiter  writer;
            bool    ispolled{true};
        };

        using Interest_map = std::unordered_map<int, Interest>;

        class Handles {
        public:
            // Construct/Copy/Destroy
            Handles();
            Handles(const Handles&) = delete;
            Handles& operator=(const Handles&) = delete;
            ~Handles();

            // Synchronization
            void signal_interrupt() const;
            void clear_interrupt() const;

            // Observers
            int poller() const;
            int interrupter() const;

        private:
            // Destroy
            static void close(int fd);

            // Data
            int epfd{-1};
            int evfd{-1};
        };

        // Registration
        static Waiter&          waiter(Interest*, Io_direction);
        static std::uint32_t    events(const Interest&);
        int                     control(int op, int fd, const Interest&) const;

        // Event Waiting
        void        collect_unpolled(Event_vector*);
        void        collect(int fd, std::uint32_t events, Event_vector*);
        void        fire(int fd, Io_direction, Event_vector*);
        static int  timeout_ms(optional<Duration>);

        // Data
        Interest_map    interests;
        int             nwaiters{0};
        int             eventmax;
        Handles         handles;
    };

    // Construct/Copy/Destroy
    explicit Scheduler(int nworkers = 0, int maxevents = COLOOP_COROUTINE_MAX_EVENTS);
    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;
    ~Scheduler();

    // Task Execution
    Task_handle spawn(Task);
    void        run();
    std::size_t poll();
    bool        cancel(const Task_handle&);
    std::size_t size() const;
    bool        is_running() const;

    // Failure Reporting
    void set_failure_handler(Task::Failure_handler);

    // Task Suspension
    void            schedule(Task::Promise*);
    Multiplexer&    multiplexer();
    void            start_timer(Task::Promise*, Duration);
    void            cancel_timer(Task::Promise*);
    void            submit_work(Work_function, Completion_function);

    // Friends
    friend class Timer;

private:
    // Names/Types
    using Thread        = std::thread;
    using Mutex         = std::mutex;
    using Lock          = std::unique_lock<Mutex>;
    using Condition     = std::condition_variable;
    using Task_table    = std::unordered_map<Task::Promise*, Task>;
    using Ready_queue   = std::deque<Task::Promise*>;

    class Run_guard {
    public:
        // Construct/Copy/Destroy
        explicit Run_guard(bool* flagp);
        Run_guard(const Run_guard&) = delete;
        Run_guard& operator=(const Run_guard&) = delete;
        ~Run_guard();

    private:
        // Data
        bool* isrunningp;
    };

    class Timers {
    public:
        // Task Timers
        void start(Task::Promise*, Time expiry);
        bool cancel(Task::Promise*);

        // User Timers
        void start(const Time_channel&, Time expiry);
        bool stop(const Time_channel&);
        bool is_pending(const Time_channel&) const;

        // Expiry
        void            expire(Time now);
        optional<Time>  next_expiry() const;
        bool            is_empty() const;

    private:
        struct Alarm : boost::totally_ordered<Alarm> {
            // Construct
            Alarm() = default;
            Alarm(Task::Promise* tskp, Time t) : taskp{tskp}, time{t} {}
            Alarm(Time_channel c, Time t)
                : taskp{nullptr}, channel{std::move(c)}, time{t} {}

            // Comparisons
            inline friend bool operator==(const Alarm& x, const Alarm& y) {
                if (x.taskp != y.taskp) return false;
                if (x.channel != y.channel) return false;
                if (x.time != y.time) return false;
                return true;
            }

            inline friend bool operator< (const Alarm& x, const Alarm& y) {
                return x.time < y.time;
            }

            // Data
            Task::Promise*  taskp{nullptr};
            Time_channel    channel;
            Time            time;
        };

        class Alarm_queue {
        private:
            // Names/Types
            using Alarm_deque = std::deque<Alarm>;

            struct Task_eq {
                explicit Task_eq(Task::Promise* tp) : taskp{tp} {}
                bool operator()(const Alarm& a) const {
                    return a.taskp == taskp;
                }
                Task::Promise* taskp;
            };

            struct Channel_eq {
                explicit Channel_eq(const Time_channel& c) : chan{c} {}
                bool operator()(const Alarm& a) const {
                    return a.taskp == nullptr && a.channel == chan;
                }
                const Time_channel& chan;
            };

            // Alarm Comparison
            static Task_eq      id_eq(Task::Promise*);
            static Channel_eq   id_eq(const Time_channel&);

            // Data
            Alarm_deque alarms;

        public:
            // Size
            bool is_empty() const;

            // Queue Functions
            void                    push(const Alarm&);
            Alarm                   pop();
            template<class T> bool  erase(const T& alarmid);

            // Element Access
            template<class T> bool is_found(const T& alarmid) const;

            // Observers
            Time next_expiry() const;
        };

        // Expiry
        static void signal(const Alarm&, Time now);

        // Data
        Alarm_queue alarmq;
    };

    class Completion_queue {
    public:
        // Construct/Copy
        Completion_queue() = default;
        Completion_queue(const Completion_queue&) = delete;
        Completion_queue& operator=(const Completion_queue&) = delete;

        // Queue Operations
        void                                push(Completion_function);
        std::deque<Completion_function>     pop_all();

    private:
        // Data
        std::deque<Completion_function> completions;
        mutable Mutex                   mutex;
    };

    /*
        Worker Pool

        Threads are started on first use.
    */
    class Worker_pool {
    public:
        // Construct/Copy/Destroy
        explicit Worker_pool(int nthreads);
        Worker_pool(const Worker_pool&) = delete;
        Worker_pool& operator=(const Worker_pool&) = delete;
        ~Worker_pool();

        // Work Submission
        void submit(Work_function);

    private:
        // Execution
        void            start(const Lock&);
        void            run_thread();
        Work_function   pop();

        // Data
        std::deque<Work_function>   jobs;
        std::vector<Thread>         threads;
        int                         nthreads;
        bool                        is_interrupt{false};
        mutable Mutex               mutex;
        Condition                   ready;
    };

    // Execution
    std::size_t         run_ready();
    void                resume(Task::Promise*);
    void                finish(Task::Promise*, exception_ptr);
    void                dispatch(optional<Duration> maxwait);
    optional<Duration>  wait_time() const;
    bool                is_deadlocked() const;

    // User Timers
    void start_timer(const Time_channel&, Duration);
    bool reset_timer(const Time_channel&, Duration);
    bool stop_timer(const Time_channel&);
    bool is_timer_pending(const Time_channel&) const;

    // Failure Reporting
    static void report_failure(Task_id, exception_ptr);

    // Data
    Task_table                  tasks;
    Ready_queue                 readyq;
    Multiplexer                 mux;
    Timers                      timers;
    Completion_queue            completions;
    std::size_t                 nworking{0};
    Task_id                     nextid{1};
    Task::Failure_handler_ptr   failhandler;
    bool                        isrunning{false};
    Worker_pool                 workers;
};


}   // Coroutine
}   // Coloop

#include "coloop/coroutine/task.inl"

#endif  // COLOOP_COROUTINE_TASK_HPP

//  $CUSTOM_FOOTER$
