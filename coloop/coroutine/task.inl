//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  coloop/coroutine/task.inl
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

#ifndef COLOOP_COROUTINE_TASK_INL
#define COLOOP_COROUTINE_TASK_INL

#include <algorithm>


/*
    Coloop Coroutine Library
*/
namespace Coloop    {
namespace Coroutine {


/*
    Task
*/
inline
Task::Task(Handle h)
    : coro{h}
{
}


inline
Task::Task(Task&& other)
    : coro{other.coro}
{
    other.coro = nullptr;
}


inline
Task::~Task()
{
    if (coro)
        coro.destroy();
}


inline Task::Handle
Task::handle() const
{
    return coro;
}


inline bool
Task::is_done() const
{
    return coro.done();
}


inline Task&
Task::operator=(Task&& other)
{
    Task temp{std::move(other)};

    swap(*this, temp);
    return *this;
}


inline
Task::operator bool() const
{
    return coro ? true : false;
}


inline void
Task::resume()
{
    assert(coro && !coro.done());
    coro.resume();
}


inline void
swap(Task& x, Task& y)
{
    using std::swap;

    swap(x.coro, y.coro);
}


/*
    Task Control
*/
inline Task_id
Task::Control::id() const
{
    return taskid;
}


inline bool
Task::Control::is_done() const
{
    return taskstate == State::finished || taskstate == State::failed;
}


inline Scheduler*
Task::Control::scheduler() const
{
    return schedp;
}


inline Task::State
Task::Control::state() const
{
    return taskstate;
}


inline Task::Promise*
Task::Control::task() const
{
    return taskp;
}


inline void
Task::Control::update(State s)
{
    taskstate = s;
}


/*
    Task Promise
*/
inline const Task::Control_ptr&
Task::Promise::control() const
{
    return ctrl;
}


inline exception_ptr
Task::Promise::failure() const
{
    return bodyerr;
}


inline Task::Final_suspend
Task::Promise::final_suspend() const noexcept
{
    return Final_suspend{};
}


inline Task
Task::Promise::get_return_object()
{
    return Task{Handle::from_promise(*this)};
}


inline Task_id
Task::Promise::id() const
{
    return ctrl->id();
}


inline Task::Initial_suspend
Task::Promise::initial_suspend() const
{
    return Initial_suspend{};
}


inline bool
Task::Promise::is_cancel_pending() const
{
    return iscancel;
}


inline bool
Task::Promise::is_started() const
{
    return isstarted;
}


inline void
Task::Promise::return_void()
{
}


inline Scheduler*
Task::Promise::scheduler() const
{
    return schedp;
}


inline Channel_size
Task::Promise::selected() const
{
    return selpos;
}


inline Task::State
Task::Promise::state() const
{
    return ctrl->state();
}


inline void
Task::Promise::unhandled_exception()
{
    bodyerr = std::current_exception();
}


/*
    Task Handle
*/
inline
Task_handle::Task_handle(Task::Control_ptr cp)
    : ctrl{std::move(cp)}
{
}


inline Task_id
Task_handle::id() const
{
    return ctrl->id();
}


inline bool
Task_handle::is_done() const
{
    return ctrl->is_done();
}


inline Task_handle::Join_awaitable
Task_handle::join() const
{
    return Join_awaitable{ctrl};
}


inline
Task_handle::operator bool() const
{
    return ctrl ? true : false;
}


inline Task::State
Task_handle::state() const
{
    return ctrl->state();
}


inline bool
operator==(const Task_handle& x, const Task_handle& y)
{
    return x.ctrl == y.ctrl;
}


inline bool
operator< (const Task_handle& x, const Task_handle& y)
{
    return x.ctrl < y.ctrl;
}


/*
    Task Handle Join Awaitable
*/
inline
Task_handle::Join_awaitable::Join_awaitable(Task::Control_ptr cp)
    : ctrl{std::move(cp)}
{
}


inline bool
Task_handle::Join_awaitable::await_ready() const
{
    return ctrl->is_done();
}


/*
    Selection
*/
template<Channel_size N>
inline Select_awaitable
select(const Selectable* const (&ss)[N])
{
    return Select_awaitable{Select_awaitable::Selectable_vector(ss, ss + N)};
}


/*
    Channel Base
*/
inline bool
Channel_base::is_closed() const
{
    return isclosed;
}


inline void
Channel_base::mark_closed()
{
    isclosed = true;
}


/*
    Channel Buffer
*/
template<class T>
inline
Channel<T>::Buffer::Buffer(Channel_size maxsize)
    : sizemax{maxsize}
{
    assert(maxsize >= 0);
}


template<class T>
inline Channel_size
Channel<T>::Buffer::capacity() const
{
    return sizemax;
}


template<class T>
inline bool
Channel<T>::Buffer::is_empty() const
{
    return elemq.empty();
}


template<class T>
inline bool
Channel<T>::Buffer::is_full() const
{
    return size() == sizemax;
}


template<class T>
inline T
Channel<T>::Buffer::pop()
{
    T value{std::move(elemq.front())};

    elemq.pop();
    return value;
}


template<class T>
inline void
Channel<T>::Buffer::push(T&& value)
{
    assert(!is_full());
    elemq.push(std::move(value));
}


template<class T>
inline Channel_size
Channel<T>::Buffer::size() const
{
    return static_cast<Channel_size>(elemq.size());
}


/*
    Channel I/O Queue
*/
template<class T>
template<class U>
bool
Channel<T>::Io_queue<U>::erase(Task::Promise* taskp)
{
    using std::find_if;

    const auto p = find_if(waiters.begin(), waiters.end(), [=](const U& w) {
        return w.task() == taskp;
    });

    if (p == waiters.end())
        return false;

    waiters.erase(p);
    return true;
}


template<class T>
template<class U>
inline bool
Channel<T>::Io_queue<U>::is_empty() const
{
    return waiters.empty();
}


template<class T>
template<class U>
inline U
Channel<T>::Io_queue<U>::pop()
{
    const U w = waiters.front();

    waiters.pop_front();
    return w;
}


template<class T>
template<class U>
inline void
Channel<T>::Io_queue<U>::push(const U& w)
{
    waiters.push_back(w);
}


/*
    Channel Implementation
*/
template<class T>
Channel<T>::Impl::Impl(Channel_size maxsize)
    : buffer{maxsize}
{
}


template<class T>
inline Channel_size
Channel<T>::Impl::capacity() const
{
    return buffer.capacity();
}


template<class T>
void
Channel<T>::Impl::close()
{
    if (is_closed())
        return;

    mark_closed();

    while (!readers.is_empty()) {
        const Reader r = readers.pop();
        r.task()->notify_error(std::make_exception_ptr(Closed_channel_error()));
    }

    while (!writers.is_empty()) {
        const Writer w = writers.pop();
        w.task()->notify_error(std::make_exception_ptr(Closed_channel_error()));
    }

    notify_selectors();
}


template<class T>
inline bool
Channel<T>::Impl::dequeue_read(Task::Promise* taskp)
{
    return readers.erase(taskp);
}


template<class T>
inline bool
Channel<T>::Impl::dequeue_write(Task::Promise* taskp)
{
    return writers.erase(taskp);
}


template<class T>
inline void
Channel<T>::Impl::enqueue_read(Task::Promise* taskp, optional<T>* valuep)
{
    readers.push(Reader{taskp, valuep});
}


template<class T>
void
Channel<T>::Impl::enqueue_write(Task::Promise* taskp, T* valuep)
{
    writers.push(Writer{taskp, valuep});

    // A blocked writer makes the channel readable.
    notify_selector();
}


template<class T>
inline bool
Channel<T>::Impl::is_empty() const
{
    return buffer.is_empty();
}


template<class T>
inline bool
Channel<T>::Impl::is_full() const
{
    return buffer.is_full();
}


template<class T>
inline bool
Channel<T>::Impl::is_readable() const
{
    return !buffer.is_empty() || !writers.is_empty() || !is_closed();
}


template<class T>
inline bool
Channel<T>::Impl::is_writable() const
{
    return !is_closed() && (!readers.is_empty() || !buffer.is_full());
}


template<class T>
bool
Channel<T>::Impl::read(optional<T>* valuep)
{
    if (!buffer.is_empty()) {
        *valuep = buffer.pop();

        // Refill the freed slot from the first blocked writer.
        if (!writers.is_empty()) {
            const Writer w = writers.pop();
            buffer.push(std::move(*w.value()));
            w.task()->notify_complete();
        }
        return true;
    }

    if (!writers.is_empty()) {
        const Writer w = writers.pop();
        *valuep = std::move(*w.value());
        w.task()->notify_complete();
        return true;
    }

    if (is_closed())
        throw Closed_channel_error();

    return false;
}


template<class T>
inline Channel_size
Channel<T>::Impl::size() const
{
    return buffer.size();
}


template<class T>
inline bool
Channel<T>::Impl::will_block() const
{
    return buffer.is_empty() && writers.is_empty() && !is_closed();
}


template<class T>
bool
Channel<T>::Impl::write(T* valuep)
{
    if (is_closed())
        throw Closed_channel_error();

    // Readers only wait on an empty buffer.
    if (!readers.is_empty()) {
        const Reader r = readers.pop();
        *r.value() = std::move(*valuep);
        r.task()->notify_complete();
        return true;
    }

    if (!buffer.is_full()) {
        buffer.push(std::move(*valuep));
        notify_selector();
        return true;
    }

    return false;
}


/*
    Channel Read Awaitable
*/
template<class T>
inline
Channel<T>::Read_awaitable::Read_awaitable(Impl* cp)
    : chanp{cp}
{
}


template<class T>
inline bool
Channel<T>::Read_awaitable::await_ready()
{
    return chanp->read(&value);
}


template<class T>
bool
Channel<T>::Read_awaitable::await_suspend(Task::Handle h)
{
    taskp = &h.promise();
    if (taskp->deliver_cancel())
        return false;

    chanp->enqueue_read(taskp, &value);
    taskp->suspend(Task::State::suspended_channel, this);
    return true;
}


template<class T>
T
Channel<T>::Read_awaitable::await_resume()
{
    if (taskp)
        taskp->rethrow_error();

    return std::move(*value);
}


template<class T>
void
Channel<T>::Read_awaitable::dequeue(Task::Promise* tp, Channel_size fired)
{
    if (fired == none)
        chanp->dequeue_read(tp);
}


/*
    Channel Write Awaitable
*/
template<class T>
inline
Channel<T>::Write_awaitable::Write_awaitable(Impl* cp, T&& x)
    : chanp{cp}
    , value{std::move(x)}
{
}


template<class T>
inline bool
Channel<T>::Write_awaitable::await_ready()
{
    return chanp->write(&value);
}


template<class T>
bool
Channel<T>::Write_awaitable::await_suspend(Task::Handle h)
{
    taskp = &h.promise();
    if (taskp->deliver_cancel())
        return false;

    chanp->enqueue_write(taskp, &value);
    taskp->suspend(Task::State::suspended_channel, this);
    return true;
}


template<class T>
inline void
Channel<T>::Write_awaitable::await_resume()
{
    if (taskp)
        taskp->rethrow_error();
}


template<class T>
void
Channel<T>::Write_awaitable::dequeue(Task::Promise* tp, Channel_size fired)
{
    if (fired == none)
        chanp->dequeue_write(tp);
}


/*
    Channel
*/
template<class T>
inline
Channel<T>::Channel(Impl_ptr p)
    : pimpl{std::move(p)}
{
}


template<class T>
inline Channel_size
Channel<T>::capacity() const
{
    return pimpl->capacity();
}


template<class T>
inline void
Channel<T>::close() const
{
    pimpl->close();
}


template<class T>
inline bool
Channel<T>::dequeue_select(Task::Promise* taskp, Channel_size pos) const
{
    return pimpl->dequeue_select(taskp, pos);
}


template<class T>
inline void
Channel<T>::enqueue_select(Task::Promise* taskp, Channel_size pos) const
{
    pimpl->enqueue_select(taskp, pos);
}


template<class T>
inline bool
Channel<T>::is_closed() const
{
    return pimpl->is_closed();
}


template<class T>
inline bool
Channel<T>::is_empty() const
{
    return pimpl->is_empty();
}


template<class T>
inline bool
Channel<T>::is_full() const
{
    return pimpl->is_full();
}


template<class T>
inline bool
Channel<T>::is_readable() const
{
    return pimpl->is_readable();
}


template<class T>
inline bool
Channel<T>::is_writable() const
{
    return pimpl->is_writable();
}


template<class T>
inline
Channel<T>::operator bool() const
{
    return pimpl ? true : false;
}


template<class T>
inline typename Channel<T>::Read_awaitable
Channel<T>::read() const
{
    return Read_awaitable{pimpl.get()};
}


template<class T>
inline Channel_size
Channel<T>::size() const
{
    return pimpl->size();
}


template<class T>
inline optional<T>
Channel<T>::try_read() const
{
    optional<T> value;

    pimpl->read(&value);
    return value;
}


template<class T>
inline bool
Channel<T>::try_write(const T& x) const
{
    T value(x);

    return pimpl->write(&value);
}


template<class T>
inline bool
Channel<T>::try_write(T&& x) const
{
    return pimpl->write(&x);
}


template<class T>
inline bool
Channel<T>::will_block() const
{
    return pimpl->will_block();
}


template<class T>
inline typename Channel<T>::Write_awaitable
Channel<T>::write(const T& x) const
{
    return Write_awaitable{pimpl.get(), T(x)};
}


template<class T>
inline typename Channel<T>::Write_awaitable
Channel<T>::write(T&& x) const
{
    return Write_awaitable{pimpl.get(), std::move(x)};
}


/*
    Make Channel
*/
template<class T>
Channel<T>
make_channel(Channel_size capacity)
{
    using Impl = typename Channel<T>::Impl;

    if (capacity < 0)
        throw Invalid_argument_error("negative channel capacity");

    return Channel<T>{std::make_shared<Impl>(capacity)};
}


/*
    Read Channel
*/
template<class T>
inline
Read_channel<T>::Read_channel(const Channel<T>& chan)
    : pimpl{chan.pimpl}
{
}


template<class T>
inline Channel_size
Read_channel<T>::capacity() const
{
    return pimpl->capacity();
}


template<class T>
inline void
Read_channel<T>::close() const
{
    pimpl->close();
}


template<class T>
inline bool
Read_channel<T>::dequeue_select(Task::Promise* taskp, Channel_size pos) const
{
    return pimpl->dequeue_select(taskp, pos);
}


template<class T>
inline void
Read_channel<T>::enqueue_select(Task::Promise* taskp, Channel_size pos) const
{
    pimpl->enqueue_select(taskp, pos);
}


template<class T>
inline bool
Read_channel<T>::is_closed() const
{
    return pimpl->is_closed();
}


template<class T>
inline bool
Read_channel<T>::is_empty() const
{
    return pimpl->is_empty();
}


template<class T>
inline bool
Read_channel<T>::is_full() const
{
    return pimpl->is_full();
}


template<class T>
inline bool
Read_channel<T>::is_readable() const
{
    return pimpl->is_readable();
}


template<class T>
inline
Read_channel<T>::operator bool() const
{
    return pimpl ? true : false;
}


template<class T>
inline typename Read_channel<T>::Read_awaitable
Read_channel<T>::read() const
{
    return Read_awaitable{pimpl.get()};
}


template<class T>
inline Channel_size
Read_channel<T>::size() const
{
    return pimpl->size();
}


template<class T>
inline optional<T>
Read_channel<T>::try_read() const
{
    optional<T> value;

    pimpl->read(&value);
    return value;
}


template<class T>
inline bool
Read_channel<T>::will_block() const
{
    return pimpl->will_block();
}


/*
    Write Channel
*/
template<class T>
inline
Write_channel<T>::Write_channel(const Channel<T>& chan)
    : pimpl{chan.pimpl}
{
}


template<class T>
inline Channel_size
Write_channel<T>::capacity() const
{
    return pimpl->capacity();
}


template<class T>
inline void
Write_channel<T>::close() const
{
    pimpl->close();
}


template<class T>
inline bool
Write_channel<T>::is_closed() const
{
    return pimpl->is_closed();
}


template<class T>
inline bool
Write_channel<T>::is_empty() const
{
    return pimpl->is_empty();
}


template<class T>
inline bool
Write_channel<T>::is_full() const
{
    return pimpl->is_full();
}


template<class T>
inline bool
Write_channel<T>::is_writable() const
{
    return pimpl->is_writable();
}


template<class T>
inline
Write_channel<T>::operator bool() const
{
    return pimpl ? true : false;
}


template<class T>
inline Channel_size
Write_channel<T>::size() const
{
    return pimpl->size();
}


template<class T>
inline bool
Write_channel<T>::try_write(const T& x) const
{
    T value(x);

    return pimpl->write(&value);
}


template<class T>
inline bool
Write_channel<T>::try_write(T&& x) const
{
    return pimpl->write(&x);
}


template<class T>
inline typename Write_channel<T>::Write_awaitable
Write_channel<T>::write(const T& x) const
{
    return Write_awaitable{pimpl.get(), T(x)};
}


template<class T>
inline typename Write_channel<T>::Write_awaitable
Write_channel<T>::write(T&& x) const
{
    return Write_awaitable{pimpl.get(), std::move(x)};
}


/*
    Work Result
*/
template<class R>
template<class F>
inline void
Work_result<R>::assign(F& fun)
{
    value = fun();
}


template<class R>
inline R
Work_result<R>::get()
{
    return std::move(*value);
}


template<class F>
inline void
Work_result<void>::assign(F& fun)
{
    fun();
}


inline void
Work_result<void>::get()
{
}


/*
    Work Awaitable
*/
template<class R>
template<class Fun>
inline
Work_awaitable<R>::Work_awaitable(Fun fun)
    : workp{std::make_shared<Work>()}
{
    workp->fun = std::move(fun);
}


template<class R>
inline bool
Work_awaitable<R>::await_ready() const
{
    return false;
}


template<class R>
bool
Work_awaitable<R>::await_suspend(Task::Handle h)
{
    taskp = &h.promise();
    if (taskp->deliver_cancel())
        return false;

    const std::shared_ptr<Work> wp = workp;

    taskp->scheduler()->submit_work(
        [wp]() { wp->run(); },
        [wp]() { wp->complete(); }
    );
    wp->taskp = taskp;
    taskp->suspend(Task::State::suspended_work, this);
    return true;
}


template<class R>
R
Work_awaitable<R>::await_resume()
{
    if (taskp)
        taskp->rethrow_error();

    if (workp->error)
        std::rethrow_exception(workp->error);

    return workp->result.get();
}


template<class R>
void
Work_awaitable<R>::dequeue(Task::Promise*, Channel_size fired)
{
    // The worker runs to completion regardless; drop interest in its result.
    if (fired == none)
        workp->taskp = nullptr;
}


template<class R>
void
Work_awaitable<R>::Work::complete()
{
    Task::Promise* const tp = taskp;

    taskp = nullptr;
    if (tp)
        tp->notify_complete();
}


template<class R>
void
Work_awaitable<R>::Work::run()
{
    try {
        result.assign(fun);
    } catch (...) {
        error = std::current_exception();
    }
}


/*
    Blocking Calls
*/
template<class Fun>
inline Work_awaitable<std::invoke_result_t<Fun&>>
blocking_call(Fun fun)
{
    return Work_awaitable<std::invoke_result_t<Fun&>>{std::move(fun)};
}


/*
    Scheduler
*/
inline std::size_t
Scheduler::size() const
{
    return tasks.size();
}


inline bool
Scheduler::is_running() const
{
    return isrunning;
}


inline Scheduler::Multiplexer&
Scheduler::multiplexer()
{
    return mux;
}


}   // Coroutine
}   // Coloop

#endif  // COLOOP_COROUTINE_TASK_INL

//  $CUSTOM_FOOTER$
