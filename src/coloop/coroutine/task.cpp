//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  src/coloop/coroutine/task.cpp
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


/*
    Coloop Coroutine Library
*/
namespace Coloop    {
namespace Coroutine {


/*
    Names/Types
*/
using std::make_exception_ptr;


/*
    Task Wait
*/
void
Task::Wait::expire(Promise* taskp)
{
    taskp->notify_error(make_exception_ptr(Timeout_error()), none);
}


/*
    Task Control
*/
Task::Control::Control(Task_id id, Failure_handler_ptr handlerp)
    : taskid{id}
    , reportp{std::move(handlerp)}
{
}


/*
    Reports a failure nobody observed, unless the task was cancelled.
*/
Task::Control::~Control()
{
    if (failure && !isobserved && reportp && *reportp && !is_cancellation(failure))
        (*reportp)(taskid, failure);
}


void
Task::Control::bind(Scheduler* sp, Promise* tp)
{
    schedp  = sp;
    taskp   = tp;
}


bool
Task::Control::dequeue_joiner(Promise* joinerp)
{
    const auto p = std::find(joiners.begin(), joiners.end(), joinerp);

    if (p == joiners.end())
        return false;

    joiners.erase(p);
    return true;
}


void
Task::Control::enqueue_joiner(Promise* joinerp)
{
    joiners.push_back(joinerp);
}


void
Task::Control::finish(exception_ptr ep)
{
    taskstate   = ep ? State::failed : State::finished;
    failure     = ep;
    taskp       = nullptr;

    while (!joiners.empty()) {
        Promise* const joinerp = joiners.front();
        joiners.pop_front();
        joinerp->notify_complete();
    }
}


bool
Task::Control::is_cancellation(exception_ptr ep)
{
    try {
        std::rethrow_exception(ep);
    } catch (const Cancelled_error&) {
        return true;
    } catch (...) {
        return false;
    }
}


exception_ptr
Task::Control::observe()
{
    isobserved = true;
    return failure;
}


void
Task::Control::release()
{
    taskp   = nullptr;
    schedp  = nullptr;
    joiners.clear();
}


/*
    Task Promise
*/
void
Task::Promise::abandon()
{
    if (waitp) {
        Wait* const wp = waitp;
        waitp = nullptr;
        wp->dequeue(this, Wait::none);
    }

    if (istimer) {
        schedp->cancel_timer(this);
        istimer = false;
    }

    ctrl->release();
}


void
Task::Promise::bind(Scheduler* sp, Control_ptr cp)
{
    schedp  = sp;
    ctrl    = std::move(cp);
}


bool
Task::Promise::cancel()
{
    if (waitp)
        notify_error(make_exception_ptr(Cancelled_error()), Wait::none);
    else
        iscancel = true;

    return true;
}


/*
    Convert a pending cancellation into the error that resumes the task,
    returning true if the task should not suspend.
*/
bool
Task::Promise::deliver_cancel()
{
    if (!iscancel)
        return false;

    iscancel = false;
    wakeerr = make_exception_ptr(Cancelled_error());
    return true;
}


void
Task::Promise::make_running()
{
    isstarted = true;
    ctrl->update(State::running);
}


void
Task::Promise::notify_complete(Channel_size pos)
{
    if (!waitp)
        return;

    Wait* const wp = waitp;

    waitp = nullptr;
    wp->dequeue(this, pos);

    // The wait renewed itself.
    if (waitp)
        return;

    selpos = pos;
    wake();
}


void
Task::Promise::notify_error(exception_ptr ep, Channel_size fired)
{
    if (!waitp)
        return;

    Wait* const wp = waitp;

    waitp = nullptr;
    wp->dequeue(this, fired);
    wakeerr = ep;
    wake();
}


void
Task::Promise::notify_timer_expired()
{
    istimer = false;
    if (waitp)
        waitp->expire(this);
}


void
Task::Promise::rethrow_error()
{
    if (wakeerr) {
        const exception_ptr ep = wakeerr;
        wakeerr = nullptr;
        std::rethrow_exception(ep);
    }
}


void
Task::Promise::rethrow_if_cancelled()
{
    rethrow_error();

    if (iscancel) {
        iscancel = false;
        throw Cancelled_error();
    }
}


void
Task::Promise::start_timer(Duration d)
{
    schedp->start_timer(this, d);
    istimer = true;
}


void
Task::Promise::suspend(State s, Wait* wp)
{
    waitp = wp;
    ctrl->update(s);
}


void
Task::Promise::wake()
{
    if (istimer) {
        schedp->cancel_timer(this);
        istimer = false;
    }

    schedp->schedule(this);
}


/*
    Task Handle
*/
bool
Task_handle::cancel() const
{
    if (!ctrl)
        throw Usage_error("cancel of an empty task handle");

    // Only a live task is guaranteed a live Scheduler.
    if (!ctrl->task())
        return false;

    return ctrl->scheduler()->cancel(*this);
}


exception_ptr
Task_handle::exception() const
{
    return ctrl->observe();
}


/*
    Task Handle Join Awaitable
*/
bool
Task_handle::Join_awaitable::await_suspend(Task::Handle h)
{
    taskp = &h.promise();

    if (ctrl->task() == taskp)
        throw Usage_error("a task cannot join itself");

    if (taskp->deliver_cancel())
        return false;

    ctrl->enqueue_joiner(taskp);
    taskp->suspend(Task::State::suspended_task, this);
    return true;
}


void
Task_handle::Join_awaitable::await_resume()
{
    if (taskp)
        taskp->rethrow_error();

    const exception_ptr ep = ctrl->observe();

    if (ep)
        std::rethrow_exception(ep);
}


void
Task_handle::Join_awaitable::dequeue(Task::Promise* tp, Channel_size fired)
{
    if (fired == none)
        ctrl->dequeue_joiner(tp);
}


/*
    Select Awaitable
*/
Select_awaitable::Select_awaitable(Selectable_vector ss)
    : selectables{std::move(ss)}
{
    if (selectables.empty())
        throw Usage_error("select over an empty set");
}


bool
Select_awaitable::await_ready()
{
    winner = try_select(selectables);
    return winner ? true : false;
}


bool
Select_awaitable::await_suspend(Task::Handle h)
{
    const Channel_size n = static_cast<Channel_size>(selectables.size());
    Channel_size i = 0;

    taskp = &h.promise();
    if (taskp->deliver_cancel())
        return false;

    try {
        for (; i < n; ++i)
            selectables[i]->enqueue_select(taskp, i);
    } catch (...) {
        while (i-- > 0)
            selectables[i]->dequeue_select(taskp, i);
        throw;
    }

    taskp->suspend(Task::State::suspended_select, this);
    return true;
}


Channel_size
Select_awaitable::await_resume()
{
    if (winner)
        return *winner;

    taskp->rethrow_error();
    return taskp->selected();
}


/*
    The fired registration is already gone from its selectable, but it is
    offered to every member so each can drop its own record of the wait.
*/
void
Select_awaitable::dequeue(Task::Promise* tp, Channel_size)
{
    const Channel_size n = static_cast<Channel_size>(selectables.size());

    for (Channel_size i = 0; i < n; ++i)
        selectables[i]->dequeue_select(tp, i);
}


/*
    Selection
*/
Select_awaitable
select(std::initializer_list<const Selectable*> ss)
{
    return Select_awaitable{Select_awaitable::Selectable_vector(ss)};
}


Select_awaitable
select(std::vector<const Selectable*> ss)
{
    return Select_awaitable{std::move(ss)};
}


optional<Channel_size>
try_select(std::initializer_list<const Selectable*> ss)
{
    return try_select(std::vector<const Selectable*>(ss));
}


optional<Channel_size>
try_select(const std::vector<const Selectable*>& ss)
{
    const Channel_size n = static_cast<Channel_size>(ss.size());

    if (n == 0)
        throw Usage_error("select over an empty set");

    for (Channel_size i = 0; i < n; ++i) {
        if (!ss[i]->will_block())
            return i;
    }

    return boost::none;
}


/*
    Channel Base
*/
bool
Channel_base::dequeue_select(Task::Promise* taskp, Channel_size pos)
{
    const auto p = std::find_if(selectors.begin(), selectors.end(), [=](const Selector& s) {
        return s.taskp == taskp && s.pos == pos;
    });

    if (p == selectors.end())
        return false;

    selectors.erase(p);
    return true;
}


void
Channel_base::enqueue_select(Task::Promise* taskp, Channel_size pos)
{
    selectors.push_back(Selector{taskp, pos});
}


void
Channel_base::notify_selector()
{
    if (!selectors.empty()) {
        const Selector s = selectors.front();
        selectors.pop_front();
        s.taskp->notify_complete(s.pos);
    }
}


void
Channel_base::notify_selectors()
{
    // Waking a selector may remove its other entries from this queue.
    while (!selectors.empty()) {
        const Selector s = selectors.front();
        selectors.pop_front();
        s.taskp->notify_complete(s.pos);
    }
}


/*
    Yield Awaitable
*/
bool
Yield_awaitable::await_ready() const
{
    return false;
}


bool
Yield_awaitable::await_suspend(Task::Handle h)
{
    taskp = &h.promise();
    if (taskp->deliver_cancel())
        return false;

    taskp->scheduler()->schedule(taskp);
    return true;
}


void
Yield_awaitable::await_resume()
{
    if (taskp)
        taskp->rethrow_if_cancelled();
}


/*
    Sleep Awaitable
*/
Sleep_awaitable::Sleep_awaitable(Duration d)
    : delay{d}
{
}


bool
Sleep_awaitable::await_ready() const
{
    return false;
}


bool
Sleep_awaitable::await_suspend(Task::Handle h)
{
    taskp = &h.promise();
    if (taskp->deliver_cancel())
        return false;

    taskp->start_timer(delay);
    taskp->suspend(Task::State::suspended_timer, this);
    return true;
}


void
Sleep_awaitable::await_resume()
{
    if (taskp)
        taskp->rethrow_error();
}


void
Sleep_awaitable::dequeue(Task::Promise*, Channel_size)
{
}


void
Sleep_awaitable::expire(Task::Promise* tp)
{
    tp->notify_complete();
}


/*
    I/O Readiness Awaitable
*/
Io_awaitable::Io_awaitable(int desc, Io_direction dir, optional<Duration> maxwait)
    : fd{desc}
    , direction{dir}
    , timeout{maxwait}
{
}


bool
Io_awaitable::await_ready() const
{
    return false;
}


bool
Io_awaitable::await_suspend(Task::Handle h)
{
    const Task::State state = (direction == Io_direction::readable)
        ? Task::State::suspended_readable
        : Task::State::suspended_writable;

    taskp = &h.promise();
    if (taskp->deliver_cancel())
        return false;

    taskp->scheduler()->multiplexer().add(fd, direction, taskp);
    if (timeout)
        taskp->start_timer(*timeout);

    taskp->suspend(state, this);
    return true;
}


void
Io_awaitable::await_resume()
{
    if (taskp)
        taskp->rethrow_error();
}


void
Io_awaitable::dequeue(Task::Promise* tp, Channel_size fired)
{
    if (fired == none)
        tp->scheduler()->multiplexer().remove(fd, direction);
}


/*
    Suspension Points
*/
Io_awaitable
readable(int fd)
{
    return Io_awaitable{fd, Io_direction::readable, boost::none};
}


Io_awaitable
readable(int fd, Duration timeout)
{
    return Io_awaitable{fd, Io_direction::readable, timeout};
}


Sleep_awaitable
sleep(Duration d)
{
    return Sleep_awaitable{d};
}


Io_awaitable
writable(int fd)
{
    return Io_awaitable{fd, Io_direction::writable, boost::none};
}


Io_awaitable
writable(int fd, Duration timeout)
{
    return Io_awaitable{fd, Io_direction::writable, timeout};
}


Yield_awaitable
yield()
{
    return Yield_awaitable{};
}


}   // Coroutine
}   // Coloop

//  $CUSTOM_FOOTER$
