//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  src/coloop/coroutine/scheduler.cpp
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
#include <iostream>


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
    Scheduler Run Guard
*/
Scheduler::Run_guard::Run_guard(bool* flagp)
    : isrunningp{flagp}
{
    if (*isrunningp)
        throw Usage_error("scheduler is already running");

    *isrunningp = true;
}


Scheduler::Run_guard::~Run_guard()
{
    *isrunningp = false;
}


/*
    Scheduler Timers Alarm Queue
*/
template<class T>
bool
Scheduler::Timers::Alarm_queue::erase(const T& id)
{
    const auto p = std::find_if(alarms.begin(), alarms.end(), id_eq(id));

    if (p == alarms.end())
        return false;

    alarms.erase(p);
    return true;
}


inline Scheduler::Timers::Alarm_queue::Task_eq
Scheduler::Timers::Alarm_queue::id_eq(Task::Promise* taskp)
{
    return Task_eq{taskp};
}


inline Scheduler::Timers::Alarm_queue::Channel_eq
Scheduler::Timers::Alarm_queue::id_eq(const Time_channel& chan)
{
    return Channel_eq{chan};
}


inline bool
Scheduler::Timers::Alarm_queue::is_empty() const
{
    return alarms.empty();
}


template<class T>
bool
Scheduler::Timers::Alarm_queue::is_found(const T& id) const
{
    return std::any_of(alarms.begin(), alarms.end(), id_eq(id));
}


inline Time
Scheduler::Timers::Alarm_queue::next_expiry() const
{
    return alarms.front().time;
}


inline Scheduler::Timers::Alarm
Scheduler::Timers::Alarm_queue::pop()
{
    Alarm a = std::move(alarms.front());

    alarms.pop_front();
    return a;
}


void
Scheduler::Timers::Alarm_queue::push(const Alarm& a)
{
    const auto p = std::upper_bound(alarms.begin(), alarms.end(), a);
    alarms.insert(p, a);
}


/*
    Scheduler Timers
*/
bool
Scheduler::Timers::cancel(Task::Promise* taskp)
{
    return alarmq.erase(taskp);
}


void
Scheduler::Timers::expire(Time now)
{
    while (!alarmq.is_empty() && alarmq.next_expiry() <= now)
        signal(alarmq.pop(), now);
}


bool
Scheduler::Timers::is_empty() const
{
    return alarmq.is_empty();
}


bool
Scheduler::Timers::is_pending(const Time_channel& chan) const
{
    return alarmq.is_found(chan);
}


optional<Time>
Scheduler::Timers::next_expiry() const
{
    optional<Time> expiry;

    if (!alarmq.is_empty())
        expiry = alarmq.next_expiry();

    return expiry;
}


void
Scheduler::Timers::signal(const Alarm& alarm, Time now)
{
    if (alarm.taskp)
        alarm.taskp->notify_timer_expired();
    else
        alarm.channel.try_write(now);
}


void
Scheduler::Timers::start(Task::Promise* taskp, Time expiry)
{
    alarmq.push(Alarm{taskp, expiry});
}


void
Scheduler::Timers::start(const Time_channel& chan, Time expiry)
{
    alarmq.push(Alarm{chan, expiry});
}


bool
Scheduler::Timers::stop(const Time_channel& chan)
{
    return alarmq.erase(chan);
}


/*
    Scheduler Completion Queue
*/
std::deque<Scheduler::Completion_function>
Scheduler::Completion_queue::pop_all()
{
    std::deque<Completion_function> ready;
    const Lock                      lock{mutex};

    ready.swap(completions);
    return ready;
}


void
Scheduler::Completion_queue::push(Completion_function done)
{
    const Lock lock{mutex};

    completions.push_back(std::move(done));
}


/*
    Scheduler Worker Pool
*/
Scheduler::Worker_pool::Worker_pool(int n)
    : nthreads{n}
{
    assert(n > 0);
}


Scheduler::Worker_pool::~Worker_pool()
{
    {
        const Lock lock{mutex};
        is_interrupt = true;
    }

    ready.notify_all();
    for (Thread& t : threads)
        t.join();
}


Scheduler::Work_function
Scheduler::Worker_pool::pop()
{
    Work_function   job;
    Lock            lock{mutex};

    while (jobs.empty() && !is_interrupt)
        ready.wait(lock);

    if (!is_interrupt) {
        job = std::move(jobs.front());
        jobs.pop_front();
    }

    return job;
}


void
Scheduler::Worker_pool::run_thread()
{
    while (Work_function job = pop())
        job();
}


void
Scheduler::Worker_pool::start(const Lock&)
{
    threads.reserve(nthreads);
    for (int i = 0; i < nthreads; ++i)
        threads.emplace_back([this]() { run_thread(); });
}


void
Scheduler::Worker_pool::submit(Work_function job)
{
    const Lock lock{mutex};

    if (threads.empty())
        start(lock);

    jobs.push_back(std::move(job));
    ready.notify_one();
}


/*
    Scheduler
*/
Scheduler::Scheduler(int nworkers, int maxevents)
    : mux{maxevents}
    , failhandler{std::make_shared<Task::Failure_handler>(&report_failure)}
    , workers{nworkers > 0 ? nworkers : std::max(1, static_cast<int>(Thread::hardware_concurrency()))}
{
}


Scheduler::~Scheduler()
{
    Task_table frames;

    for (auto& entry : tasks)
        entry.first->abandon();

    // Frame destructors may close descriptors or stop timers.
    frames.swap(tasks);
    readyq.clear();
}


bool
Scheduler::cancel(const Task_handle& h)
{
    if (!h)
        throw Usage_error("cancel of an empty task handle");

    Task::Promise* const taskp = h.ctrl->task();

    if (!taskp)
        return false;

    if (h.ctrl->scheduler() != this)
        throw Usage_error("task belongs to another scheduler");

    return taskp->cancel();
}


void
Scheduler::cancel_timer(Task::Promise* taskp)
{
    timers.cancel(taskp);
}


void
Scheduler::dispatch(optional<Duration> maxwait)
{
    for (const Multiplexer::Event& event : mux.poll(maxwait))
        event.taskp->notify_complete(event.pos);

    timers.expire(Clock::now());

    for (Completion_function& done : completions.pop_all()) {
        --nworking;
        done();
    }
}


void
Scheduler::finish(Task::Promise* taskp, exception_ptr ep)
{
    const Task::Control_ptr ctrl = taskp->control();
    const auto              p    = tasks.find(taskp);
    const Task              task{std::move(p->second)};

    tasks.erase(p);
    ctrl->finish(ep);
}


bool
Scheduler::is_deadlocked() const
{
    return readyq.empty() && mux.is_empty() && timers.is_empty() && nworking == 0;
}


bool
Scheduler::is_timer_pending(const Time_channel& chan) const
{
    return timers.is_pending(chan);
}


std::size_t
Scheduler::poll()
{
    const Run_guard     guard{&isrunning};
    const std::size_t   n = run_ready();

    dispatch(Duration::zero());
    return n;
}


void
Scheduler::report_failure(Task_id id, exception_ptr ep)
{
    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        std::cerr << "coloop: task " << id << " failed: " << e.what() << '\n';
    } catch (...) {
        std::cerr << "coloop: task " << id << " failed: unknown exception\n";
    }
}


bool
Scheduler::reset_timer(const Time_channel& chan, Duration d)
{
    const bool ispending = timers.stop(chan);

    // Discard an expiry nobody read.
    chan.try_read();

    timers.start(chan, Clock::now() + d);
    return ispending;
}


void
Scheduler::resume(Task::Promise* taskp)
{
    Task& task = tasks.at(taskp);

    if (!taskp->is_started() && taskp->is_cancel_pending()) {
        finish(taskp, make_exception_ptr(Cancelled_error()));
        return;
    }

    taskp->make_running();
    task.resume();
    if (task.is_done())
        finish(taskp, taskp->failure());
}


void
Scheduler::run()
{
    const Run_guard guard{&isrunning};

    while (!tasks.empty()) {
        run_ready();
        if (tasks.empty())
            break;

        if (is_deadlocked())
            throw Usage_error("deadlock: no task can be woken");

        dispatch(wait_time());
    }
}


/*
    Run the tasks that were ready at the start of the turn.  Tasks made
    ready while these run wait for the next turn.
*/
std::size_t
Scheduler::run_ready()
{
    const std::size_t n = readyq.size();

    for (std::size_t i = 0; i < n; ++i) {
        Task::Promise* const taskp = readyq.front();
        readyq.pop_front();
        resume(taskp);
    }

    return n;
}


void
Scheduler::schedule(Task::Promise* taskp)
{
    taskp->control()->update(Task::State::ready);
    readyq.push_back(taskp);
}


void
Scheduler::set_failure_handler(Task::Failure_handler handler)
{
    *failhandler = std::move(handler);
}


Task_handle
Scheduler::spawn(Task task)
{
    if (!task)
        throw Usage_error("spawn of an empty task");

    Task::Promise&          promise = task.handle().promise();
    const Task::Control_ptr ctrl    = std::make_shared<Task::Control>(nextid++, failhandler);

    promise.bind(this, ctrl);
    ctrl->bind(this, &promise);
    tasks.emplace(&promise, std::move(task));
    schedule(&promise);
    return Task_handle{ctrl};
}


void
Scheduler::start_timer(Task::Promise* taskp, Duration d)
{
    timers.start(taskp, Clock::now() + d);
}


void
Scheduler::start_timer(const Time_channel& chan, Duration d)
{
    timers.start(chan, Clock::now() + d);
}


bool
Scheduler::stop_timer(const Time_channel& chan)
{
    return timers.stop(chan);
}


void
Scheduler::submit_work(Work_function work, Completion_function done)
{
    Multiplexer* const      muxp    = &mux;
    Completion_queue* const queuep  = &completions;

    workers.submit([muxp, queuep, work = std::move(work), done = std::move(done)]() {
        work();
        queuep->push(done);
        muxp->interrupt();
    });
    ++nworking;
}


optional<Duration>
Scheduler::wait_time() const
{
    using std::chrono::duration_cast;

    optional<Duration> maxwait;

    if (!readyq.empty())
        maxwait = Duration::zero();
    else if (const optional<Time> expiry = timers.next_expiry()) {
        const Time now = Clock::now();
        maxwait = (*expiry > now) ? duration_cast<Duration>(*expiry - now) : Duration::zero();
    }

    return maxwait;
}


/*
    Timer
*/
Timer::Timer(Scheduler& sched, Duration d)
    : schedp{&sched}
    , chan{is_valid(d) ? make_timer(&sched, d) : Time_channel()}
{
}


Timer::Timer(Timer&& other)
    : schedp{other.schedp}
    , chan{std::move(other.chan)}
{
    other.schedp = nullptr;
    other.chan = Time_channel();
}


Timer&
Timer::operator=(Timer&& other)
{
    Timer temp{std::move(other)};

    swap(*this, temp);
    return *this;
}


Timer::~Timer()
{
    stop();
}


bool
Timer::dequeue_select(Task::Promise* taskp, Channel_size pos) const
{
    return chan ? chan.dequeue_select(taskp, pos) : false;
}


void
Timer::enqueue_select(Task::Promise* taskp, Channel_size pos) const
{
    if (!chan)
        throw Usage_error("select on an invalid timer");

    chan.enqueue_select(taskp, pos);
}


bool
Timer::is_active() const
{
    return chan && schedp->is_timer_pending(chan);
}


bool
Timer::is_ready() const
{
    return chan && !chan.is_empty();
}


bool
Timer::is_valid(Duration d)
{
    return d >= Duration::zero();
}


Time_channel
Timer::make_timer(Scheduler* schedp, Duration d)
{
    const Time_channel chan = make_channel<Time>(1);

    schedp->start_timer(chan, d);
    return chan;
}


Timer::operator bool() const
{
    return chan ? true : false;
}


Timer::Read_awaitable
Timer::read() const
{
    if (!chan)
        throw Usage_error("read of an invalid timer");

    return chan.read();
}


bool
Timer::reset(Duration d)
{
    if (!schedp)
        throw Usage_error("reset of a timer with no scheduler");

    if (!is_valid(d))
        return stop();

    if (!chan) {
        chan = make_timer(schedp, d);
        return false;
    }

    return schedp->reset_timer(chan, d);
}


bool
Timer::stop()
{
    return chan ? schedp->stop_timer(chan) : false;
}


optional<Time>
Timer::try_read() const
{
    return chan ? chan.try_read() : optional<Time>();
}


bool
Timer::will_block() const
{
    return chan ? chan.will_block() : true;
}


void
swap(Timer& x, Timer& y)
{
    using std::swap;

    swap(x.schedp, y.schedp);
    swap(x.chan, y.chan);
}


bool
operator==(const Timer& x, const Timer& y)
{
    return x.chan == y.chan;
}


bool
operator< (const Timer& x, const Timer& y)
{
    return x.chan < y.chan;
}


}   // Coroutine
}   // Coloop

//  $CUSTOM_FOOTER$
