#include "stackhost/event_loop.h"
#include "stackhost/errors.h"
#include "stackhost/log.h"

#include <memory>
#include <string>

namespace stackhost {

namespace {

thread_local std::unique_ptr<EventLoop> t_loop;

LogChannel& sched_log() {
    static LogChannel& ch = log_channel("stackhost.scheduler");
    return ch;
}

} // namespace

EventLoop::~EventLoop() {
    // Callbacks may capture objects owned by other libraries; drop them here
    // rather than at thread exit.
    ready_.clear();
    while (!timers_.empty()) timers_.pop();
    std::lock_guard<std::mutex> lk(inbox_mu_);
    inbox_.clear();
}

void EventLoop::ensure_open(const char* op) const {
    if (closed_) throw SchedulerError(std::string(op) + ": event loop is closed");
}

void EventLoop::call_soon(Callback fn) {
    ensure_open("call_soon");
    ready_.push_back(std::move(fn));
}

void EventLoop::call_later(int64_t delay_ms, Callback fn) {
    ensure_open("call_later");
    if (delay_ms < 0) delay_ms = 0;
    timers_.push(Timer{Clock::now() + std::chrono::milliseconds(delay_ms), timer_seq_++, std::move(fn)});
}

void EventLoop::call_soon_threadsafe(Callback fn) {
    {
        std::lock_guard<std::mutex> lk(inbox_mu_);
        ensure_open("call_soon_threadsafe");
        inbox_.push_back(std::move(fn));
    }
    inbox_cv_.notify_one();
}

void EventLoop::retain() {
    external_.fetch_add(1);
}

void EventLoop::release() {
    {
        std::lock_guard<std::mutex> lk(inbox_mu_);
        if (external_.load() > 0) external_.fetch_sub(1);
    }
    inbox_cv_.notify_one();
}

void EventLoop::drain_inbox() {
    std::lock_guard<std::mutex> lk(inbox_mu_);
    while (!inbox_.empty()) {
        ready_.push_back(std::move(inbox_.front()));
        inbox_.pop_front();
    }
}

void EventLoop::promote_due_timers() {
    const auto now = Clock::now();
    while (!timers_.empty() && timers_.top().due <= now) {
        ready_.push_back(timers_.top().fn);  // copy (const ref from priority_queue::top)
        timers_.pop();
    }
}

void EventLoop::invoke(Callback& fn) {
    // A throwing callback must not take the loop down with it; the failure
    // is reported on the scheduler's own channel and the loop keeps going.
    try {
        fn();
    } catch (const std::exception& e) {
        sched_log().error(std::string("exception in scheduled callback: ") + e.what());
    } catch (...) {
        sched_log().error("non-standard exception in scheduled callback");
    }
}

void EventLoop::run_ready_batch() {
    size_t n = ready_.size();
    for (size_t i = 0; i < n && !ready_.empty(); i++) {
        Callback fn = std::move(ready_.front());
        ready_.pop_front();
        invoke(fn);
    }
}

void EventLoop::run_until_complete(const DeferredPtr& fut) {
    ensure_open("run_until_complete");
    if (running_) throw SchedulerError("run_until_complete: event loop is already running");
    if (!fut) throw SchedulerError("run_until_complete: null deferred");

    struct RunningScope {
        bool& flag;
        explicit RunningScope(bool& f) : flag(f) { flag = true; }
        ~RunningScope() { flag = false; }
    } scope(running_);

    while (!fut->done()) {
        drain_inbox();
        promote_due_timers();

        if (!ready_.empty()) {
            run_ready_batch();
            continue;
        }

        std::unique_lock<std::mutex> lk(inbox_mu_);
        if (!inbox_.empty()) continue;

        if (!timers_.empty()) {
            inbox_cv_.wait_until(lk, timers_.top().due, [&] { return !inbox_.empty(); });
            continue;
        }

        if (external_.load() > 0) {
            inbox_cv_.wait(lk, [&] { return !inbox_.empty() || external_.load() == 0; });
            continue;
        }

        throw SchedulerError("event loop ran out of work before the awaited operation settled");
    }
}

void EventLoop::close() {
    if (running_) throw SchedulerError("close: cannot close a running event loop");
    if (closed_) return;

    size_t pending = pending_callbacks();
    if (pending > 0) {
        sched_log().warning("closing event loop with " + std::to_string(pending) + " pending callbacks");
    }
    if (external_.load() > 0) {
        sched_log().warning("closing event loop with " + std::to_string(external_.load())
                            + " unfinished external operations");
    }

    ready_.clear();
    while (!timers_.empty()) timers_.pop();
    {
        std::lock_guard<std::mutex> lk(inbox_mu_);
        inbox_.clear();
        closed_ = true;
    }
}

size_t EventLoop::pending_callbacks() const {
    std::lock_guard<std::mutex> lk(inbox_mu_);
    return ready_.size() + timers_.size() + inbox_.size();
}

EventLoop& acquire_event_loop() {
    if (!t_loop) t_loop = std::make_unique<EventLoop>();
    return *t_loop;
}

EventLoop* current_event_loop() {
    return t_loop.get();
}

} // namespace stackhost
