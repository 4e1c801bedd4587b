#pragma once

#include "stackhost/deferred.h"
#include "stackhost/scheduler.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <queue>
#include <vector>

namespace stackhost {

// Single-threaded cooperative event loop.
// - call_soon: FIFO ready queue, run in batches (callbacks queued during a
//   batch run on the next turn)
// - call_later: timer heap ordered by due time, then insertion order
// - call_soon_threadsafe: mutex-guarded inbox, wakes an idle loop
//
// Internal diagnostics go to the "stackhost.scheduler" log channel.
class EventLoop final : public IScheduler {
public:
    EventLoop() = default;
    ~EventLoop() override;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void call_soon(Callback fn) override;
    void call_later(int64_t delay_ms, Callback fn) override;
    void call_soon_threadsafe(Callback fn) override;
    void retain() override;
    void release() override;
    bool is_closed() const override { return closed_; }

    // Drives the loop until fut settles. Does not rethrow fut's error; the
    // caller inspects fut afterwards. Throws SchedulerError if the loop is
    // closed, already running, or runs out of work while fut is pending.
    void run_until_complete(const DeferredPtr& fut);

    bool is_running() const { return running_; }

    // Drops pending work and marks the loop closed. Idempotent.
    // Throws SchedulerError if called from inside run_until_complete.
    void close();

    // Ready callbacks + timers + threadsafe inbox.
    size_t pending_callbacks() const;

private:
    using Clock = std::chrono::steady_clock;

    struct Timer {
        Clock::time_point due;
        uint64_t seq{0};
        Callback fn;
    };

    struct TimerCmp {
        bool operator()(const Timer& a, const Timer& b) const {
            // std::priority_queue pops the "largest" element; invert so the earliest due comes first.
            if (a.due != b.due) return a.due > b.due;
            return a.seq > b.seq;
        }
    };

    void ensure_open(const char* op) const;
    void drain_inbox();
    void promote_due_timers();
    void run_ready_batch();
    void invoke(Callback& fn);

    std::deque<Callback> ready_;
    std::priority_queue<Timer, std::vector<Timer>, TimerCmp> timers_;
    uint64_t timer_seq_{0};

    mutable std::mutex inbox_mu_;
    std::condition_variable inbox_cv_;
    std::deque<Callback> inbox_;
    std::atomic<int> external_{0};

    bool running_{false};
    bool closed_{false};
};

// Returns the loop bound to the calling thread, creating and installing one
// if none exists yet. Never throws for a missing loop; creates at most one
// loop per thread.
EventLoop& acquire_event_loop();

// The loop bound to the calling thread, or nullptr.
EventLoop* current_event_loop();

} // namespace stackhost
