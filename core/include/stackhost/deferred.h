#pragma once

// Deferred: a single-assignment result bound to one scheduler.
//
// Settlement callbacks never run inline; they are queued on the owning
// scheduler, so a callback always observes a fully settled value.

#include "stackhost/errors.h"
#include "stackhost/scheduler.h"

#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace stackhost {

class Deferred : public std::enable_shared_from_this<Deferred> {
public:
    using Callback = std::function<void(const Deferred&)>;

    explicit Deferred(IScheduler& loop) : loop_(&loop) {}

    Deferred(const Deferred&) = delete;
    Deferred& operator=(const Deferred&) = delete;

    bool done() const { return state_ != State::PENDING; }
    bool failed() const { return state_ == State::FAILED; }

    // Returns the resolved value. Rethrows the stored error if the deferred
    // failed; throws SchedulerError if it is still pending.
    const std::string& value() const {
        if (state_ == State::PENDING) throw SchedulerError("deferred result is not ready");
        if (state_ == State::FAILED) std::rethrow_exception(error_);
        return value_;
    }

    std::exception_ptr error() const { return error_; }

    void resolve(std::string value) {
        settle_check();
        value_ = std::move(value);
        state_ = State::RESOLVED;
        flush_callbacks();
    }

    void reject(std::exception_ptr err) {
        settle_check();
        error_ = err;
        state_ = State::FAILED;
        flush_callbacks();
    }

    void on_settled(Callback cb) {
        if (done()) {
            schedule(std::move(cb));
            return;
        }
        callbacks_.push_back(std::move(cb));
    }

    IScheduler& scheduler() const { return *loop_; }

private:
    enum class State { PENDING, RESOLVED, FAILED };

    void settle_check() const {
        if (state_ != State::PENDING) throw SchedulerError("deferred already settled");
    }

    void schedule(Callback cb) {
        auto self = shared_from_this();
        loop_->call_soon([self, cb = std::move(cb)]() { cb(*self); });
    }

    void flush_callbacks() {
        std::vector<Callback> cbs;
        cbs.swap(callbacks_);
        for (auto& cb : cbs) schedule(std::move(cb));
    }

    IScheduler* loop_;
    State state_{State::PENDING};
    std::string value_;
    std::exception_ptr error_;
    std::vector<Callback> callbacks_;
};

using DeferredPtr = std::shared_ptr<Deferred>;

inline DeferredPtr make_deferred(IScheduler& loop) {
    return std::make_shared<Deferred>(loop);
}

} // namespace stackhost
