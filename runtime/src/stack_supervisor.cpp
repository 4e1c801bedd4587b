#include "stack_supervisor.h"

#include "stackhost/errors.h"
#include "stackhost/log.h"

#include <utility>

namespace stackhost::runtime {

namespace {

std::string describe(std::exception_ptr err) {
    try {
        std::rethrow_exception(err);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

} // namespace

DeferredPtr StackSupervisor::run_with_stack(IScheduler& loop, std::function<void()> unit) {
    if (active_) throw SchedulerError("a stack run is already in progress");

    loop_ = &loop;
    active_ = true;
    unit_returned_ = false;
    finalizing_ = false;
    outstanding_ = 0;
    first_error_ = nullptr;
    exports_.clear();
    monitor_.attach(loop);
    result_ = make_deferred(loop);

    ResourceRequest root;
    root.type = kRootStackType;
    root.name = settings_.project + "-" + settings_.stack;
    root_urn_ = monitor_.make_urn(root.type, root.name);
    track(monitor_.register_resource(root));

    DeferredPtr result = result_;
    loop.call_soon([this, unit = std::move(unit)]() {
        try {
            unit();
        } catch (...) {
            fail(std::current_exception());
        }
        unit_returned_ = true;
        maybe_finish();
    });
    return result;
}

void StackSupervisor::track(const DeferredPtr& op) {
    if (!active_) throw SchedulerError("no stack run is active");
    outstanding_++;
    op->on_settled([this](const Deferred& d) {
        if (d.failed()) fail(d.error());
        outstanding_--;
        maybe_finish();
    });
}

void StackSupervisor::fail(std::exception_ptr err) {
    if (!err) return;
    if (!first_error_) {
        first_error_ = err;
        return;
    }
    // Derived operations re-reject with the same error; only log distinct ones.
    if (err != first_error_) {
        log_channel("stackhost.runtime").warning("additional failure during run: " + describe(err));
    }
}

void StackSupervisor::export_value(const std::string& name, const std::string& value_json) {
    if (!active_) throw SchedulerError("no stack run is active");
    exports_[name] = value_json;
}

void StackSupervisor::maybe_finish() {
    if (!active_ || !unit_returned_ || outstanding_ > 0) return;

    if (!finalizing_) {
        finalizing_ = true;
        if (!first_error_) {
            track(monitor_.register_outputs(root_urn_, exports_));
            return;
        }
    }

    active_ = false;
    DeferredPtr result = std::move(result_);
    if (first_error_) {
        result->reject(first_error_);
    } else {
        result->resolve(root_urn_);
    }
}

} // namespace stackhost::runtime
