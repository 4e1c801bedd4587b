#pragma once

#include "local_monitor.h"

#include "stackhost/runtime_api.h"

#include <exception>
#include <map>
#include <string>

namespace stackhost::runtime {

constexpr const char* kRootStackType = "stackhost:stack:Stack";

// Tracks every operation a run triggers and settles the run's deferred only
// once the program has returned and nothing is outstanding.
//
// Completion order for a run:
//   1. root stack resource registered
//   2. unit of work runs (one scheduled callback)
//   3. tracked operations settle, possibly tracking more
//   4. with nothing outstanding and no failure, the root resource's outputs
//      (exported values) are registered and awaited
//   5. the run's deferred settles: resolved with the root URN, or rejected
//      with the first failure
class StackSupervisor final : public IStackSupervisor {
public:
    StackSupervisor(LocalMonitor& monitor, const RuntimeSettings& settings)
        : monitor_(monitor), settings_(settings) {}

    DeferredPtr run_with_stack(IScheduler& loop, std::function<void()> unit) override;

    // Count op against the active run; its failure fails the run.
    void track(const DeferredPtr& op);

    // Records a failure. The first one wins; later distinct ones are logged.
    void fail(std::exception_ptr err);

    void export_value(const std::string& name, const std::string& value_json);

    bool active() const { return active_; }
    IScheduler* loop() const { return loop_; }
    const std::string& root_urn() const { return root_urn_; }
    size_t outstanding() const { return outstanding_; }

private:
    void maybe_finish();

    LocalMonitor& monitor_;
    const RuntimeSettings& settings_;

    IScheduler* loop_{nullptr};
    DeferredPtr result_;
    bool active_{false};
    bool unit_returned_{false};
    bool finalizing_{false};
    size_t outstanding_{0};
    std::exception_ptr first_error_;
    std::string root_urn_;
    std::map<std::string, std::string> exports_;
};

} // namespace stackhost::runtime
