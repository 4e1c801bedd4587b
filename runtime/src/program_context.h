#pragma once

#include "config_store.h"
#include "local_monitor.h"
#include "stack_supervisor.h"

#include "stackhost/program_api.h"

namespace stackhost::runtime {

// IProgramContext handed to the user program. Every operation it starts is
// tracked by the supervisor so the run waits for it.
class RuntimeProgramContext final : public IProgramContext {
public:
    RuntimeProgramContext(const RuntimeSettings& settings, const ConfigStore& config,
                          LocalMonitor& monitor, StackSupervisor& supervisor)
        : settings_(settings), config_(config), monitor_(monitor), supervisor_(supervisor) {}

    const RuntimeSettings& settings() const override { return settings_; }
    bool config(const std::string& key, std::string* value) const override;
    bool is_secret(const std::string& key) const override;

    DeferredPtr register_resource(const ResourceRequest& req) override;
    DeferredPtr apply(const DeferredPtr& dep,
                      std::function<std::string(const std::string&)> fn) override;
    void export_value(const std::string& name, const std::string& value_json) override;

private:
    const RuntimeSettings& settings_;
    const ConfigStore& config_;
    LocalMonitor& monitor_;
    StackSupervisor& supervisor_;
};

} // namespace stackhost::runtime
