#pragma once

// Runtime library ABI (v1).
//
// The runtime library (libstackhost_runtime.so) owns the config store, the
// resource monitor client, the stack supervisor and the engine-facing logger.
// The host resolves its entry points with dlsym and talks to it only through
// the pure-virtual interfaces below.

#include "stackhost/deferred.h"
#include "stackhost/program_api.h"
#include "stackhost/scheduler.h"
#include "stackhost/settings.h"

#include <functional>
#include <map>
#include <set>
#include <string>

#define STACKHOST_RUNTIME_ABI_VERSION 1

namespace stackhost {

struct IStackSupervisor {
    virtual ~IStackSupervisor() = default;

    // Schedules unit as a single callback on loop. The returned deferred
    // settles only after unit has returned and every resource operation it
    // transitively triggered has settled. The first failure wins.
    virtual DeferredPtr run_with_stack(IScheduler& loop, std::function<void()> unit) = 0;
};

// Structured logger whose transport reaches the engine.
struct IEngineLog {
    virtual ~IEngineLog() = default;
    virtual void error(const std::string& message) = 0;
};

} // namespace stackhost

// Required exports:
//   int  stackhost_runtime_abi_version();
//   void stackhost_runtime_set_settings(const stackhost::RuntimeSettings&);
//   void stackhost_runtime_set_config(const std::string& key, const std::string& value, bool secret);
//   stackhost::IStackSupervisor* stackhost_runtime_supervisor();
//   stackhost::IEngineLog*       stackhost_runtime_engine_log();
//   stackhost::IProgramContext*  stackhost_runtime_program_context();
//
// Optional export (newer runtimes only; host falls back to per-key installs):
//   void stackhost_runtime_set_all_config(const std::map<std::string, std::string>& config,
//                                         const std::set<std::string>& secret_keys);
extern "C" {
    typedef int (*stackhost_runtime_abi_version_fn)();
    typedef void (*stackhost_runtime_set_settings_fn)(const stackhost::RuntimeSettings& settings);
    typedef void (*stackhost_runtime_set_config_fn)(const std::string& key,
                                                    const std::string& value,
                                                    bool secret);
    typedef void (*stackhost_runtime_set_all_config_fn)(const std::map<std::string, std::string>& config,
                                                        const std::set<std::string>& secret_keys);
    typedef stackhost::IStackSupervisor* (*stackhost_runtime_supervisor_fn)();
    typedef stackhost::IEngineLog* (*stackhost_runtime_engine_log_fn)();
    typedef stackhost::IProgramContext* (*stackhost_runtime_program_context_fn)();
}
