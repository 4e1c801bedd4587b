#pragma once
#include <string>

namespace stackhost {

struct InvocationArgs;

// Process-wide runtime settings. Built once from the invocation arguments and
// installed into the runtime library before any user code runs.
struct RuntimeSettings {
    std::string monitor_address;
    std::string engine_address;
    std::string project;
    std::string stack;
    int parallel{0};      // 0 = unbounded
    bool dry_run{false};
};

RuntimeSettings build_runtime_settings(const InvocationArgs& args);

} // namespace stackhost
