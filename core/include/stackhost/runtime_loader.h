#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "stackhost/runtime_api.h"

namespace stackhost {

// Resolved entry points of a runtime library. set_all_config is null when the
// runtime predates the bulk install capability.
struct RuntimeApi {
    stackhost_runtime_set_settings_fn set_settings{nullptr};
    stackhost_runtime_set_config_fn set_config{nullptr};
    stackhost_runtime_set_all_config_fn set_all_config{nullptr};
    stackhost_runtime_supervisor_fn supervisor{nullptr};
    stackhost_runtime_engine_log_fn engine_log{nullptr};
    stackhost_runtime_program_context_fn program_context{nullptr};

    bool has_bulk_config() const { return set_all_config != nullptr; }
};

// Loads the runtime library and keeps its handle until destruction.
class RuntimeLibrary {
public:
    RuntimeLibrary() = default;
    ~RuntimeLibrary();

    RuntimeLibrary(const RuntimeLibrary&) = delete;
    RuntimeLibrary& operator=(const RuntimeLibrary&) = delete;

    // Returns true on success, false on failure (err is filled).
    // `path` may be a bare soname, resolved by the dynamic linker.
    bool load(const std::string& path, std::string* err);

    bool loaded() const { return handle_ != nullptr; }
    const std::string& path() const { return path_; }
    const RuntimeApi& api() const { return api_; }

private:
    void* handle_{nullptr};
    std::string path_;
    RuntimeApi api_;
};

constexpr const char* kRuntimeSoname = "libstackhost_runtime.so";

// Search order: $STACKHOST_RUNTIME_LIB, <dir of argv0>/libstackhost_runtime.so,
// then the bare soname for the dynamic linker's own search path.
std::vector<std::string> runtime_search_candidates(const char* argv0);

// Tries each candidate in order. Throws RuntimeLoadError, with remediation
// guidance, if none loads.
std::unique_ptr<RuntimeLibrary> locate_runtime(const char* argv0);

} // namespace stackhost
