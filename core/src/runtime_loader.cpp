#include "stackhost/runtime_loader.h"
#include "stackhost/errors.h"
#include "stackhost/log.h"

#include <cstdlib>
#include <sstream>

#include <dlfcn.h>

namespace stackhost {

namespace {

template <typename Fn>
Fn resolve(void* h, const char* name) {
    dlerror(); // clear
    return (Fn)dlsym(h, name);
}

} // namespace

RuntimeLibrary::~RuntimeLibrary() {
    if (handle_) {
        dlclose(handle_);
        handle_ = nullptr;
    }
}

bool RuntimeLibrary::load(const std::string& path, std::string* err) {
    if (handle_) {
        if (err) *err = "runtime already loaded from " + path_;
        return false;
    }

    void* h = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!h) {
        const char* dl_err = dlerror();  // dlerror() clears on read
        if (err) *err = std::string("dlopen failed: ") + (dl_err ? dl_err : "(unknown)");
        return false;
    }

    // ABI version check, always enforced
    auto abi_fn = resolve<stackhost_runtime_abi_version_fn>(h, "stackhost_runtime_abi_version");
    if (!abi_fn) {
        if (err) *err = "missing stackhost_runtime_abi_version() export: " + path;
        dlclose(h);
        return false;
    }
    int runtime_abi = abi_fn();
    if (runtime_abi != STACKHOST_RUNTIME_ABI_VERSION) {
        if (err) *err = "ABI version mismatch: host=" + std::to_string(STACKHOST_RUNTIME_ABI_VERSION)
                      + " runtime=" + std::to_string(runtime_abi)
                      + " for " + path;
        dlclose(h);
        return false;
    }

    RuntimeApi api;
    api.set_settings = resolve<stackhost_runtime_set_settings_fn>(h, "stackhost_runtime_set_settings");
    api.set_config = resolve<stackhost_runtime_set_config_fn>(h, "stackhost_runtime_set_config");
    api.supervisor = resolve<stackhost_runtime_supervisor_fn>(h, "stackhost_runtime_supervisor");
    api.engine_log = resolve<stackhost_runtime_engine_log_fn>(h, "stackhost_runtime_engine_log");
    api.program_context = resolve<stackhost_runtime_program_context_fn>(h, "stackhost_runtime_program_context");

    // Optional: only newer runtimes can install the whole config in one call.
    api.set_all_config = resolve<stackhost_runtime_set_all_config_fn>(h, "stackhost_runtime_set_all_config");
    dlerror(); // set_all_config is optional

    std::vector<std::string> missing;
    if (!api.set_settings) missing.push_back("stackhost_runtime_set_settings");
    if (!api.set_config) missing.push_back("stackhost_runtime_set_config");
    if (!api.supervisor) missing.push_back("stackhost_runtime_supervisor");
    if (!api.engine_log) missing.push_back("stackhost_runtime_engine_log");
    if (!api.program_context) missing.push_back("stackhost_runtime_program_context");
    if (!missing.empty()) {
        if (err) {
            std::ostringstream oss;
            oss << "runtime " << path << " is missing required exports:";
            for (const auto& m : missing) oss << " " << m;
            *err = oss.str();
        }
        dlclose(h);
        return false;
    }

    handle_ = h;
    path_ = path;
    api_ = api;
    return true;
}

std::vector<std::string> runtime_search_candidates(const char* argv0) {
    std::vector<std::string> out;
    if (const char* explicit_path = std::getenv("STACKHOST_RUNTIME_LIB")) {
        if (*explicit_path) {
            // An explicit choice is final; silently falling back would hide it.
            out.emplace_back(explicit_path);
            return out;
        }
    }

    if (argv0 && *argv0) {
        std::error_code ec;
        auto exe = std::filesystem::weakly_canonical(std::filesystem::path(argv0), ec);
        if (!ec && exe.has_parent_path()) {
            auto sibling = exe.parent_path() / kRuntimeSoname;
            if (std::filesystem::exists(sibling, ec)) out.push_back(sibling.string());
        }
    }

    out.emplace_back(kRuntimeSoname);
    return out;
}

std::unique_ptr<RuntimeLibrary> locate_runtime(const char* argv0) {
    auto& host_log = log_channel("stackhost.host");
    std::ostringstream tried;

    for (const auto& candidate : runtime_search_candidates(argv0)) {
        auto lib = std::make_unique<RuntimeLibrary>();
        std::string err;
        if (lib->load(candidate, &err)) {
            host_log.debug("loaded runtime library " + candidate
                           + (lib->api().has_bulk_config() ? " (bulk config)" : " (per-key config)"));
            return lib;
        }
        tried << "\n  " << candidate << ": " << err;
    }

    throw RuntimeLoadError(
        "It looks like the stackhost runtime library is not available." + tried.str() +
        "\nInstall libstackhost_runtime.so next to the stackhost executable, "
        "or point STACKHOST_RUNTIME_LIB at it, and try again.");
}

} // namespace stackhost
