#include "stackhost/program_loader.h"

#include <cstdlib>

#include <dlfcn.h>

namespace stackhost {

std::filesystem::path resolve_program_path(const std::filesystem::path& program) {
    std::error_code ec;
    if (std::filesystem::is_directory(program, ec)) return program / "main.so";
    return program;
}

bool ProgramLoader::load(const std::filesystem::path& path, std::string* err) {
    if (entry_) {
        if (err) *err = "program already loaded: " + resolved_.string();
        return false;
    }

    const auto resolved = resolve_program_path(path);
    std::error_code ec;
    if (!std::filesystem::exists(resolved, ec)) {
        if (err) *err = "program not found: " + resolved.string();
        return false;
    }

    // dlopen only searches the linker path for names without a slash.
    std::string open_name = resolved.string();
    if (!resolved.has_parent_path()) open_name = "./" + open_name;

    void* h = dlopen(open_name.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!h) {
        const char* dl_err = dlerror();  // dlerror() clears on read
        if (err) *err = std::string("dlopen failed: ") + (dl_err ? dl_err : "(unknown)");
        return false;
    }

    // ABI version check
    dlerror(); // clear
    auto abi_fn = (stackhost_program_abi_version_fn)dlsym(h, "stackhost_program_abi_version");
    dlerror(); // check the result, not dlerror
    if (abi_fn) {
        int program_abi = abi_fn();
        if (program_abi != STACKHOST_PROGRAM_ABI_VERSION) {
            if (err) *err = "ABI version mismatch: host=" + std::to_string(STACKHOST_PROGRAM_ABI_VERSION)
                          + " program=" + std::to_string(program_abi)
                          + " for " + resolved.string();
            dlclose(h);
            return false;
        }
    } else {
        // No ABI version export: reject unless the env override is set
        const char* lax = std::getenv("STACKHOST_PROGRAM_ABI_LAX");
        if (!lax || std::string(lax) != "1") {
            if (err) *err = "program missing stackhost_program_abi_version() export: " + resolved.string()
                          + " (set STACKHOST_PROGRAM_ABI_LAX=1 to allow)";
            dlclose(h);
            return false;
        }
    }

    dlerror(); // clear
    auto entry = (stackhost_program_main_fn)dlsym(h, "stackhost_program_main");
    const char* sym_err = dlerror();
    if (sym_err != nullptr || !entry) {
        if (err) *err = std::string("dlsym(stackhost_program_main) failed: ") + (sym_err ? sym_err : "(null)");
        dlclose(h);
        return false;
    }

    entry_ = entry;
    resolved_ = resolved;
    return true;
}

} // namespace stackhost
