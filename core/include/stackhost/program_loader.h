#pragma once

#include <filesystem>
#include <string>

#include "stackhost/program_api.h"

namespace stackhost {

// Loads a user program shared library that exports stackhost_program_main.
//
// The handle is never closed: exception objects and callbacks created by the
// program can be held by the runtime after the run, so its code must stay
// mapped until process exit.
class ProgramLoader {
public:
    // Returns true on success, false on failure (err is filled).
    bool load(const std::filesystem::path& path, std::string* err);

    bool loaded() const { return entry_ != nullptr; }
    stackhost_program_main_fn entry() const { return entry_; }
    const std::filesystem::path& resolved_path() const { return resolved_; }

private:
    stackhost_program_main_fn entry_{nullptr};
    std::filesystem::path resolved_;
};

// A directory resolves to <dir>/main.so; anything else is returned as-is.
std::filesystem::path resolve_program_path(const std::filesystem::path& program);

} // namespace stackhost
