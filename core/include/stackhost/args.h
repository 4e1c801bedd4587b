#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace stackhost {

// Immutable record of the host's invocation parameters.
struct InvocationArgs {
    std::optional<std::string> project;
    std::optional<std::string> stack;
    int parallel{0};
    bool dry_run{false};
    std::optional<std::filesystem::path> pwd;
    std::string monitor_address;
    std::string engine_address;
    std::optional<std::string> tracing;
    std::filesystem::path program;
    std::vector<std::string> program_args;
    bool show_help{false};
};

// Parses argv (argv[0] is the host executable). Throws UsageError on a missing
// PROGRAM, an unknown flag, a flag without a value, or a non-numeric or
// negative --parallel.
InvocationArgs parse_invocation_args(const std::vector<std::string>& argv);
InvocationArgs parse_invocation_args(int argc, char** argv);

// Strict literal comparison; only "true" enables dry-run.
bool parse_dry_run(const std::string& text);

// Non-negative decimal integer; throws UsageError otherwise.
int parse_parallel(const std::string& text);

std::string usage_text(const std::string& argv0);

} // namespace stackhost
