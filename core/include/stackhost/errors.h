#pragma once

// Error taxonomy shared by the host, the runtime library and user programs.
//
// RunError and its subclasses are header-only on purpose: programs throw them
// without linking against the host, and the host recognises them when the
// supervised run settles.

#include <stdexcept>
#include <string>

namespace stackhost {

// ---------------------------------------------------------------------------
// Domain errors: expected, user-facing failures. Reported as message text only.
// ---------------------------------------------------------------------------
class RunError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigMissingError : public RunError {
public:
    explicit ConfigMissingError(const std::string& key)
        : RunError("Missing required configuration variable '" + key + "'"), key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

class ConfigTypeError : public RunError {
public:
    ConfigTypeError(const std::string& key, const std::string& value, const std::string& expected)
        : RunError("Configuration '" + key + "' value '" + value + "' is not a valid " + expected),
          key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

// Raised when the resource monitor rejects a registration.
class ResourceError : public RunError {
public:
    using RunError::RunError;
};

// ---------------------------------------------------------------------------
// Host-side failures. None of these are attributable to the user program.
// ---------------------------------------------------------------------------
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class RuntimeLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigEnvironmentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class SchedulerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ProgramLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace stackhost
