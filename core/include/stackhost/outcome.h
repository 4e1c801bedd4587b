#pragma once

#include "stackhost/runtime_api.h"

#include <exception>
#include <functional>
#include <string>
#include <variant>

namespace stackhost {

struct Success {};

struct DomainError {
    std::string message;
};

struct UnhandledFault {
    std::string message;
    std::string stack_trace;
};

// Exactly one per run; the sole input to the exit-code decision.
using RunOutcome = std::variant<Success, DomainError, UnhandledFault>;

// Printed ahead of the trace text when reporting an UnhandledFault.
constexpr const char* kUnhandledFaultPreface = "Program failed with an unhandled exception:";

// Runs `drive` (which drives the supervised run to completion and rethrows
// its failure, if any) and classifies how it ended:
//   returns normally      -> Success
//   throws RunError       -> DomainError, reported as message text only
//   throws anything else  -> UnhandledFault, reported with preface + trace
// Before driving, the scheduler's own log channel is raised to critical-only.
// Exactly one report reaches `log`, and only for the failure branches.
RunOutcome classify_run(const std::function<void()>& drive, IEngineLog& log);

// Classification of an already captured exception; does not log.
RunOutcome classify_exception(std::exception_ptr err);

// Demangled dynamic type and what() of err, then one line per level of
// std::nested_exception nesting.
std::string exception_trace(std::exception_ptr err);

const char* outcome_name(const RunOutcome& outcome);

// 0 iff outcome is Success.
int exit_code_for(const RunOutcome& outcome);

} // namespace stackhost
