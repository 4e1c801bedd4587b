#pragma once

#include "stackhost/args.h"
#include "stackhost/event_loop.h"
#include "stackhost/program_loader.h"
#include "stackhost/runtime_api.h"

#include <functional>
#include <string>
#include <vector>

namespace stackhost {

using ProgramEntry = std::function<int(IProgramContext* ctx, int argc, char** argv)>;

// Runs the user program as the process's main unit of work, under the
// runtime's stack supervisor.
class ProgramRunner {
public:
    // Loads args.program with ProgramLoader when the unit of work starts.
    ProgramRunner(const InvocationArgs& args, IProgramContext& ctx);

    // Uses `entry` instead of loading a shared library.
    ProgramRunner(const InvocationArgs& args, IProgramContext& ctx, ProgramEntry entry);

    // [program] + program_args, as the program sees it in argv.
    const std::vector<std::string>& command_line() const { return cmdline_; }

    // Changes into --pwd (if given), hands the unit of work to the supervisor
    // as a single scheduled callback, and drives the loop until the supervised
    // run settles. Rethrows the run's failure.
    void run(EventLoop& loop, IStackSupervisor& supervisor);

    // The unit of work itself: load (if needed) and call the entry point.
    // A non-zero return becomes a RunError.
    void execute_program();

private:
    const InvocationArgs& args_;
    IProgramContext& ctx_;
    ProgramEntry entry_;
    ProgramLoader loader_;
    std::vector<std::string> cmdline_;
};

} // namespace stackhost
