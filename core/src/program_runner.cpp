#include "stackhost/program_runner.h"
#include "stackhost/errors.h"
#include "stackhost/log.h"

#include <exception>
#include <filesystem>
#include <stdexcept>
#include <utility>

namespace stackhost {

ProgramRunner::ProgramRunner(const InvocationArgs& args, IProgramContext& ctx)
    : ProgramRunner(args, ctx, ProgramEntry{}) {}

ProgramRunner::ProgramRunner(const InvocationArgs& args, IProgramContext& ctx, ProgramEntry entry)
    : args_(args), ctx_(ctx), entry_(std::move(entry)) {
    cmdline_.reserve(args_.program_args.size() + 1);
    cmdline_.push_back(args_.program.string());
    for (const auto& a : args_.program_args) cmdline_.push_back(a);
}

void ProgramRunner::run(EventLoop& loop, IStackSupervisor& supervisor) {
    auto& host_log = log_channel("stackhost.host");

    if (args_.pwd) {
        std::filesystem::current_path(*args_.pwd);
        host_log.debug("changed working directory to " + args_.pwd->string());
    }

    DeferredPtr done = supervisor.run_with_stack(loop, [this]() { execute_program(); });
    loop.run_until_complete(done);
    if (done->failed()) std::rethrow_exception(done->error());
}

void ProgramRunner::execute_program() {
    ProgramEntry entry = entry_;
    if (!entry) {
        std::string err;
        if (!loader_.load(args_.program, &err)) throw ProgramLoadError(err);
        entry = loader_.entry();
    }

    // Programs may legally write into their argv strings; hand them copies.
    std::vector<std::string> storage = cmdline_;
    std::vector<char*> argv;
    argv.reserve(storage.size() + 1);
    for (auto& s : storage) argv.push_back(&s[0]);
    argv.push_back(nullptr);

    int rc = 0;
    try {
        rc = entry(&ctx_, static_cast<int>(storage.size()), argv.data());
    } catch (const RunError&) {
        throw;
    } catch (...) {
        std::throw_with_nested(std::runtime_error(
            "program " + args_.program.string() + " raised an exception"));
    }

    if (rc != 0) throw RunError("Program exited with code " + std::to_string(rc));
}

} // namespace stackhost
