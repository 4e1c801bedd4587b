#include "test_common.h"
#include "stackhost/errors.h"
#include "stackhost/event_loop.h"
#include "stackhost/program_runner.h"

#include <exception>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

using namespace stackhost;

namespace {

// Runs the unit as one callback and settles with its outcome.
struct InlineSupervisor : IStackSupervisor {
    int runs = 0;
    DeferredPtr run_with_stack(IScheduler& loop, std::function<void()> unit) override {
        runs++;
        auto d = make_deferred(loop);
        loop.call_soon([d, unit] {
            try {
                unit();
            } catch (...) {
                d->reject(std::current_exception());
                return;
            }
            d->resolve("urn:test");
        });
        return d;
    }
};

struct NullContext : IProgramContext {
    RuntimeSettings s;
    const RuntimeSettings& settings() const override { return s; }
    bool config(const std::string&, std::string*) const override { return false; }
    bool is_secret(const std::string&) const override { return false; }
    DeferredPtr register_resource(const ResourceRequest&) override {
        throw SchedulerError("not supported here");
    }
    DeferredPtr apply(const DeferredPtr&, std::function<std::string(const std::string&)>) override {
        throw SchedulerError("not supported here");
    }
    void export_value(const std::string&, const std::string&) override {}
};

InvocationArgs make_args(std::vector<std::string> program_args = {}) {
    InvocationArgs a;
    a.program = "prog.so";
    a.program_args = std::move(program_args);
    return a;
}

} // namespace

int main() {
    NullContext ctx;

    // Test 1: argv is [program] + program args and the context is passed through
    {
        EventLoop loop;
        InlineSupervisor sup;
        InvocationArgs args = make_args({"--name", "demo"});
        std::vector<std::string> seen;
        IProgramContext* seen_ctx = nullptr;
        ProgramRunner runner(args, ctx, [&](IProgramContext* c, int argc, char** argv) {
            seen_ctx = c;
            for (int i = 0; i < argc; i++) seen.emplace_back(argv[i]);
            return argv[argc] == nullptr ? 0 : 9;
        });
        expect_eq_ll(static_cast<long long>(runner.command_line().size()), 3, "command line size");
        runner.run(loop, sup);
        expect_eq_ll(sup.runs, 1, "one supervised run");
        expect_true(seen_ctx == &ctx, "context passed through");
        expect_eq_ll(static_cast<long long>(seen.size()), 3, "argc");
        expect_eq_str(seen[0], "prog.so", "argv[0]");
        expect_eq_str(seen[2], "demo", "argv[2]");
    }

    // Test 2: a non-zero return becomes a RunError
    {
        EventLoop loop;
        InlineSupervisor sup;
        InvocationArgs args = make_args();
        ProgramRunner runner(args, ctx, [](IProgramContext*, int, char**) { return 3; });
        std::string msg;
        expect_true(throws<RunError>([&] { runner.run(loop, sup); }, &msg), "exit code fails the run");
        expect_eq_str(msg, "Program exited with code 3", "exit code message");
    }

    // Test 3: domain errors pass through unchanged
    {
        EventLoop loop;
        InlineSupervisor sup;
        InvocationArgs args = make_args();
        ProgramRunner runner(args, ctx, [](IProgramContext*, int, char**) -> int {
            throw ConfigMissingError("demo:size");
        });
        std::string msg;
        expect_true(throws<ConfigMissingError>([&] { runner.run(loop, sup); }, &msg), "domain error kept");
        expect_true(contains(msg, "demo:size"), "key in message");
    }

    // Test 4: other exceptions are wrapped, keeping the original as the cause
    {
        EventLoop loop;
        InlineSupervisor sup;
        InvocationArgs args = make_args();
        ProgramRunner runner(args, ctx, [](IProgramContext*, int, char**) -> int {
            throw std::logic_error("unreachable state");
        });
        bool inner_found = false;
        try {
            runner.run(loop, sup);
            die("fault should propagate");
        } catch (const RunError&) {
            die("fault must not look like a domain error");
        } catch (const std::runtime_error& e) {
            expect_true(contains(e.what(), "prog.so"), "program named in wrapper");
            try {
                std::rethrow_if_nested(e);
            } catch (const std::logic_error& inner) {
                inner_found = contains(inner.what(), "unreachable state");
            }
        }
        expect_true(inner_found, "original exception nested");
    }

    // Test 5: --pwd changes directory before the program runs
    {
        const auto before = std::filesystem::current_path();
        const auto target = std::filesystem::temp_directory_path();
        EventLoop loop;
        InlineSupervisor sup;
        InvocationArgs args = make_args();
        args.pwd = target;
        std::filesystem::path seen;
        ProgramRunner runner(args, ctx, [&](IProgramContext*, int, char**) {
            seen = std::filesystem::current_path();
            return 0;
        });
        runner.run(loop, sup);
        expect_true(std::filesystem::equivalent(seen, target), "program ran in --pwd");
        std::filesystem::current_path(before);
    }

    // Test 6: an unusable --pwd fails before the program is scheduled
    {
        EventLoop loop;
        InlineSupervisor sup;
        InvocationArgs args = make_args();
        args.pwd = "/nonexistent/stackhost/dir";
        ProgramRunner runner(args, ctx, [](IProgramContext*, int, char**) { return 0; });
        expect_true(throws<std::filesystem::filesystem_error>([&] { runner.run(loop, sup); }), "bad pwd");
        expect_eq_ll(sup.runs, 0, "nothing scheduled");
    }

    // Test 7: a missing program library is a load error inside the run
    {
        EventLoop loop;
        InlineSupervisor sup;
        InvocationArgs args = make_args();
        args.program = "/nonexistent/stackhost/prog.so";
        ProgramRunner runner(args, ctx);
        std::string msg;
        expect_true(throws<ProgramLoadError>([&] { runner.run(loop, sup); }, &msg), "load error");
        expect_true(contains(msg, "program not found"), "load message: " + msg);
    }

    std::cerr << "test_program_runner: ALL PASSED" << std::endl;
    return 0;
}
