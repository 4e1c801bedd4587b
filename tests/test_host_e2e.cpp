#include "test_common.h"

#include <sys/wait.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>

namespace {

std::string g_host;
std::string g_programs;
std::string g_legacy_runtime;

struct HostResult {
    int exit_code{-1};
    std::string output;  // stdout and stderr interleaved
};

std::string quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    return out + "'";
}

// redirect defaults to capturing stderr together with stdout.
HostResult run_host(const std::string& args, const std::string& redirect = "2>&1") {
    const std::string cmd = quote(g_host) + " " + args + " " + redirect;
    HostResult r;
    FILE* p = popen(cmd.c_str(), "r");
    if (!p) die("popen failed: " + cmd);
    char buf[4096];
    size_t n = 0;
    while ((n = fread(buf, 1, sizeof(buf), p)) > 0) r.output.append(buf, n);
    int status = pclose(p);
    if (status == -1 || !WIFEXITED(status)) die("host did not exit normally: " + cmd);
    r.exit_code = WEXITSTATUS(status);
    return r;
}

std::string program(const std::string& name) {
    return quote(g_programs + "/" + name);
}

size_t count_of(const std::string& haystack, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) n++;
    return n;
}

void reset_env() {
    unsetenv("STACKHOST_CONFIG");
    unsetenv("STACKHOST_CONFIG_SECRET_KEYS");
    unsetenv("STACKHOST_RUNTIME_LIB");
    unsetenv("STACKHOST_LOG_LEVEL");
    unsetenv("STACKHOST_PROGRAM_ABI_LAX");
}

const char* kPreface = "Program failed with an unhandled exception:";

} // namespace

int main(int argc, char** argv) {
    if (argc < 4) die("usage: test_host_e2e <stackhost> <program_dir> <legacy_runtime>");
    g_host = argv[1];
    g_programs = argv[2];
    g_legacy_runtime = argv[3];
    expect_true(std::filesystem::exists(g_host), "host binary not found: " + g_host);

    // 1) Clean run with config, secrets and flags
    {
        reset_env();
        setenv("STACKHOST_CONFIG", "{\"web:greeting\":\"hi\"}", 1);
        setenv("STACKHOST_CONFIG_SECRET_KEYS", "[\"web:greeting\"]", 1);
        auto r = run_host("--project web --stack dev --parallel 4 --dry_run true "
                          + program("clean_program.so") + " extra");
        expect_eq_ll(r.exit_code, 0, "clean run exit code: " + r.output);
        expect_true(contains(r.output, "project=web stack=dev parallel=4 dry_run=true argc=2"),
                    "settings reached the program: " + r.output);
        expect_true(contains(r.output, "greeting=hi secret=yes"), "config reached the program: " + r.output);
        expect_true(contains(r.output, "clean_program: bucket="), "apply callback ran: " + r.output);
        expect_true(!contains(r.output, kPreface), "no fault report");
    }

    // 1b) No resource calls at all
    {
        reset_env();
        auto r = run_host("--parallel 4 --dry_run true " + program("clean_program.so") + " --idle");
        expect_eq_ll(r.exit_code, 0, "idle run exit code: " + r.output);
        expect_true(!contains(r.output, "\"severity\":\"error\""),
                    "idle run reports no errors: " + r.output);
    }

    // 2) Non-zero program return is a domain error
    {
        reset_env();
        auto r = run_host("--project web --stack dev " + program("clean_program.so") + " --exit 3");
        expect_eq_ll(r.exit_code, 1, "exit code run: " + r.output);
        expect_true(contains(r.output, "Program exited with code 3"), "exit code reported: " + r.output);
        expect_true(!contains(r.output, kPreface), "domain error has no preface");
    }

    // 3) Monitor rejection: one domain error report, no trace
    {
        reset_env();
        auto r = run_host("--project web --stack dev --dry_run true " + program("reject_program.so"));
        expect_eq_ll(r.exit_code, 1, "rejected run: " + r.output);
        expect_eq_ll(static_cast<long long>(count_of(r.output, "invalid resource type token")), 1,
                     "rejection reported once: " + r.output);
        expect_true(!contains(r.output, kPreface), "rejection has no preface");
    }

    // 4) Synchronous fault: preface and trace
    {
        reset_env();
        auto r = run_host("--project web --stack dev --dry_run true " + program("fault_program.so"));
        expect_eq_ll(r.exit_code, 1, "faulted run: " + r.output);
        expect_true(contains(r.output, kPreface), "preface: " + r.output);
        expect_true(contains(r.output, "std::logic_error"), "exception type in trace: " + r.output);
        expect_true(contains(r.output, "invariant broken"), "exception message in trace");
        expect_eq_ll(static_cast<long long>(count_of(r.output, kPreface)), 1, "one fault report");
    }

    // 5) Fault raised after the program returned
    {
        reset_env();
        auto r = run_host("--project web --stack dev --dry_run true " + program("async_fault_program.so"));
        expect_eq_ll(r.exit_code, 1, "late fault: " + r.output);
        expect_true(contains(r.output, kPreface), "late fault preface: " + r.output);
        expect_true(contains(r.output, "lookup past the end"), "late fault message");
    }

    // 6) Chained registrations complete before the host exits
    {
        reset_env();
        auto r = run_host("--project web --stack dev --parallel 1 --dry_run true " + program("chain_program.so"));
        expect_eq_ll(r.exit_code, 0, "chain run: " + r.output);
        expect_true(contains(r.output, "chain_program: instance ready"), "last link ran: " + r.output);
    }

    // 7) --pwd
    {
        reset_env();
        const auto tmp = std::filesystem::canonical(std::filesystem::temp_directory_path());
        auto r = run_host("--project web --stack dev --dry_run true --pwd " + quote(tmp.string()) + " "
                          + program("pwd_program.so"));
        expect_eq_ll(r.exit_code, 0, "pwd run: " + r.output);
        expect_true(contains(r.output, "pwd_program: cwd=" + tmp.string()), "ran in --pwd: " + r.output);
    }

    // 8) Directory program
    {
        reset_env();
        auto r = run_host("--project web --stack dev --dry_run true " + program("dir_program"));
        expect_eq_ll(r.exit_code, 0, "directory program: " + r.output);
        expect_true(contains(r.output, "clean_program: project=web"), "main.so ran: " + r.output);
    }

    // 9) Missing runtime library
    {
        reset_env();
        setenv("STACKHOST_RUNTIME_LIB", "/nonexistent/libstackhost_runtime.so", 1);
        auto r = run_host(program("clean_program.so"));
        expect_eq_ll(r.exit_code, 1, "missing runtime: " + r.output);
        expect_true(contains(r.output, "runtime library is not available"), "remediation text: " + r.output);
        expect_true(!contains(r.output, "clean_program:"), "program never ran");
    }

    // 10) Usage errors and help
    {
        reset_env();
        auto r = run_host("--parallel abc " + program("clean_program.so"));
        expect_eq_ll(r.exit_code, 1, "bad --parallel: " + r.output);
        expect_true(contains(r.output, "invalid int value: 'abc'"), "parallel message: " + r.output);
        expect_true(!contains(r.output, "clean_program:"), "program never ran");

        r = run_host("");
        expect_eq_ll(r.exit_code, 1, "missing PROGRAM");
        expect_true(contains(r.output, "PROGRAM"), "program required message: " + r.output);

        r = run_host("--help");
        expect_eq_ll(r.exit_code, 0, "help exit code");
        expect_true(contains(r.output, "usage:"), "usage text: " + r.output);
    }

    // 11) Malformed config environment
    {
        reset_env();
        setenv("STACKHOST_CONFIG", "{broken", 1);
        auto r = run_host(program("clean_program.so"));
        expect_eq_ll(r.exit_code, 1, "malformed config: " + r.output);
        expect_true(contains(r.output, "STACKHOST_CONFIG"), "variable named: " + r.output);
    }

    // 12) Missing program file is a fault, reported with a trace
    {
        reset_env();
        auto r = run_host("--dry_run true " + program("no_such_program.so"));
        expect_eq_ll(r.exit_code, 1, "missing program: " + r.output);
        expect_true(contains(r.output, "program not found"), "load message: " + r.output);
    }

    // 13) Runtime without the bulk config export takes the per-key path
    {
        reset_env();
        setenv("STACKHOST_RUNTIME_LIB", g_legacy_runtime.c_str(), 1);
        setenv("STACKHOST_LOG_LEVEL", "debug", 1);
        setenv("STACKHOST_CONFIG", "{\"web:greeting\":\"hello\"}", 1);
        setenv("STACKHOST_CONFIG_SECRET_KEYS", "[\"web:greeting\"]", 1);
        auto r = run_host("--project web --stack dev --dry_run true " + program("clean_program.so"));
        expect_eq_ll(r.exit_code, 0, "legacy runtime: " + r.output);
        expect_true(contains(r.output, "config install path: per-key"), "per-key path: " + r.output);
        expect_true(contains(r.output, "greeting=hello secret=yes"), "same observable config: " + r.output);

        unsetenv("STACKHOST_RUNTIME_LIB");
        r = run_host("--project web --stack dev --dry_run true " + program("clean_program.so"));
        expect_eq_ll(r.exit_code, 0, "bulk runtime: " + r.output);
        expect_true(contains(r.output, "config install path: bulk"), "bulk path: " + r.output);
        expect_true(contains(r.output, "greeting=hello secret=yes"), "bulk config: " + r.output);
    }

    // 14) stdout on a full device: the teardown flush fault still exits 1
    {
        reset_env();
        auto r = run_host("--project web --stack dev --dry_run true " + program("clean_program.so"),
                          "2>&1 >/dev/full");
        expect_eq_ll(r.exit_code, 1, "full stdout exit code: " + r.output);
        expect_true(contains(r.output, "failed to flush output streams"), "flush fault reported: " + r.output);
        expect_true(!contains(r.output, "terminate called"), "no abort: " + r.output);

        r = run_host("--help", "2>&1 >/dev/full");
        expect_eq_ll(r.exit_code, 1, "help to full stdout: " + r.output);
    }

    reset_env();
    std::cerr << "test_host_e2e: ALL PASSED" << std::endl;
    return 0;
}
