#include "stackhost/host.h"
#include "stackhost/args.h"
#include "stackhost/config_env.h"
#include "stackhost/config_injector.h"
#include "stackhost/errors.h"
#include "stackhost/event_loop.h"
#include "stackhost/log.h"
#include "stackhost/outcome.h"
#include "stackhost/program_runner.h"
#include "stackhost/runtime_loader.h"
#include "stackhost/settings.h"
#include "stackhost/teardown.h"

#include <cstdlib>
#include <iostream>
#include <string>

namespace stackhost {

namespace {

void apply_log_level_env(LogChannel& ch) {
    const char* env = std::getenv("STACKHOST_LOG_LEVEL");
    if (!env) return;
    if (auto s = parse_severity(env)) {
        ch.set_threshold(*s);
    } else {
        ch.warning(std::string("ignoring unknown STACKHOST_LOG_LEVEL: ") + env);
    }
}

// Pre-run failures: report to the diagnostic stream and exit 1.
int fail_startup(const std::string& message) {
    std::cerr << message << "\n";
    flush_output_streams();
    return 1;
}

} // namespace

int run_host(int argc, char** argv) {
    const std::string argv0 = (argc > 0 && argv[0]) ? argv[0] : "stackhost";
    auto& host_log = log_channel("stackhost.host");
    apply_log_level_env(host_log);

    // ---- ArgumentInvalid: before any runtime or RPC setup ----
    InvocationArgs args;
    try {
        args = parse_invocation_args(argc, argv);
    } catch (const UsageError& e) {
        return fail_startup(usage_text(argv0) + argv0 + ": error: " + e.what());
    }
    if (args.show_help) {
        std::cout << usage_text(argv0);
        flush_output_streams();
        return 0;
    }

    // ---- EnvironmentMissing: before any settings exist ----
    std::unique_ptr<RuntimeLibrary> runtime;
    try {
        runtime = locate_runtime(argc > 0 ? argv[0] : nullptr);
    } catch (const RuntimeLoadError& e) {
        return fail_startup(e.what());
    }
    const RuntimeApi& api = runtime->api();

    ConfigEnvironment config_env;
    try {
        config_env = read_config_environment();
    } catch (const ConfigEnvironmentError& e) {
        return fail_startup(std::string("error: ") + e.what());
    }

    // ---- SettingsBuilt ----
    const RuntimeSettings settings = build_runtime_settings(args);
    if (!settings.dry_run && (settings.monitor_address.empty() || settings.engine_address.empty())) {
        host_log.warning("real run without --monitor/--engine; the runtime decides how to resolve resources");
    }
    if (args.tracing) host_log.debug("tracing endpoint: " + *args.tracing);
    api.set_settings(settings);

    // ---- ConfigInjected ----
    ConfigInstallPath path = inject_config(api, config_env);
    host_log.debug(std::string("config install path: ") + config_install_path_name(path));

    // ---- LoopAcquired ----
    EventLoop& loop = acquire_event_loop();

    IEngineLog* engine_log = api.engine_log();
    IStackSupervisor* supervisor = api.supervisor();
    IProgramContext* context = api.program_context();
    if (!engine_log || !supervisor || !context) {
        return fail_startup("error: runtime library " + runtime->path() + " returned a null interface");
    }

    // ---- Running -> classified -> TornDown ----
    RunOutcome outcome;
    {
        TeardownGuard guard(loop);
        ProgramRunner runner(args, *context);
        outcome = classify_run([&]() { runner.run(loop, *supervisor); }, *engine_log);
        host_log.debug(std::string("run outcome: ") + outcome_name(outcome));
        guard.release();
    }

    return exit_code_for(outcome);
}

} // namespace stackhost
