#include "runtime_state.h"

#include "stackhost/log.h"
#include "stackhost/runtime_api.h"

using stackhost::runtime::runtime_instance;

extern "C" {

int stackhost_runtime_abi_version() {
    return STACKHOST_RUNTIME_ABI_VERSION;
}

void stackhost_runtime_set_settings(const stackhost::RuntimeSettings& settings) {
    runtime_instance().settings = settings;
    stackhost::log_channel("stackhost.runtime").debug(
        "settings installed for " + settings.project + "/" + settings.stack
        + (settings.dry_run ? " (dry run)" : ""));
}

void stackhost_runtime_set_config(const std::string& key, const std::string& value, bool secret) {
    runtime_instance().config.set(key, value, secret);
}

stackhost::IStackSupervisor* stackhost_runtime_supervisor() {
    return &runtime_instance().supervisor;
}

stackhost::IEngineLog* stackhost_runtime_engine_log() {
    return &runtime_instance().engine_log;
}

stackhost::IProgramContext* stackhost_runtime_program_context() {
    return &runtime_instance().context;
}

} // extern "C"
