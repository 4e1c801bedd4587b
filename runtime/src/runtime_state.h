#pragma once

#include "config_store.h"
#include "engine_log.h"
#include "local_monitor.h"
#include "program_context.h"
#include "stack_supervisor.h"

#include "stackhost/settings.h"

namespace stackhost::runtime {

// Everything the runtime library owns for the lifetime of the process.
struct Runtime {
    RuntimeSettings settings;
    ConfigStore config;
    LocalMonitor monitor{settings};
    StackSupervisor supervisor{monitor, settings};
    RuntimeProgramContext context{settings, config, monitor, supervisor};
    EngineLog engine_log;
};

Runtime& runtime_instance();

} // namespace stackhost::runtime
