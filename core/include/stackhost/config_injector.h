#pragma once
#include "stackhost/config_env.h"
#include "stackhost/runtime_loader.h"

namespace stackhost {

enum class ConfigInstallPath { BULK, PER_KEY };

const char* config_install_path_name(ConfigInstallPath p);

// Installs every config pair and secret marking into the runtime. Uses the
// bulk export when the runtime has it; otherwise one set_config call per key,
// in key order. A missing bulk export is never an error.
ConfigInstallPath inject_config(const RuntimeApi& api, const ConfigEnvironment& env);

} // namespace stackhost
