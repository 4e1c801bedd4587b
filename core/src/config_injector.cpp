#include "stackhost/config_injector.h"
#include "stackhost/errors.h"
#include "stackhost/log.h"

namespace stackhost {

const char* config_install_path_name(ConfigInstallPath p) {
    switch (p) {
        case ConfigInstallPath::BULK:    return "bulk";
        case ConfigInstallPath::PER_KEY: return "per-key";
    }
    return "per-key";
}

ConfigInstallPath inject_config(const RuntimeApi& api, const ConfigEnvironment& env) {
    auto& host_log = log_channel("stackhost.host");

    if (api.has_bulk_config()) {
        api.set_all_config(env.values, env.secret_keys);
        host_log.debug("installed " + std::to_string(env.values.size()) + " config values (bulk)");
        return ConfigInstallPath::BULK;
    }

    if (!api.set_config) throw RuntimeLoadError("runtime exposes no config installer");

    for (const auto& kv : env.values) {
        api.set_config(kv.first, kv.second, env.secret_keys.count(kv.first) > 0);
    }
    host_log.debug("installed " + std::to_string(env.values.size()) + " config values (per-key)");
    return ConfigInstallPath::PER_KEY;
}

} // namespace stackhost
