#pragma once
#include <map>
#include <set>
#include <string>

namespace stackhost {

// Engine-supplied configuration, read once at startup.
struct ConfigEnvironment {
    std::map<std::string, std::string> values;
    std::set<std::string> secret_keys;
};

// Reads STACKHOST_CONFIG (JSON object of strings) and
// STACKHOST_CONFIG_SECRET_KEYS (JSON array of strings). Unset variables yield
// empty collections. Throws ConfigEnvironmentError on malformed content.
ConfigEnvironment read_config_environment();

// Same as above, from explicit texts. nullptr means "unset".
ConfigEnvironment parse_config_environment(const char* config_json, const char* secret_keys_json);

// "pkg:config:key" -> "pkg:key". Other keys are returned unchanged.
std::string normalize_config_key(const std::string& key);

} // namespace stackhost
