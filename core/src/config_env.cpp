#include "stackhost/config_env.h"
#include "stackhost/errors.h"

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cstdlib>
#include <cstring>

namespace stackhost {

namespace {

constexpr const char* kConfigEnv = "STACKHOST_CONFIG";
constexpr const char* kSecretKeysEnv = "STACKHOST_CONFIG_SECRET_KEYS";

// Owns a parsed json-c tree.
struct Doc {
    json_object* root{nullptr};

    explicit Doc(json_object* r) : root(r) {}
    Doc(const Doc&) = delete;
    Doc& operator=(const Doc&) = delete;
    ~Doc() {
        if (root) json_object_put(root);
    }
};

json_object* parse_strict(const char* var, const char* text) {
    json_tokener* tok = json_tokener_new();
    if (!tok) throw ConfigEnvironmentError(std::string(var) + ": out of memory");
    size_t len = std::strlen(text);
    json_object* obj = json_tokener_parse_ex(tok, text,
        static_cast<int>(std::min(len, static_cast<size_t>(INT_MAX))));
    json_tokener_error jerr = json_tokener_get_error(tok);
    const size_t end = static_cast<size_t>(tok->char_offset);
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        throw ConfigEnvironmentError(std::string(var) + ": invalid JSON: " + json_tokener_error_desc(jerr));
    }
    // The tokener stops after the first complete value.
    for (size_t i = end; i < len; i++) {
        if (text[i] != ' ' && text[i] != '\t' && text[i] != '\n' && text[i] != '\r') {
            if (obj) json_object_put(obj);
            throw ConfigEnvironmentError(std::string(var) + ": invalid JSON: trailing data after value");
        }
    }
    return obj;
}

bool is_blank(const char* s) {
    if (!s) return true;
    for (; *s; ++s) {
        if (*s != ' ' && *s != '\t' && *s != '\n' && *s != '\r') return false;
    }
    return true;
}

} // namespace

std::string normalize_config_key(const std::string& key) {
    static const std::string kInfix = ":config:";
    auto pos = key.find(kInfix);
    if (pos == std::string::npos || pos == 0) return key;
    if (key.find(':') != pos) return key; // infix must follow the package name
    return key.substr(0, pos) + ":" + key.substr(pos + kInfix.size());
}

ConfigEnvironment parse_config_environment(const char* config_json, const char* secret_keys_json) {
    ConfigEnvironment env;

    if (!is_blank(config_json)) {
        Doc d(parse_strict(kConfigEnv, config_json));
        if (!d.root || !json_object_is_type(d.root, json_type_object)) {
            throw ConfigEnvironmentError(std::string(kConfigEnv) + ": expected a JSON object");
        }
        json_object_object_foreach(d.root, k, v) {
            if (!json_object_is_type(v, json_type_string)) {
                throw ConfigEnvironmentError(std::string(kConfigEnv) + ": value for '" + k + "' is not a string");
            }
            env.values[normalize_config_key(k)] = json_object_get_string(v);
        }
    }

    if (!is_blank(secret_keys_json)) {
        Doc d(parse_strict(kSecretKeysEnv, secret_keys_json));
        if (!d.root || !json_object_is_type(d.root, json_type_array)) {
            throw ConfigEnvironmentError(std::string(kSecretKeysEnv) + ": expected a JSON array");
        }
        const size_t n = json_object_array_length(d.root);
        for (size_t i = 0; i < n; i++) {
            json_object* item = json_object_array_get_idx(d.root, i);
            if (!json_object_is_type(item, json_type_string)) {
                throw ConfigEnvironmentError(std::string(kSecretKeysEnv) + ": element " + std::to_string(i) + " is not a string");
            }
            env.secret_keys.insert(normalize_config_key(json_object_get_string(item)));
        }
    }

    return env;
}

ConfigEnvironment read_config_environment() {
    return parse_config_environment(std::getenv(kConfigEnv), std::getenv(kSecretKeysEnv));
}

} // namespace stackhost
