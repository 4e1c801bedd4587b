#include "config_store.h"

namespace stackhost::runtime {

void ConfigStore::set_all(const std::map<std::string, std::string>& values,
                          const std::set<std::string>& secret_keys) {
    values_ = values;
    secret_ = secret_keys;
}

void ConfigStore::set(const std::string& key, const std::string& value, bool secret) {
    values_[key] = value;
    if (secret) {
        secret_.insert(key);
    } else {
        secret_.erase(key);
    }
}

bool ConfigStore::get(const std::string& key, std::string* value) const {
    auto it = values_.find(key);
    if (it == values_.end()) return false;
    if (value) *value = it->second;
    return true;
}

bool ConfigStore::is_secret(const std::string& key) const {
    return values_.count(key) > 0 && secret_.count(key) > 0;
}

std::vector<std::string> ConfigStore::keys() const {
    std::vector<std::string> out;
    out.reserve(values_.size());
    for (const auto& kv : values_) out.push_back(kv.first);
    return out;
}

} // namespace stackhost::runtime
