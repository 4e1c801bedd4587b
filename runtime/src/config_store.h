#pragma once
#include <map>
#include <set>
#include <string>
#include <vector>

namespace stackhost::runtime {

// Process-wide config store read by the program's synchronous lookups.
// Written before the program starts; read-only afterwards.
class ConfigStore {
public:
    // Newer install path: replaces the whole store in one call.
    void set_all(const std::map<std::string, std::string>& values,
                 const std::set<std::string>& secret_keys);

    // Legacy install path: one key at a time.
    void set(const std::string& key, const std::string& value, bool secret);

    bool get(const std::string& key, std::string* value) const;

    // Only keys that carry a value can be secret, so both install paths
    // leave the store in the same observable state.
    bool is_secret(const std::string& key) const;

    size_t size() const { return values_.size(); }
    std::vector<std::string> keys() const;

private:
    std::map<std::string, std::string> values_;
    std::set<std::string> secret_;
};

} // namespace stackhost::runtime
