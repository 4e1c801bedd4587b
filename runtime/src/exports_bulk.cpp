#include "runtime_state.h"

#include "stackhost/runtime_api.h"

extern "C" void stackhost_runtime_set_all_config(const std::map<std::string, std::string>& config,
                                                 const std::set<std::string>& secret_keys) {
    stackhost::runtime::runtime_instance().config.set_all(config, secret_keys);
}
