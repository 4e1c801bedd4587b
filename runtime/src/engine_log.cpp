#include "engine_log.h"

#include "stackhost/log.h"

namespace stackhost::runtime {

void EngineLog::error(const std::string& message) {
    errors_++;
    log_channel("stackhost.engine").error(message);
}

} // namespace stackhost::runtime
