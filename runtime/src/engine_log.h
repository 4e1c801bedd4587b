#pragma once

#include "stackhost/runtime_api.h"

#include <cstddef>
#include <string>

namespace stackhost::runtime {

// Engine-facing logger. Without a live engine connection its records go to
// the "stackhost.engine" channel of the shared log sink.
class EngineLog final : public IEngineLog {
public:
    void error(const std::string& message) override;

    size_t errors_logged() const { return errors_; }

private:
    size_t errors_{0};
};

} // namespace stackhost::runtime
