#include "stackhost/teardown.h"
#include "stackhost/event_loop.h"
#include "stackhost/log.h"

#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>

namespace stackhost {

void flush_output_streams() {
    std::cout.flush();
    flush_log_sink();
    std::cerr.flush();
    const bool c_ok = std::fflush(stdout) == 0 && std::fflush(stderr) == 0;
    if (!std::cout || !c_ok) {
        throw std::runtime_error("failed to flush output streams");
    }
}

TeardownGuard::~TeardownGuard() {
    if (done_) return;
    // May run while another exception unwinds; throwing here would terminate.
    try {
        teardown();
    } catch (const std::exception& e) {
        log_channel("stackhost.host").critical(std::string("teardown failed: ") + e.what());
    }
}

void TeardownGuard::release() {
    if (!done_) teardown();
}

void TeardownGuard::teardown() {
    done_ = true;
    loop_.close();
    flush_output_streams();
}

} // namespace stackhost
