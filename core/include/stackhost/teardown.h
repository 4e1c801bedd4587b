#pragma once

namespace stackhost {

class EventLoop;

// Scoped teardown around the supervised run: closes the loop and flushes the
// primary and diagnostic streams exactly once, on every exit path.
class TeardownGuard {
public:
    explicit TeardownGuard(EventLoop& loop) : loop_(loop) {}

    // Tears down if release() has not. A close or flush fault is logged on
    // stackhost.host rather than thrown.
    ~TeardownGuard();

    TeardownGuard(const TeardownGuard&) = delete;
    TeardownGuard& operator=(const TeardownGuard&) = delete;

    // Tears down now. A close or flush fault propagates to the caller.
    // Later calls, and the destructor, do nothing.
    void release();

    bool done() const { return done_; }

private:
    void teardown();

    EventLoop& loop_;
    bool done_{false};
};

// Flushes std::cout, std::cerr, the log sink and the C stdio streams.
// Throws std::runtime_error if a stream reports a write failure.
void flush_output_streams();

} // namespace stackhost
