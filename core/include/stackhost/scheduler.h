#pragma once

#include <cstdint>
#include <functional>

namespace stackhost {

// Cooperative scheduler as seen by the runtime library and by Deferred.
// The host's EventLoop is the only implementation; the runtime never creates
// one of its own.
class IScheduler {
public:
    using Callback = std::function<void()>;

    virtual ~IScheduler() = default;

    // Queue fn to run on a later turn of the loop, in FIFO order.
    virtual void call_soon(Callback fn) = 0;

    // Queue fn to run once delay_ms has elapsed.
    virtual void call_later(int64_t delay_ms, Callback fn) = 0;

    // The only entry point that may be called from another thread.
    virtual void call_soon_threadsafe(Callback fn) = 0;

    // Count of outstanding external work (e.g. an RPC completing on another
    // thread). While non-zero, an idle loop waits instead of reporting a stall.
    virtual void retain() = 0;
    virtual void release() = 0;

    virtual bool is_closed() const = 0;
};

} // namespace stackhost
