#include "test_common.h"
#include "stackhost/deferred.h"
#include "stackhost/errors.h"
#include "stackhost/event_loop.h"
#include "stackhost/log.h"

#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace stackhost;

int main() {
    // Test 1: call_soon runs in FIFO order; settlement callbacks are never inline
    {
        EventLoop loop;
        std::vector<int> order;
        auto fut = make_deferred(loop);
        loop.call_soon([&] { order.push_back(1); });
        loop.call_soon([&] {
            order.push_back(2);
            fut->on_settled([&](const Deferred& d) { order.push_back(d.failed() ? -1 : 4); });
            fut->resolve("ok");
            order.push_back(3);
        });
        auto done = make_deferred(loop);
        fut->on_settled([&](const Deferred&) { done->resolve(""); });
        loop.run_until_complete(done);
        expect_eq_ll(static_cast<long long>(order.size()), 4, "four steps");
        for (int i = 0; i < 4; i++) expect_eq_ll(order[i], i + 1, "order " + std::to_string(i));
        expect_eq_str(fut->value(), "ok", "resolved value");
    }

    // Test 2: timers fire by due time, ties in insertion order
    {
        EventLoop loop;
        std::vector<int> order;
        auto done = make_deferred(loop);
        loop.call_later(20, [&] { order.push_back(3); done->resolve(""); });
        loop.call_later(5, [&] { order.push_back(1); });
        loop.call_later(5, [&] { order.push_back(2); });
        loop.run_until_complete(done);
        expect_eq_ll(static_cast<long long>(order.size()), 3, "three timers");
        expect_eq_ll(order[0], 1, "first timer");
        expect_eq_ll(order[1], 2, "tie keeps insertion order");
        expect_eq_ll(order[2], 3, "latest timer last");
    }

    // Test 3: work posted from another thread wakes the loop
    {
        EventLoop loop;
        auto done = make_deferred(loop);
        loop.retain();
        std::thread worker([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            loop.call_soon_threadsafe([&] { done->resolve("from worker"); });
            loop.release();
        });
        loop.run_until_complete(done);
        worker.join();
        expect_eq_str(done->value(), "from worker", "threadsafe value");
    }

    // Test 4: a stalled run is reported instead of hanging
    {
        EventLoop loop;
        auto never = make_deferred(loop);
        std::string msg;
        expect_true(throws<SchedulerError>([&] { loop.run_until_complete(never); }, &msg), "stall detected");
        expect_true(contains(msg, "ran out of work"), "stall message: " + msg);
        expect_true(!loop.is_running(), "running flag cleared after throw");
    }

    // Test 5: a throwing callback is logged and the loop continues
    {
        std::ostringstream sink;
        set_log_sink(&sink);
        EventLoop loop;
        auto done = make_deferred(loop);
        loop.call_soon([] { throw std::runtime_error("callback blew up"); });
        loop.call_soon([&] { done->resolve(""); });
        loop.run_until_complete(done);
        set_log_sink(nullptr);
        expect_true(done->done(), "later callback still ran");
        expect_true(contains(sink.str(), "callback blew up"), "failure logged");
        expect_true(contains(sink.str(), "stackhost.scheduler"), "on the scheduler channel");
    }

    // Test 6: failed deferreds rethrow; settling twice is an error
    {
        EventLoop loop;
        auto d = make_deferred(loop);
        expect_true(throws<SchedulerError>([&] { d->value(); }), "pending value throws");
        d->reject(std::make_exception_ptr(std::invalid_argument("bad")));
        expect_true(d->failed(), "failed");
        expect_true(throws<std::invalid_argument>([&] { d->value(); }), "value rethrows");
        expect_true(throws<SchedulerError>([&] { d->resolve("x"); }), "double settle");
    }

    // Test 7: close drops pending work, is idempotent, and rejects new work
    {
        EventLoop loop;
        loop.call_soon([] {});
        loop.call_later(1000, [] {});
        expect_eq_ll(static_cast<long long>(loop.pending_callbacks()), 2, "two pending");
        log_channel("stackhost.scheduler").set_threshold(Severity::CRITICAL);
        loop.close();
        log_channel("stackhost.scheduler").set_threshold(Severity::WARNING);
        expect_true(loop.is_closed(), "closed");
        expect_eq_ll(static_cast<long long>(loop.pending_callbacks()), 0, "dropped");
        loop.close();
        expect_true(throws<SchedulerError>([&] { loop.call_soon([] {}); }), "call_soon after close");
        expect_true(throws<SchedulerError>([&] { loop.run_until_complete(make_deferred(loop)); }),
                    "run after close");
    }

    // Test 8: close from inside a running loop is refused
    {
        EventLoop loop;
        auto done = make_deferred(loop);
        bool refused = false;
        loop.call_soon([&] {
            refused = throws<SchedulerError>([&] { loop.close(); });
            done->resolve("");
        });
        loop.run_until_complete(done);
        expect_true(refused, "close while running");
    }

    // Test 9: one loop per thread
    {
        expect_true(current_event_loop() == nullptr, "no loop yet");
        EventLoop& a = acquire_event_loop();
        EventLoop& b = acquire_event_loop();
        expect_true(&a == &b, "same loop on the same thread");
        expect_true(current_event_loop() == &a, "current loop installed");

        EventLoop* other = nullptr;
        std::thread t([&] { other = &acquire_event_loop(); });
        t.join();
        expect_true(other != &a, "other thread gets its own loop");
    }

    std::cerr << "test_event_loop: ALL PASSED" << std::endl;
    return 0;
}
