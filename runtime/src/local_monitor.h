#pragma once

#include "stackhost/deferred.h"
#include "stackhost/program_api.h"
#include "stackhost/settings.h"

#include <cstdint>
#include <deque>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace stackhost::runtime {

// In-process resource monitor. Every registration is answered on a later
// loop turn, never inline, so programs see the same asynchrony a remote
// monitor gives them. At most settings.parallel registrations are in flight
// (0 = no cap); the rest wait in FIFO order.
//
// Rejections (ResourceError):
//   - type token not of the form <package>:<module>:<type>
//   - empty name
//   - inputs that are not a JSON object
//   - a URN that was already registered in this run
class LocalMonitor {
public:
    explicit LocalMonitor(const RuntimeSettings& settings) : settings_(settings) {}

    // Binds the monitor to the loop of a new run and forgets the previous one.
    void attach(IScheduler& loop);

    DeferredPtr register_resource(const ResourceRequest& req);

    // Completes a resource with its outputs (used for the root stack resource).
    DeferredPtr register_outputs(const std::string& urn,
                                 const std::map<std::string, std::string>& outputs_json);

    std::string make_urn(const std::string& type, const std::string& name) const;

    size_t in_flight() const { return in_flight_; }
    size_t queued() const { return queue_.size(); }
    size_t max_in_flight() const { return max_in_flight_; }
    const std::vector<std::string>& registered_urns() const { return urns_in_order_; }

private:
    struct Pending {
        ResourceRequest req;
        bool outputs_only{false};
        std::string urn;
        std::map<std::string, std::string> outputs_json;
        DeferredPtr result;
    };

    DeferredPtr enqueue(Pending p);
    void dispatch();
    void complete(Pending& p);
    std::string resolve_registration(const ResourceRequest& req);
    std::string resolve_outputs(const Pending& p);
    std::string make_id(const std::string& name, const std::string& urn) const;

    const RuntimeSettings& settings_;
    IScheduler* loop_{nullptr};
    std::deque<Pending> queue_;
    size_t in_flight_{0};
    size_t max_in_flight_{0};
    std::set<std::string> urns_;
    std::vector<std::string> urns_in_order_;
};

// "pkg:module:Type" with three non-empty parts.
bool valid_type_token(const std::string& type);

} // namespace stackhost::runtime
