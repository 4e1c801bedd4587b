#include "local_monitor.h"

#include "stackhost/errors.h"

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cstdio>
#include <memory>
#include <utility>

namespace stackhost::runtime {

namespace {

uint64_t fnv1a64(const std::string& s) {
    uint64_t h = 1469598103934665603ull;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ull;
    }
    return h;
}

// True if nothing but whitespace follows offset. The tokener stops after the
// first complete value, so trailing bytes are checked here.
bool only_whitespace_from(const std::string& text, size_t offset) {
    for (size_t i = offset; i < text.size(); i++) {
        const char c = text[i];
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') return false;
    }
    return true;
}

// Parses text as a JSON object, or returns nullptr.
json_object* parse_object(const std::string& text) {
    json_tokener* tok = json_tokener_new();
    if (!tok) return nullptr;
    json_object* obj = json_tokener_parse_ex(tok, text.c_str(),
        static_cast<int>(std::min(text.size(), static_cast<size_t>(INT_MAX))));
    json_tokener_error jerr = json_tokener_get_error(tok);
    const size_t end = static_cast<size_t>(tok->char_offset);
    json_tokener_free(tok);
    if (jerr != json_tokener_success || !obj || !json_object_is_type(obj, json_type_object)
        || !only_whitespace_from(text, end)) {
        if (obj) json_object_put(obj);
        return nullptr;
    }
    return obj;
}

// Parses any JSON value. A literal null yields true with *out == nullptr.
bool parse_value(const std::string& text, json_object** out) {
    *out = nullptr;
    json_tokener* tok = json_tokener_new();
    if (!tok) return false;
    // Include the terminating NUL so a bare top-level number is complete.
    json_object* obj = json_tokener_parse_ex(tok, text.c_str(),
        static_cast<int>(std::min(text.size() + 1, static_cast<size_t>(INT_MAX))));
    json_tokener_error jerr = json_tokener_get_error(tok);
    const size_t end = static_cast<size_t>(tok->char_offset);
    json_tokener_free(tok);
    if (jerr != json_tokener_success || !only_whitespace_from(text, end)) {
        if (obj) json_object_put(obj);
        return false;
    }
    *out = obj;
    return true;
}

std::string to_string_and_put(json_object* obj) {
    std::string out = json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
    json_object_put(obj);
    return out;
}

} // namespace

bool valid_type_token(const std::string& type) {
    auto a = type.find(':');
    if (a == std::string::npos || a == 0) return false;
    auto b = type.find(':', a + 1);
    if (b == std::string::npos || b == a + 1) return false;
    if (b + 1 >= type.size()) return false;
    return type.find(':', b + 1) == std::string::npos;
}

void LocalMonitor::attach(IScheduler& loop) {
    loop_ = &loop;
    queue_.clear();
    in_flight_ = 0;
    max_in_flight_ = 0;
    urns_.clear();
    urns_in_order_.clear();
}

std::string LocalMonitor::make_urn(const std::string& type, const std::string& name) const {
    return "urn:stackhost:" + settings_.stack + "::" + settings_.project + "::" + type + "::" + name;
}

std::string LocalMonitor::make_id(const std::string& name, const std::string& urn) const {
    if (settings_.dry_run) return "";  // ids are unknown during a preview
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(fnv1a64(urn)));
    return name + "-" + std::string(buf, 8);
}

DeferredPtr LocalMonitor::register_resource(const ResourceRequest& req) {
    Pending p;
    p.req = req;
    return enqueue(std::move(p));
}

DeferredPtr LocalMonitor::register_outputs(const std::string& urn,
                                           const std::map<std::string, std::string>& outputs_json) {
    Pending p;
    p.outputs_only = true;
    p.urn = urn;
    p.outputs_json = outputs_json;
    return enqueue(std::move(p));
}

DeferredPtr LocalMonitor::enqueue(Pending p) {
    if (!loop_) throw SchedulerError("resource monitor is not attached to a run");
    p.result = make_deferred(*loop_);
    DeferredPtr result = p.result;
    queue_.push_back(std::move(p));
    dispatch();
    return result;
}

void LocalMonitor::dispatch() {
    const size_t cap = settings_.parallel > 0 ? static_cast<size_t>(settings_.parallel) : 0;
    while (!queue_.empty() && (cap == 0 || in_flight_ < cap)) {
        auto p = std::make_shared<Pending>(std::move(queue_.front()));
        queue_.pop_front();
        in_flight_++;
        if (in_flight_ > max_in_flight_) max_in_flight_ = in_flight_;
        loop_->call_soon([this, p]() { complete(*p); });
    }
}

void LocalMonitor::complete(Pending& p) {
    in_flight_--;
    try {
        p.result->resolve(p.outputs_only ? resolve_outputs(p) : resolve_registration(p.req));
    } catch (const ResourceError&) {
        p.result->reject(std::current_exception());
    }
    dispatch();
}

std::string LocalMonitor::resolve_registration(const ResourceRequest& req) {
    if (!valid_type_token(req.type)) {
        throw ResourceError("invalid resource type token '" + req.type
                            + "': expected <package>:<module>:<type>");
    }
    if (req.name.empty()) {
        throw ResourceError("resource of type '" + req.type + "' has an empty name");
    }

    const std::string urn = make_urn(req.type, req.name);
    if (urns_.count(urn)) {
        throw ResourceError("Duplicate resource URN '" + urn + "'; try giving it a unique name");
    }

    json_object* inputs = parse_object(req.inputs_json.empty() ? "{}" : req.inputs_json);
    if (!inputs) {
        throw ResourceError("inputs for '" + urn + "' are not a JSON object");
    }

    urns_.insert(urn);
    urns_in_order_.push_back(urn);

    json_object* out = json_object_new_object();
    json_object_object_add(out, "id", json_object_new_string(make_id(req.name, urn).c_str()));
    json_object_object_add(out, "outputs", inputs);
    json_object_object_add(out, "urn", json_object_new_string(urn.c_str()));
    return to_string_and_put(out);
}

std::string LocalMonitor::resolve_outputs(const Pending& p) {
    if (!urns_.count(p.urn)) {
        throw ResourceError("cannot complete unknown resource '" + p.urn + "'");
    }

    json_object* outputs = json_object_new_object();
    for (const auto& kv : p.outputs_json) {
        json_object* v = nullptr;
        if (!parse_value(kv.second, &v)) {
            json_object_put(outputs);
            throw ResourceError("stack output '" + kv.first + "' is not valid JSON");
        }
        json_object_object_add(outputs, kv.first.c_str(), v);
    }

    json_object* out = json_object_new_object();
    json_object_object_add(out, "outputs", outputs);
    json_object_object_add(out, "urn", json_object_new_string(p.urn.c_str()));
    return to_string_and_put(out);
}

} // namespace stackhost::runtime
