#include "stackhost/log.h"

#include <json-c/json.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <utility>
#include <vector>

namespace stackhost {

namespace {

std::mutex g_sink_mu;
std::ostream* g_sink = nullptr;

std::mutex g_channels_mu;

std::map<std::string, std::unique_ptr<LogChannel>>& channels() {
    static std::map<std::string, std::unique_ptr<LogChannel>> m;
    return m;
}

std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return oss.str();
}

// Serialize a flat json-c object with sorted keys so records are stable
// for tests and for line-oriented consumers.
void sorted_serialize(json_object* obj, std::ostringstream& out) {
    std::vector<std::string> keys;
    json_object_object_foreach(obj, k, v) {
        (void)v;
        keys.emplace_back(k);
    }
    std::sort(keys.begin(), keys.end());

    out << "{";
    for (size_t i = 0; i < keys.size(); i++) {
        if (i > 0) out << ",";
        json_object* ks = json_object_new_string(keys[i].c_str());
        out << json_object_to_json_string_ext(ks, JSON_C_TO_STRING_PLAIN);
        json_object_put(ks);
        out << ":";
        json_object* val = nullptr;
        json_object_object_get_ex(obj, keys[i].c_str(), &val);
        out << json_object_to_json_string_ext(val, JSON_C_TO_STRING_PLAIN);
    }
    out << "}";
}

} // namespace

const char* severity_name(Severity s) {
    switch (s) {
        case Severity::DEBUG:    return "debug";
        case Severity::INFO:     return "info";
        case Severity::WARNING:  return "warning";
        case Severity::ERROR:    return "error";
        case Severity::CRITICAL: return "critical";
    }
    return "error";
}

std::optional<Severity> parse_severity(const std::string& s) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (v == "debug") return Severity::DEBUG;
    if (v == "info") return Severity::INFO;
    if (v == "warning" || v == "warn") return Severity::WARNING;
    if (v == "error") return Severity::ERROR;
    if (v == "critical") return Severity::CRITICAL;
    return std::nullopt;
}

std::string format_log_record(const std::string& channel, Severity s, const std::string& message) {
    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "channel", json_object_new_string(channel.c_str()));
    json_object_object_add(rec, "message",
        json_object_new_string_len(message.c_str(), static_cast<int>(message.size())));
    json_object_object_add(rec, "severity", json_object_new_string(severity_name(s)));
    json_object_object_add(rec, "ts", json_object_new_string(iso_now().c_str()));

    std::ostringstream out;
    sorted_serialize(rec, out);
    json_object_put(rec);
    return out.str();
}

LogChannel::LogChannel(std::string name, Severity threshold)
    : name_(std::move(name)), threshold_(threshold) {}

void LogChannel::log(Severity s, const std::string& message) {
    if (!enabled(s)) return;
    std::string line = format_log_record(name_, s, message);
    std::lock_guard<std::mutex> lk(g_sink_mu);
    std::ostream& out = g_sink ? *g_sink : std::cerr;
    out << line << "\n";
    out.flush();
}

LogChannel& log_channel(const std::string& name) {
    std::lock_guard<std::mutex> lk(g_channels_mu);
    auto& m = channels();
    auto it = m.find(name);
    if (it == m.end()) {
        it = m.emplace(name, std::make_unique<LogChannel>(name)).first;
    }
    return *it->second;
}

void set_log_sink(std::ostream* out) {
    std::lock_guard<std::mutex> lk(g_sink_mu);
    g_sink = out;
}

void flush_log_sink() {
    std::lock_guard<std::mutex> lk(g_sink_mu);
    std::ostream& out = g_sink ? *g_sink : std::cerr;
    out.flush();
}

} // namespace stackhost
