#pragma once
#include <optional>
#include <ostream>
#include <string>

namespace stackhost {

enum class Severity : int {
    DEBUG = 10,
    INFO = 20,
    WARNING = 30,
    ERROR = 40,
    CRITICAL = 50,
};

const char* severity_name(Severity s);
std::optional<Severity> parse_severity(const std::string& s);

// A named logging channel with its own threshold. All channels share one sink.
class LogChannel {
public:
    explicit LogChannel(std::string name, Severity threshold = Severity::WARNING);

    const std::string& name() const { return name_; }
    Severity threshold() const { return threshold_; }
    void set_threshold(Severity s) { threshold_ = s; }
    bool enabled(Severity s) const { return static_cast<int>(s) >= static_cast<int>(threshold_); }

    void log(Severity s, const std::string& message);
    void debug(const std::string& m)    { log(Severity::DEBUG, m); }
    void info(const std::string& m)     { log(Severity::INFO, m); }
    void warning(const std::string& m)  { log(Severity::WARNING, m); }
    void error(const std::string& m)    { log(Severity::ERROR, m); }
    void critical(const std::string& m) { log(Severity::CRITICAL, m); }

private:
    std::string name_;
    Severity threshold_;
};

// Returns the channel registered under name, creating it on first use.
// References stay valid for the process lifetime.
LogChannel& log_channel(const std::string& name);

// Replace the shared sink (nullptr restores std::cerr).
void set_log_sink(std::ostream* out);
void flush_log_sink();

// One JSONL record with sorted keys: {"channel","message","severity","ts"}.
std::string format_log_record(const std::string& channel, Severity s, const std::string& message);

} // namespace stackhost
