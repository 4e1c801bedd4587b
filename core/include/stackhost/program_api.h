#pragma once

// Program ABI (v1) for user programs hosted by stackhost.
//
// A user program is a shared library. It never links against host or runtime
// symbols; everything it needs is reached through the IProgramContext handed
// to its entry point.

#include "stackhost/deferred.h"
#include "stackhost/errors.h"
#include "stackhost/settings.h"

#include <cerrno>
#include <cstdlib>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

// ABI version constant. Programs should export stackhost_program_abi_version()
// returning this value.
#define STACKHOST_PROGRAM_ABI_VERSION 1

namespace stackhost {

// One resource registration sent to the resource monitor.
struct ResourceRequest {
    std::string type;               // "<package>:<module>:<type>"
    std::string name;
    std::string inputs_json{"{}"};  // JSON object
    std::string parent_urn;         // empty = root stack resource
};

// Host callback interface implemented by the runtime library.
struct IProgramContext {
    virtual ~IProgramContext() = default;

    virtual const RuntimeSettings& settings() const = 0;

    // Synchronous config lookup; no round-trip to the engine.
    virtual bool config(const std::string& key, std::string* value) const = 0;
    virtual bool is_secret(const std::string& key) const = 0;

    // Starts an asynchronous registration. The returned deferred resolves to
    // a JSON object {"id":...,"outputs":{...},"urn":...}. The run does not
    // finish until it settles, whether or not the caller keeps the handle.
    virtual DeferredPtr register_resource(const ResourceRequest& req) = 0;

    // Runs fn with dep's value once dep resolves. Anything fn registers, and
    // anything it throws, is folded into the run.
    virtual DeferredPtr apply(const DeferredPtr& dep,
                              std::function<std::string(const std::string&)> fn) = 0;

    // Adds an output to the root stack resource.
    virtual void export_value(const std::string& name, const std::string& value_json) = 0;
};

// Namespaced view over the config store, e.g. Config(ctx, "aws").get("region")
// reads "aws:region". The namespace defaults to the project name.
class Config {
public:
    explicit Config(const IProgramContext& ctx) : Config(ctx, ctx.settings().project) {}
    Config(const IProgramContext& ctx, std::string ns) : ctx_(ctx), ns_(std::move(ns)) {}

    std::string full_key(const std::string& key) const {
        if (ns_.empty() || key.find(':') != std::string::npos) return key;
        return ns_ + ":" + key;
    }

    std::optional<std::string> get(const std::string& key) const {
        std::string v;
        if (!ctx_.config(full_key(key), &v)) return std::nullopt;
        return v;
    }

    std::string require(const std::string& key) const {
        auto v = get(key);
        if (!v) throw ConfigMissingError(full_key(key));
        return *v;
    }

    std::optional<long long> get_int(const std::string& key) const {
        auto v = get(key);
        if (!v) return std::nullopt;
        return to_int(key, *v);
    }

    long long require_int(const std::string& key) const {
        return to_int(key, require(key));
    }

    bool is_secret(const std::string& key) const {
        return ctx_.is_secret(full_key(key));
    }

private:
    long long to_int(const std::string& key, const std::string& v) const {
        if (v.empty()) throw ConfigTypeError(full_key(key), v, "integer");
        char* end = nullptr;
        errno = 0;
        long long n = std::strtoll(v.c_str(), &end, 10);
        if (errno != 0 || end == v.c_str() || *end != '\0') {
            throw ConfigTypeError(full_key(key), v, "integer");
        }
        return n;
    }

    const IProgramContext& ctx_;
    std::string ns_;
};

} // namespace stackhost

// Program entry point. A program must export a function with C linkage:
//   extern "C" int stackhost_program_main(stackhost::IProgramContext* ctx, int argc, char** argv);
// argv[0] is the program path as given to the host, followed by its own
// arguments. A non-zero return fails the run.
//
// Optional ABI version export (required unless STACKHOST_PROGRAM_ABI_LAX=1):
//   extern "C" int stackhost_program_abi_version();
extern "C" {
    typedef int (*stackhost_program_main_fn)(stackhost::IProgramContext* ctx, int argc, char** argv);
    typedef int (*stackhost_program_abi_version_fn)();
}
