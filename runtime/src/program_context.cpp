#include "program_context.h"

#include "stackhost/errors.h"
#include "stackhost/log.h"

#include <utility>

namespace stackhost::runtime {

bool RuntimeProgramContext::config(const std::string& key, std::string* value) const {
    return config_.get(key, value);
}

bool RuntimeProgramContext::is_secret(const std::string& key) const {
    return config_.is_secret(key);
}

DeferredPtr RuntimeProgramContext::register_resource(const ResourceRequest& req) {
    if (!supervisor_.active()) {
        throw SchedulerError("register_resource called outside of a stack run");
    }
    log_channel("stackhost.runtime").debug("registering " + req.type + " '" + req.name + "'");
    DeferredPtr op = monitor_.register_resource(req);
    supervisor_.track(op);
    return op;
}

DeferredPtr RuntimeProgramContext::apply(const DeferredPtr& dep,
                                         std::function<std::string(const std::string&)> fn) {
    if (!supervisor_.active() || !supervisor_.loop()) {
        throw SchedulerError("apply called outside of a stack run");
    }
    if (!dep) throw SchedulerError("apply called with a null dependency");

    DeferredPtr out = make_deferred(*supervisor_.loop());
    supervisor_.track(out);
    dep->on_settled([out, fn = std::move(fn)](const Deferred& d) {
        if (d.failed()) {
            out->reject(d.error());
            return;
        }
        std::string v;
        try {
            v = fn(d.value());
        } catch (...) {
            out->reject(std::current_exception());
            return;
        }
        out->resolve(std::move(v));
    });
    return out;
}

void RuntimeProgramContext::export_value(const std::string& name, const std::string& value_json) {
    supervisor_.export_value(name, value_json);
}

} // namespace stackhost::runtime
