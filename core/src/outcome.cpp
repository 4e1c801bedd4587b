#include "stackhost/outcome.h"
#include "stackhost/errors.h"
#include "stackhost/log.h"

#include <cstdlib>
#include <cxxabi.h>
#include <memory>
#include <sstream>
#include <typeinfo>

namespace stackhost {

namespace {

std::string demangle(const char* mangled) {
    if (!mangled) return "(unknown)";
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> out(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
    if (status == 0 && out) return out.get();
    return mangled;
}

std::string current_exception_type_name() {
    const std::type_info* ti = abi::__cxa_current_exception_type();
    return ti ? demangle(ti->name()) : "(unknown)";
}

void append_trace(std::ostringstream& out, std::exception_ptr err, int depth) {
    const std::string indent(static_cast<size_t>(depth) * 2, ' ');
    const char* lead = depth == 0 ? "" : "caused by: ";
    try {
        std::rethrow_exception(err);
    } catch (const std::exception& e) {
        out << indent << lead << demangle(typeid(e).name()) << ": " << e.what() << "\n";
        try {
            std::rethrow_if_nested(e);
        } catch (...) {
            append_trace(out, std::current_exception(), depth + 1);
        }
    } catch (...) {
        out << indent << lead << "non-standard exception of type " << current_exception_type_name() << "\n";
    }
}

// Innermost what() of a nested chain; that is the failure the user cares about.
std::string root_message(std::exception_ptr err) {
    try {
        std::rethrow_exception(err);
    } catch (const std::exception& e) {
        try {
            std::rethrow_if_nested(e);
        } catch (...) {
            return root_message(std::current_exception());
        }
        return e.what();
    } catch (...) {
        return "non-standard exception of type " + current_exception_type_name();
    }
}

} // namespace

std::string exception_trace(std::exception_ptr err) {
    if (!err) return "";
    std::ostringstream out;
    append_trace(out, err, 0);
    return out.str();
}

RunOutcome classify_exception(std::exception_ptr err) {
    if (!err) return Success{};
    try {
        std::rethrow_exception(err);
    } catch (const RunError& e) {
        return DomainError{e.what()};
    } catch (...) {
        return UnhandledFault{root_message(err), exception_trace(err)};
    }
}

RunOutcome classify_run(const std::function<void()>& drive, IEngineLog& log) {
    // Once the run ends abnormally the loop may still hold unsettled work;
    // its own warnings about that are expected and must not reach the user.
    log_channel("stackhost.scheduler").set_threshold(Severity::CRITICAL);

    std::exception_ptr err;
    try {
        drive();
    } catch (...) {
        err = std::current_exception();
    }

    RunOutcome outcome = classify_exception(err);
    if (auto* d = std::get_if<DomainError>(&outcome)) {
        log.error(d->message);
    } else if (auto* f = std::get_if<UnhandledFault>(&outcome)) {
        log.error(std::string(kUnhandledFaultPreface) + "\n" + f->stack_trace);
    }
    return outcome;
}

const char* outcome_name(const RunOutcome& outcome) {
    switch (outcome.index()) {
        case 0: return "success";
        case 1: return "domain_error";
        case 2: return "unhandled_fault";
    }
    return "unhandled_fault";
}

int exit_code_for(const RunOutcome& outcome) {
    return std::holds_alternative<Success>(outcome) ? 0 : 1;
}

} // namespace stackhost
