#include "stackhost/args.h"
#include "stackhost/errors.h"

#include <cctype>
#include <climits>
#include <sstream>

namespace stackhost {

namespace {

enum class Flag { PROJECT, STACK, PARALLEL, DRY_RUN, PWD, MONITOR, ENGINE, TRACING };

struct FlagSpec {
    const char* name;
    Flag flag;
};

constexpr FlagSpec kFlags[] = {
    {"--project",  Flag::PROJECT},
    {"--stack",    Flag::STACK},
    {"--parallel", Flag::PARALLEL},
    {"--dry_run",  Flag::DRY_RUN},
    {"--pwd",      Flag::PWD},
    {"--monitor",  Flag::MONITOR},
    {"--engine",   Flag::ENGINE},
    {"--tracing",  Flag::TRACING},
};

const FlagSpec* find_flag(const std::string& name) {
    for (const auto& f : kFlags) {
        if (name == f.name) return &f;
    }
    return nullptr;
}

void apply_flag(InvocationArgs& out, Flag flag, const std::string& value) {
    switch (flag) {
        case Flag::PROJECT:  out.project = value; break;
        case Flag::STACK:    out.stack = value; break;
        case Flag::PARALLEL: out.parallel = parse_parallel(value); break;
        case Flag::DRY_RUN:  out.dry_run = parse_dry_run(value); break;
        case Flag::PWD:      out.pwd = std::filesystem::path(value); break;
        case Flag::MONITOR:  out.monitor_address = value; break;
        case Flag::ENGINE:   out.engine_address = value; break;
        case Flag::TRACING:  out.tracing = value; break;
    }
}

} // namespace

bool parse_dry_run(const std::string& text) {
    return text == "true";
}

int parse_parallel(const std::string& text) {
    if (text.empty()) throw UsageError("argument --parallel: expected an integer, got ''");
    long long v = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw UsageError("argument --parallel: invalid int value: '" + text + "'");
        }
        v = v * 10 + (c - '0');
        if (v > INT_MAX) throw UsageError("argument --parallel: value out of range: '" + text + "'");
    }
    return static_cast<int>(v);
}

InvocationArgs parse_invocation_args(const std::vector<std::string>& argv) {
    InvocationArgs out;
    bool have_program = false;
    bool flags_done = false;

    for (size_t i = 1; i < argv.size(); i++) {
        const std::string& tok = argv[i];

        if (have_program) {
            out.program_args.push_back(tok);
            continue;
        }

        if (!flags_done && tok == "--") {
            flags_done = true;
            continue;
        }

        if (!flags_done && (tok == "-h" || tok == "--help")) {
            out.show_help = true;
            return out;
        }

        if (!flags_done && tok.size() > 1 && tok[0] == '-') {
            std::string name = tok;
            std::optional<std::string> value;
            auto eq = tok.find('=');
            if (eq != std::string::npos) {
                name = tok.substr(0, eq);
                value = tok.substr(eq + 1);
            }

            const FlagSpec* spec = find_flag(name);
            if (!spec) throw UsageError("unrecognized argument: " + name);

            if (!value) {
                if (i + 1 >= argv.size()) throw UsageError("argument " + name + ": expected one argument");
                value = argv[++i];
            }
            apply_flag(out, spec->flag, *value);
            continue;
        }

        out.program = tok;
        have_program = true;
    }

    if (!have_program) throw UsageError("the following arguments are required: PROGRAM");
    return out;
}

InvocationArgs parse_invocation_args(int argc, char** argv) {
    std::vector<std::string> v;
    v.reserve(static_cast<size_t>(argc > 0 ? argc : 0));
    for (int i = 0; i < argc; i++) v.emplace_back(argv[i] ? argv[i] : "");
    return parse_invocation_args(v);
}

std::string usage_text(const std::string& argv0) {
    std::ostringstream oss;
    oss << "usage: " << argv0
        << " [--project NAME] [--stack NAME] [--parallel N] [--dry_run true|false]\n"
        << "       [--pwd DIR] [--monitor ADDR] [--engine ADDR] [--tracing ENDPOINT]\n"
        << "       PROGRAM [ARGS...]\n"
        << "env: STACKHOST_CONFIG, STACKHOST_CONFIG_SECRET_KEYS, STACKHOST_RUNTIME_LIB, STACKHOST_LOG_LEVEL\n";
    return oss.str();
}

} // namespace stackhost
