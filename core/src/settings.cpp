#include "stackhost/settings.h"
#include "stackhost/args.h"

namespace stackhost {

RuntimeSettings build_runtime_settings(const InvocationArgs& args) {
    RuntimeSettings s;
    s.monitor_address = args.monitor_address;
    s.engine_address = args.engine_address;
    s.project = args.project.value_or("");
    s.stack = args.stack.value_or("");
    s.parallel = args.parallel;
    s.dry_run = args.dry_run;
    return s;
}

} // namespace stackhost
