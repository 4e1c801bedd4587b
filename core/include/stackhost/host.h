#pragma once

namespace stackhost {

// Full host lifecycle for one run:
//   Start -> SettingsBuilt -> ConfigInjected -> LoopAcquired -> Running
//         -> {Succeeded | DomainFailed | Faulted} -> TornDown -> Exited(code)
// Returns 0 only for a successful run; every failure class returns 1.
int run_host(int argc, char** argv);

} // namespace stackhost
