#include "runtime_state.h"

namespace stackhost::runtime {

Runtime& runtime_instance() {
    static Runtime rt;
    return rt;
}

} // namespace stackhost::runtime
