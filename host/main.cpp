#include "stackhost/host.h"

#include <exception>
#include <iostream>

// stackhost PROGRAM [ARGS...]: runs one user program under stack supervision
// and exits 0 on success, 1 on any failure.
int main(int argc, char** argv) {
    try {
        return stackhost::run_host(argc, argv);
    } catch (const std::exception& e) {
        // Teardown faults (e.g. stdout on a full disk) still map to exit 1.
        std::cerr << "fatal: " << e.what() << std::endl;
        return 1;
    }
}
