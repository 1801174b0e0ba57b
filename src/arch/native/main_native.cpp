/**
 * @fileoverview main_native.cpp
 * @brief Entry point for the SFML viewer.
 *
 * Usage: diagramsim_viewer [--verbose|--quiet] [--profile]
 */

#include <cstring>
#include <iostream>

#include "diagramsim/core/debug.hpp"
#include "diagramsim/core/profile.hpp"
#include "diagramsim/core/sim_manager.hpp"

int main(int argc, char** argv) {
    bool printProfile = false;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--verbose") == 0) {
            Debug::setLevel(DEBUG_LEVEL_VERBOSE);
        } else if (std::strcmp(argv[i], "--quiet") == 0) {
            Debug::setLevel(DEBUG_LEVEL_NONE);
        } else if (std::strcmp(argv[i], "--profile") == 0) {
            printProfile = true;
        }
    }

    SimManager simManager;
    if (!simManager.init()) {
        return 1;
    }
    simManager.run();

    if (printProfile) {
        Profiling::Profiler::printStats(std::cout);
    }
    return 0;
}
