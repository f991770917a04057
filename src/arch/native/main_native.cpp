/**
 * @file main_native.cpp
 * @brief Main entry point for the SFML viewer.
 *
 * Creates a SimManager and runs the frame loop until the window closes.
 */

#include <cstdint>
#include <exception>
#include <iostream>
#include <string>

#include "gravsim/core/profile.hpp"
#include "gravsim/core/sim_manager.hpp"

int main(int argc, char** argv) {
    std::uint64_t seed = 1;
    if (argc > 1) {
        try {
            seed = std::stoull(argv[1]);
        } catch (const std::exception&) {
            std::cerr << "Usage: " << argv[0] << " [seed]\n";
            return 1;
        }
    }

    try {
        {
            PROFILE_SCOPE("main");
            SimManager simManager(seed);
            simManager.run();
        }
        Profiling::Profiler::printStats(std::cout);
    } catch (const std::exception& e) {
        std::cerr << "[SimManager] Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
