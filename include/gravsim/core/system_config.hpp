#pragma once

#include "gravsim/core/constants.hpp"

/**
 * @struct SystemConfig
 * @brief Holds the configuration parameters shared by every simulation system.
 */
struct SystemConfig {
    double GravitationalConstant = SimulatorConstants::DefaultG;

    // Pairs closer than this are treated as degenerate and skipped
    double MinSeparation = SimulatorConstants::DefaultMinSeparation;

    // Worker threads for the pairwise gravity pass; 1 runs it inline
    unsigned int Threads = 1;
};
