/**
 * @file main_headless.cpp
 * @brief Command-line entry point that runs a scenario without a window.
 *
 * Usage:
 *   gravsim_headless [--steps N] [--dt S] [--seed N] [--debris N]
 *                    [--threads N] [--gravity G] [--report-every N]
 */

#include <cstdint>
#include <exception>
#include <iostream>
#include <random>
#include <string>

#include "gravsim/core/body_registry.hpp"
#include "gravsim/core/profile.hpp"
#include "gravsim/core/simulator.hpp"
#include "gravsim/scenarios/planetary_collision.hpp"

namespace {

struct RunOptions {
    std::size_t steps = 600;
    double dt = 1.0 / 60.0;
    std::uint64_t seed = 1;
    std::size_t reportEvery = 60;
    PlanetaryCollisionConfig scenario;
    SystemConfig system;
};

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " [--steps N] [--dt S] [--seed N] [--debris N]"
                 " [--threads N] [--gravity G] [--report-every N]\n";
}

// Returns false if the arguments could not be parsed
bool parseArgs(int argc, char** argv, RunOptions& opts) {
    opts.system = PlanetaryCollisionScenario(opts.scenario).getConfig();

    for (int i = 1; i < argc; ++i) {
        std::string const a = argv[i];
        bool const hasValue = i + 1 < argc;

        if (a == "--help" || a == "-h") {
            return false;
        } else if (a == "--steps" && hasValue) {
            opts.steps = std::stoul(argv[++i]);
        } else if (a == "--dt" && hasValue) {
            opts.dt = std::stod(argv[++i]);
        } else if (a == "--seed" && hasValue) {
            opts.seed = std::stoull(argv[++i]);
        } else if (a == "--debris" && hasValue) {
            opts.scenario.debrisCount = std::stoi(argv[++i]);
        } else if (a == "--threads" && hasValue) {
            opts.system.Threads = static_cast<unsigned int>(std::stoul(argv[++i]));
        } else if (a == "--gravity" && hasValue) {
            opts.system.GravitationalConstant = std::stod(argv[++i]);
        } else if (a == "--report-every" && hasValue) {
            opts.reportEvery = std::stoul(argv[++i]);
        } else {
            std::cerr << "Unknown or incomplete argument: " << a << "\n";
            return false;
        }
    }
    return true;
}

void report(std::size_t step, const BodyRegistry& bodies, const StepReport& last) {
    Vector const p = bodies.totalMomentum();
    std::cout << "step " << step
              << "  collisions " << last.collisions.size()
              << "  momentum (" << p.x << ", " << p.y << ", " << p.z << ")"
              << "  kinetic " << bodies.totalKineticEnergy()
              << "\n";
}

} // namespace

int main(int argc, char** argv) {
    RunOptions opts;
    try {
        if (!parseArgs(argc, argv, opts)) {
            printUsage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument value: " << e.what() << "\n";
        printUsage(argv[0]);
        return 1;
    }

    try {
        PROFILE_SCOPE("main");

        PlanetaryCollisionScenario const scenario(opts.scenario);
        std::mt19937_64 rng(opts.seed);

        BodyRegistry bodies;
        scenario.createBodies(bodies, rng);

        Simulator simulator(opts.system);
        std::cout << "[Simulator] " << bodies.size() << " bodies, "
                  << bodies.pairCount() << " pairs, "
                  << opts.system.Threads << " gravity threads\n";

        std::size_t totalCollisions = 0;
        for (std::size_t s = 1; s <= opts.steps; ++s) {
            StepReport const last = simulator.step(bodies, opts.dt);
            totalCollisions += last.collisions.size();

            if (bodies.hasNonFiniteState()) {
                std::cerr << "[Simulator] Error: non-finite body state after step " << s << "\n";
                return 2;
            }
            if (opts.reportEvery > 0 && s % opts.reportEvery == 0) {
                report(s, bodies, last);
            }
        }

        std::cout << "[Simulator] " << opts.steps << " steps, "
                  << totalCollisions << " collision events\n";
    } catch (const std::exception& e) {
        std::cerr << "[Simulator] Error: " << e.what() << "\n";
        return 1;
    }

    Profiling::Profiler::printStats(std::cout);
    return 0;
}
