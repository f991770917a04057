/**
 * @file gravity.cpp
 * @brief Implementation of the pairwise gravity system
 */

#include "gravsim/systems/gravity.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

#include "gravsim/core/debug.hpp"
#include "gravsim/core/profile.hpp"

namespace Systems {

unsigned int GravitySystem::workerCount(std::size_t bodyCount) const {
    unsigned int requested = std::max(1U, sysConfig.Threads);
    std::size_t const perThread = std::max<std::size_t>(1, specificConfig.minBodiesPerThread);
    std::size_t const useful = std::max<std::size_t>(1, bodyCount / perThread);
    return static_cast<unsigned int>(std::min<std::size_t>(requested, useful));
}

std::size_t GravitySystem::accumulateRows(std::size_t first, std::size_t stride,
                                          double dt, std::vector<Vector>& deltas) const {
    const std::size_t n = positions.size();
    double const G = sysConfig.GravitationalConstant;
    double const minSep2 = sysConfig.MinSeparation * sysConfig.MinSeparation;
    std::size_t skipped = 0;

    for (std::size_t i = first; i < n; i += stride) {
        for (std::size_t j = i + 1; j < n; ++j) {
            Vector const v = positions[i] - positions[j];
            double const r2 = v.lengthSquared();
            if (r2 <= minSep2) {
                ++skipped;
                continue;
            }

            double const r = std::sqrt(r2);
            Vector const pull = v * (G / r2 * dt / r);

            deltas[i] -= pull * masses[j];
            deltas[j] += pull * masses[i];
        }
    }
    return skipped;
}

void GravitySystem::update(BodyRegistry& bodies, double dt) {
    PROFILE_SCOPE("GravitySystem");

    skippedPairs = 0;
    const std::size_t n = bodies.size();
    if (n < 2) {
        return;
    }

    // All pairs read the positions as they were when the pass started
    positions.resize(n);
    masses.resize(n);
    bodies.forEachBody([&](std::size_t i, entt::entity e) {
        positions[i] = bodies.position(e);
        masses[i] = bodies.mass(e);
    });

    unsigned int const threads = workerCount(n);
    lastThreadCount = threads;
    threadDeltas.resize(threads);
    for (auto& deltas : threadDeltas) {
        deltas.assign(n, Vector());
    }

    if (threads == 1) {
        skippedPairs = accumulateRows(0, 1, dt, threadDeltas[0]);
    } else {
        std::vector<std::size_t> skipped(threads, 0);
        std::vector<std::thread> workers;
        workers.reserve(threads);
        try {
            for (unsigned int t = 0; t < threads; ++t) {
                workers.emplace_back([this, t, threads, dt, &skipped]() {
                    skipped[t] = accumulateRows(t, threads, dt, threadDeltas[t]);
                });
            }
        } catch (...) {
            for (auto& w : workers) {
                w.join();
            }
            throw;
        }
        for (auto& w : workers) {
            w.join();
        }
        for (auto s : skipped) {
            skippedPairs += s;
        }
    }

    bodies.forEachBody([&](std::size_t i, entt::entity e) {
        Vector total;
        for (const auto& deltas : threadDeltas) {
            total += deltas[i];
        }
        bodies.velocity(e) += total;
    });

    if (skippedPairs > 0) {
        DEBUG_MSG(DEBUG_LEVEL_BASIC, "[GravitySystem] skipped " << skippedPairs
                  << " pairs below minimum separation\n");
    }
}

} // namespace Systems
