/**
 * @file gravity.hpp
 * @brief Pairwise Newtonian gravity between all bodies
 *
 * For every unordered pair (a, b) with separation v = pos(a) - pos(b):
 *
 *   vel(a) -= mass(b) * G / |v|^2 * dt * v/|v|
 *   vel(b) += mass(a) * G / |v|^2 * dt * v/|v|
 *
 * The momentum change of the two bodies cancels exactly, so total momentum
 * is conserved pair by pair.
 *
 * The pass reads a snapshot of positions and masses, sums the per-pair
 * velocity changes of each body into a delta buffer and applies the buffers
 * at the end. With more than one thread the rows of the pair space are dealt
 * out round-robin, each thread owns its own buffer, and the buffers are
 * summed in thread order, so a fixed thread count gives a fixed result.
 *
 * Required components:
 * - Position (to read)
 * - Mass (to read)
 * - Velocity (to modify)
 */

#ifndef GRAVSIM_GRAVITY_SYSTEM_HPP
#define GRAVSIM_GRAVITY_SYSTEM_HPP

#include <cstddef>
#include <vector>

#include "gravsim/systems/i_system.hpp"

namespace Systems {

/**
 * @struct GravityConfig
 * @brief Configuration parameters specific to the gravity system
 */
struct GravityConfig {
    // Populations smaller than this per worker are not worth a thread
    std::size_t minBodiesPerThread = 256;
};

/**
 * @class GravitySystem
 * @brief Exhaustive O(n^2) gravitational velocity update
 */
class GravitySystem : public ConfigurableSystem<GravityConfig> {
public:
    GravitySystem() = default;
    ~GravitySystem() override = default;

    /**
     * @brief Applies one step of mutual attraction to every body
     *
     * Pairs closer than SystemConfig::MinSeparation have no usable direction
     * and are skipped.
     */
    void update(BodyRegistry& bodies, double dt) override;

    /** @brief Pairs skipped as degenerate in the last update. */
    std::size_t getSkippedPairs() const { return skippedPairs; }

    /** @brief Worker count the last update actually used. */
    unsigned int getLastThreadCount() const { return lastThreadCount; }

private:
    unsigned int workerCount(std::size_t bodyCount) const;

    /**
     * @brief Accumulates the contribution of rows first, first+stride, ...
     * @return Number of degenerate pairs met
     */
    std::size_t accumulateRows(std::size_t first, std::size_t stride,
                               double dt, std::vector<Vector>& deltas) const;

    std::vector<Position> positions;
    std::vector<double> masses;
    std::vector<std::vector<Vector>> threadDeltas;

    std::size_t skippedPairs = 0;
    unsigned int lastThreadCount = 1;
};

} // namespace Systems

#endif
