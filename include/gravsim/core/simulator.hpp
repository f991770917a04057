/**
 * @file simulator.hpp
 * @brief Runs the per-step pipeline of systems over a body population.
 */

#pragma once

#include <cstddef>
#include <vector>

#include "gravsim/core/body_registry.hpp"
#include "gravsim/core/system_config.hpp"
#include "gravsim/systems/collision/collision_data.hpp"
#include "gravsim/systems/collision/collision_resolution.hpp"
#include "gravsim/systems/gravity.hpp"
#include "gravsim/systems/movement.hpp"

/**
 * @brief What happened during one step, for instrumentation.
 */
struct StepReport {
    std::vector<CollisionEvent> collisions;  ///< Events in emission order
    std::size_t gravityPairsSkipped = 0;     ///< Degenerate pairs left out of gravity
    Systems::ResolutionStats resolution;
};

/**
 * @class Simulator
 * @brief Owns the systems and their configuration; body state is passed in.
 *
 * A step runs, in this order:
 *  1. MovementSystem            positions advance by the velocities of the last step
 *  2. CollisionDetectionSystem  overlaps among the moved positions become events
 *  3. GravitySystem             velocities change from the moved positions
 *  4. CollisionResolutionSystem events are drained in emission order, after gravity
 */
class Simulator {
public:
    Simulator();
    explicit Simulator(const SystemConfig& config);

    /**
     * @brief Advances bodies by one step of dt seconds.
     * @throws std::invalid_argument if dt is negative or not finite; the
     *         bodies are not touched in that case.
     */
    StepReport step(BodyRegistry& bodies, double dt);

    /** @brief Replaces the configuration of every system. */
    void applyConfig(const SystemConfig& cfg);

    const SystemConfig& getConfig() const { return currentConfig; }

    Systems::GravitySystem& getGravitySystem() { return gravity; }

private:
    SystemConfig currentConfig;
    Systems::MovementSystem movement;
    Systems::GravitySystem gravity;
    CollisionEvents events;
};
