/**
 * @file movement.hpp
 * @brief System for updating positions based on velocity
 *
 * Required components:
 * - Position (to modify)
 * - Velocity (to read)
 */

#ifndef GRAVSIM_MOVEMENT_SYSTEM_HPP
#define GRAVSIM_MOVEMENT_SYSTEM_HPP

#include "gravsim/systems/i_system.hpp"

namespace Systems {

/**
 * @brief Moves every body by velocity * dt. Bodies do not interact here.
 */
class MovementSystem : public ISystem {
public:
    MovementSystem() = default;
    ~MovementSystem() override = default;

    void update(BodyRegistry& bodies, double dt) override;
};

} // namespace Systems

#endif
