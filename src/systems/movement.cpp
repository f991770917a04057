#include "gravsim/systems/movement.hpp"
#include "gravsim/core/profile.hpp"

namespace Systems {

void MovementSystem::update(BodyRegistry& bodies, double dt) {
    PROFILE_SCOPE("MovementSystem");

    auto view = bodies.getRegistry().view<Components::Position, const Components::Velocity>();

    for (auto [entity, pos, vel] : view.each()) {
        pos += vel * dt;
    }
}

} // namespace Systems
