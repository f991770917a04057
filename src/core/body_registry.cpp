#include "gravsim/core/body_registry.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

#include "gravsim/core/constants.hpp"

entt::entity BodyRegistry::createBody(const Components::Position& position,
                                      const Components::Velocity& velocity,
                                      double radius) {
    if (!std::isfinite(radius) || radius <= 0.0) {
        std::ostringstream msg;
        msg << "invalid body radius " << radius << ": must be finite and positive";
        throw std::invalid_argument(msg.str());
    }

    double const mass = SimulatorConstants::sphereMass(radius);
    if (!std::isfinite(mass) || mass <= 0.0) {
        std::ostringstream msg;
        msg << "invalid body mass " << mass << " derived from radius " << radius;
        throw std::invalid_argument(msg.str());
    }

    if (!static_cast<Vector>(position).isFinite() || !velocity.isFinite()) {
        throw std::invalid_argument("body position and velocity must be finite");
    }

    auto e = registry.create();
    registry.emplace<Components::Position>(e, position);
    registry.emplace<Components::Velocity>(e, velocity);
    registry.emplace<Components::Radius>(e, radius);
    registry.emplace<Components::Mass>(e, mass);
    registry.emplace<Components::BodyIndex>(e, bodies.size());
    bodies.push_back(e);
    return e;
}

void BodyRegistry::clear() {
    registry.clear();
    bodies.clear();
}

bool BodyRegistry::contains(entt::entity e) const {
    return registry.valid(e) && registry.all_of<Components::BodyIndex>(e);
}

std::optional<std::size_t> BodyRegistry::indexOf(entt::entity e) const {
    if (!contains(e)) {
        return std::nullopt;
    }
    return registry.get<Components::BodyIndex>(e).value;
}

Vector BodyRegistry::totalMomentum() const {
    Vector total;
    auto view = registry.view<const Components::Velocity, const Components::Mass>();
    for (auto [entity, vel, mass] : view.each()) {
        total += vel * mass.value;
    }
    return total;
}

double BodyRegistry::totalKineticEnergy() const {
    double total = 0.0;
    auto view = registry.view<const Components::Velocity, const Components::Mass>();
    for (auto [entity, vel, mass] : view.each()) {
        total += 0.5 * mass.value * vel.lengthSquared();
    }
    return total;
}

bool BodyRegistry::hasNonFiniteState() const {
    auto view = registry.view<const Components::Position, const Components::Velocity>();
    for (auto [entity, pos, vel] : view.each()) {
        if (!static_cast<Vector>(pos).isFinite() || !vel.isFinite()) {
            return true;
        }
    }
    return false;
}
