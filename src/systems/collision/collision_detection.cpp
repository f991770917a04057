#include "gravsim/systems/collision/collision_detection.hpp"
#include "gravsim/core/profile.hpp"

#include <vector>

double Systems::CollisionDetectionSystem::penetration(const BodyRegistry& bodies,
                                                      entt::entity a, entt::entity b) {
    Vector const v = bodies.position(a) - bodies.position(b);
    return bodies.radius(a) + bodies.radius(b) - v.length();
}

void Systems::CollisionDetectionSystem::update(const BodyRegistry& bodies, CollisionEvents& events) {
    PROFILE_SCOPE("CollisionDetectionSystem");

    events.clear();

    const std::size_t n = bodies.size();
    std::vector<Position> positions(n);
    std::vector<double> radii(n);
    bodies.forEachBody([&](std::size_t i, entt::entity e) {
        positions[i] = bodies.position(e);
        radii[i] = bodies.radius(e);
    });

    bodies.forEachPair([&](std::size_t i, std::size_t j) {
        Vector const v = positions[i] - positions[j];
        double const d = radii[i] + radii[j] - v.length();
        if (d > 0.0) {
            events.events.push_back(CollisionEvent{bodies.entity(i), bodies.entity(j)});
        }
    });
}
