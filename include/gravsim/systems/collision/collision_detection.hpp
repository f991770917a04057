#ifndef GRAVSIM_COLLISION_DETECTION_HPP
#define GRAVSIM_COLLISION_DETECTION_HPP

#include "gravsim/core/body_registry.hpp"
#include "gravsim/systems/collision/collision_data.hpp"

/**
 * Exhaustive overlap test over every unordered pair of bodies. A pair
 * overlaps when radius(a) + radius(b) - |pos(a) - pos(b)| > 0. Nothing is
 * remembered between steps: a pair that still overlaps emits again.
 */
namespace Systems {
    class CollisionDetectionSystem {
    public:
        // Replaces the contents of events with this step's overlaps
        static void update(const BodyRegistry& bodies, CollisionEvents& events);

        // Penetration depth of a pair; positive when the spheres overlap
        static double penetration(const BodyRegistry& bodies, entt::entity a, entt::entity b);
    };
}

#endif
