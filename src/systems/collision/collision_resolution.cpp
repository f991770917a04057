#include "gravsim/systems/collision/collision_resolution.hpp"
#include "gravsim/core/debug.hpp"
#include "gravsim/core/profile.hpp"

#include <cmath>
#include <iostream>

bool Systems::CollisionResolutionSystem::resolvePair(BodyRegistry& bodies, entt::entity a, entt::entity b,
                                                     double minSeparation, ResolutionStats& stats) {
    if (a == b || !bodies.contains(a) || !bodies.contains(b)) {
        ++stats.stale;
        return false;
    }

    auto posA = bodies.position(a);
    auto velA = bodies.velocity(a);
    double const massA = bodies.mass(a);

    auto posB = bodies.position(b);
    auto velB = bodies.velocity(b);
    double const massB = bodies.mass(b);

    Vector const v = posA - posB;
    double const ds = v.lengthSquared();
    double const dist = std::sqrt(ds);
    if (dist <= minSeparation) {
        // Coincident centers give no collision normal
        ++stats.degenerate;
        DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[CollisionResolutionSystem] degenerate pair at distance "
                  << dist << "\n");
        return false;
    }

    double const penetration = bodies.radius(a) + bodies.radius(b) - dist;
    Vector const dir = v / dist;
    double const totalMass = massA + massB;
    double const massRatio = massB / totalMass;

    // De-penetration, split by the other body's share of the mass
    posA += dir * (penetration * massRatio);
    posB -= dir * (penetration * (1.0 - massRatio));

    // Elastic exchange along the center line, from the pre-event velocities
    Vector const newVelA = velA - v * ((2.0 * massB / totalMass) * ((velA - velB).dotProduct(v) / ds));
    Vector const newVelB = velB - (-v) * ((2.0 * massA / totalMass) * ((velB - velA).dotProduct(-v) / ds));

    bodies.position(a) = posA;
    bodies.velocity(a) = newVelA;
    bodies.position(b) = posB;
    bodies.velocity(b) = newVelB;

    ++stats.resolved;
    return true;
}

Systems::ResolutionStats Systems::CollisionResolutionSystem::update(BodyRegistry& bodies,
                                                                    const CollisionEvents& events,
                                                                    double minSeparation) {
    PROFILE_SCOPE("CollisionResolutionSystem");

    ResolutionStats stats;
    for (const auto& col : events.events) {
        resolvePair(bodies, col.a, col.b, minSeparation, stats);
    }

    if (stats.stale > 0) {
        std::cerr << "[CollisionResolutionSystem] Warning: skipped " << stats.stale
                  << " events with stale body handles\n";
    }
    return stats;
}
