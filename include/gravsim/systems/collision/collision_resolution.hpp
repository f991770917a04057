#ifndef GRAVSIM_COLLISION_RESOLUTION_HPP
#define GRAVSIM_COLLISION_RESOLUTION_HPP

#include <cstddef>

#include "gravsim/core/body_registry.hpp"
#include "gravsim/core/constants.hpp"
#include "gravsim/systems/collision/collision_data.hpp"

/**
 * The CollisionResolutionSystem drains the events of a step in order. For
 * each pair it pushes the bodies apart along the center line, splitting the
 * penetration depth by mass so the heavier body moves less, then applies a
 * perfectly elastic impulse along the same line.
 *
 * Events are not independent: a body taking part in several events sees the
 * result of the earlier ones, so separation and velocities are re-read from
 * the registry for every event.
 */
namespace Systems {

    struct ResolutionStats {
        std::size_t resolved = 0;
        std::size_t degenerate = 0;  // centers closer than the minimum separation
        std::size_t stale = 0;       // handles that no longer name a body
    };

    class CollisionResolutionSystem {
    public:
        static ResolutionStats update(BodyRegistry& bodies, const CollisionEvents& events,
                                      double minSeparation = SimulatorConstants::DefaultMinSeparation);

        /**
         * @brief Resolves a single pair.
         * @return false if the pair was skipped as stale or degenerate
         */
        static bool resolvePair(BodyRegistry& bodies, entt::entity a, entt::entity b,
                                double minSeparation, ResolutionStats& stats);
    };
}

#endif
