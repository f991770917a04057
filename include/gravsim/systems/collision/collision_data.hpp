#ifndef GRAVSIM_COLLISION_DATA_HPP
#define GRAVSIM_COLLISION_DATA_HPP

#include <vector>
#include <entt/entt.hpp>

/**
 * @brief Two distinct bodies found overlapping during detection.
 *
 * Only the handles are kept; the resolver re-reads positions when the event
 * is processed because earlier events may have moved either body.
 */
struct CollisionEvent {
    entt::entity a;
    entt::entity b;
};

inline bool operator==(const CollisionEvent& lhs, const CollisionEvent& rhs) {
    return lhs.a == rhs.a && lhs.b == rhs.b;
}

/**
 * @brief Events of one step, in emission (pair-iteration) order.
 */
struct CollisionEvents {
    std::vector<CollisionEvent> events;

    void clear() { events.clear(); }
    bool empty() const { return events.empty(); }
    std::size_t size() const { return events.size(); }
};

#endif
