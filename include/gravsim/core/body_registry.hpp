/**
 * @file body_registry.hpp
 * @brief Owner of the simulated body population.
 */

#ifndef GRAVSIM_BODY_REGISTRY_HPP
#define GRAVSIM_BODY_REGISTRY_HPP

#include <cstddef>
#include <optional>
#include <vector>

#include <entt/entt.hpp>

#include "gravsim/components/basic.hpp"

/**
 * @class BodyRegistry
 * @brief Fixed population of spherical bodies stored as ECS entities.
 *
 * Every body carries Position, Velocity, Radius, Mass and BodyIndex
 * components. Bodies are addressed either by their entity handle or by
 * their creation-order index; the index order is the iteration order of
 * forEachBody() and the row order of forEachPair().
 */
class BodyRegistry {
public:
    BodyRegistry() = default;

    BodyRegistry(const BodyRegistry&) = delete;
    BodyRegistry& operator=(const BodyRegistry&) = delete;

    /**
     * @brief Adds a body. Mass is derived from the radius at unit density.
     *
     * @throws std::invalid_argument if the radius is not a finite positive
     *         number, the derived mass is not positive, or the position or
     *         velocity has a non-finite component. The registry is left
     *         untouched in that case.
     */
    entt::entity createBody(const Components::Position& position,
                            const Components::Velocity& velocity,
                            double radius);

    /** @brief Removes every body, used when a run is restarted. */
    void clear();

    std::size_t size() const { return bodies.size(); }
    bool empty() const { return bodies.empty(); }

    /** @brief Handle of the body created index-th. */
    entt::entity entity(std::size_t index) const { return bodies.at(index); }

    /** @brief True if the handle names a body of this registry. */
    bool contains(entt::entity e) const;

    /** @brief Creation-order index of a handle, if it names a body. */
    std::optional<std::size_t> indexOf(entt::entity e) const;

    Components::Position& position(entt::entity e) { return registry.get<Components::Position>(e); }
    const Components::Position& position(entt::entity e) const { return registry.get<Components::Position>(e); }
    Components::Velocity& velocity(entt::entity e) { return registry.get<Components::Velocity>(e); }
    const Components::Velocity& velocity(entt::entity e) const { return registry.get<Components::Velocity>(e); }
    double radius(entt::entity e) const { return registry.get<Components::Radius>(e).value; }
    double mass(entt::entity e) const { return registry.get<Components::Mass>(e).value; }

    Components::Position& position(std::size_t index) { return position(bodies.at(index)); }
    const Components::Position& position(std::size_t index) const { return position(bodies.at(index)); }
    Components::Velocity& velocity(std::size_t index) { return velocity(bodies.at(index)); }
    const Components::Velocity& velocity(std::size_t index) const { return velocity(bodies.at(index)); }
    double radius(std::size_t index) const { return radius(bodies.at(index)); }
    double mass(std::size_t index) const { return mass(bodies.at(index)); }

    /**
     * @brief Calls fn(index, entity) for every body in creation order.
     */
    template<typename Func>
    void forEachBody(Func&& fn) const {
        for (std::size_t i = 0; i < bodies.size(); ++i) {
            fn(i, bodies[i]);
        }
    }

    /**
     * @brief Calls fn(i, j) once for every unordered pair of distinct bodies.
     *
     * Pairs are generated as i in [0, N), j in (i, N), so the order is
     * fixed for a given population.
     */
    template<typename Func>
    void forEachPair(Func&& fn) const {
        const std::size_t n = bodies.size();
        for (std::size_t i = 0; i < n; ++i) {
            for (std::size_t j = i + 1; j < n; ++j) {
                fn(i, j);
            }
        }
    }

    /** @brief Number of pairs visited by forEachPair(). */
    std::size_t pairCount() const {
        return bodies.size() < 2 ? 0 : bodies.size() * (bodies.size() - 1) / 2;
    }

    /** @brief Sum of mass * velocity over all bodies. */
    Vector totalMomentum() const;

    /** @brief Sum of 1/2 * mass * |velocity|^2 over all bodies. */
    double totalKineticEnergy() const;

    /** @brief True if any position or velocity component is NaN or infinite. */
    bool hasNonFiniteState() const;

    entt::registry& getRegistry() { return registry; }
    const entt::registry& getRegistry() const { return registry; }

private:
    entt::registry registry;
    std::vector<entt::entity> bodies;
};

#endif // GRAVSIM_BODY_REGISTRY_HPP
