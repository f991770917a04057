#ifndef GRAVSIM_I_SCENARIO_HPP
#define GRAVSIM_I_SCENARIO_HPP

#include <random>

#include "gravsim/core/body_registry.hpp"
#include "gravsim/core/system_config.hpp"

/**
 * @brief Abstract base class for any initial body population
 *
 * Each scenario must provide:
 *  - getConfig() returning the SystemConfig the scenario is tuned for
 *  - createBodies() that fills an empty registry
 */
class IScenario {
public:
    virtual ~IScenario() = default;

    virtual SystemConfig getConfig() const = 0;

    /**
     * @brief Creates the scenario's bodies.
     *
     * All randomness comes from rng, so the same seed gives the same bodies.
     */
    virtual void createBodies(BodyRegistry& bodies, std::mt19937_64& rng) const = 0;
};

#endif // GRAVSIM_I_SCENARIO_HPP
