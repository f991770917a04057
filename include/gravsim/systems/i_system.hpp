/**
 * @file i_system.hpp
 * @brief Interface for the per-step systems of the simulation
 */

#pragma once

#include "gravsim/core/body_registry.hpp"
#include "gravsim/core/system_config.hpp"

namespace Systems {

/**
 * @class ISystem
 * @brief Base interface for systems that advance body state by one step
 */
class ISystem {
protected:
    SystemConfig sysConfig;  // Common configuration all systems have

public:
    virtual ~ISystem() = default;

    /**
     * @brief Advances the system by one simulation step
     *
     * @param bodies Body population to update
     * @param dt Elapsed time of the step in seconds
     */
    virtual void update(BodyRegistry& bodies, double dt) = 0;

    /**
     * @brief Sets the shared system configuration
     */
    virtual void setSystemConfig(const SystemConfig& config) {
        sysConfig = config;
    }

    virtual const SystemConfig& getSystemConfig() const {
        return sysConfig;
    }
};

/**
 * @brief Base for systems that take configuration beyond SystemConfig
 */
template<typename SpecificConfig>
class ConfigurableSystem : public ISystem {
protected:
    SpecificConfig specificConfig;

public:
    void setSpecificConfig(const SpecificConfig& config) {
        specificConfig = config;
    }

    const SpecificConfig& getSpecificConfig() const {
        return specificConfig;
    }
};

} // namespace Systems
