/**
 * @file planetary_collision.hpp
 * @brief Declaration of the PlanetaryCollisionScenario class
 */

#pragma once

#include <random>

#include "gravsim/scenarios/i_scenario.hpp"

/**
 * @struct PlanetaryCollisionConfig
 * @brief Configuration parameters specific to the planetary collision scenario
 */
struct PlanetaryCollisionConfig {
    // Two planets on opposite sides of the origin, moving in opposite directions
    double planetRadius = 1.0;
    double planetOffset = 5.0;         // Distance of each planet from the origin along y
    double planetSpeed = 0.75;         // Speed along x; the upper planet moves toward -x

    // Debris cloud centred on the origin
    int debrisCount = 2000;
    double debrisSpread = 5.0;         // Edge length of the cube positions are drawn from
    double debrisSpeed = 1.0;          // Each velocity component is drawn from [0, debrisSpeed)
    double debrisMinRadius = 0.01;
    double debrisRadiusRange = 0.1;    // Radius is drawn from [min, min + range)
};

/**
 * @class PlanetaryCollisionScenario
 *
 * Two large planets passing each other through a cloud of small debris.
 */
class PlanetaryCollisionScenario : public IScenario {
public:
    PlanetaryCollisionScenario() = default;
    explicit PlanetaryCollisionScenario(const PlanetaryCollisionConfig& config);
    ~PlanetaryCollisionScenario() override = default;

    SystemConfig getConfig() const override;
    void createBodies(BodyRegistry& bodies, std::mt19937_64& rng) const override;

    const PlanetaryCollisionConfig& getScenarioConfig() const { return scenarioConfig; }

private:
    static void createPlanets(BodyRegistry& bodies, const PlanetaryCollisionConfig& config);
    static void createDebris(BodyRegistry& bodies, const PlanetaryCollisionConfig& config,
                             std::mt19937_64& rng);

    PlanetaryCollisionConfig scenarioConfig;
};
