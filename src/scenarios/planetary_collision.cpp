#include <iostream>
#include <random>

#include "gravsim/core/constants.hpp"
#include "gravsim/scenarios/planetary_collision.hpp"

PlanetaryCollisionScenario::PlanetaryCollisionScenario(const PlanetaryCollisionConfig& config)
    : scenarioConfig(config) {}

SystemConfig PlanetaryCollisionScenario::getConfig() const {
    SystemConfig config;
    config.GravitationalConstant = SimulatorConstants::DefaultG;
    config.MinSeparation = SimulatorConstants::DefaultMinSeparation;
    config.Threads = 1;
    return config;
}

void PlanetaryCollisionScenario::createBodies(BodyRegistry& bodies, std::mt19937_64& rng) const {
    createPlanets(bodies, scenarioConfig);
    createDebris(bodies, scenarioConfig, rng);
}

void PlanetaryCollisionScenario::createPlanets(BodyRegistry& bodies, const PlanetaryCollisionConfig& config) {
    bodies.createBody(Position(0.0, config.planetOffset, 0.0),
                      Vector(-config.planetSpeed, 0.0, 0.0),
                      config.planetRadius);
    bodies.createBody(Position(0.0, -config.planetOffset, 0.0),
                      Vector(config.planetSpeed, 0.0, 0.0),
                      config.planetRadius);
}

void PlanetaryCollisionScenario::createDebris(BodyRegistry& bodies, const PlanetaryCollisionConfig& config,
                                              std::mt19937_64& rng) {
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    double const half = config.debrisSpread / 2.0;
    int created = 0;

    for (int i = 0; i < config.debrisCount; ++i) {
        // Draw order is part of the seed contract: radius, position, velocity
        double const radius = config.debrisMinRadius + config.debrisRadiusRange * unit(rng);

        double const px = unit(rng) * config.debrisSpread - half;
        double const py = unit(rng) * config.debrisSpread - half;
        double const pz = unit(rng) * config.debrisSpread - half;

        double const vx = unit(rng) * config.debrisSpeed;
        double const vy = unit(rng) * config.debrisSpeed;
        double const vz = unit(rng) * config.debrisSpeed;

        bodies.createBody(Position(px, py, pz), Vector(vx, vy, vz), radius);
        created++;
    }
    std::cerr << "[PlanetaryCollisionScenario] Created 2 planets and " << created << " debris bodies.\n";
}
