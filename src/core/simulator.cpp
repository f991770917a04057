/**
 * @file simulator.cpp
 * @brief Implementation of Simulator.
 */

#include "gravsim/core/simulator.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "gravsim/core/debug.hpp"
#include "gravsim/core/profile.hpp"
#include "gravsim/systems/collision/collision_detection.hpp"

Simulator::Simulator() : Simulator(SystemConfig()) {}

Simulator::Simulator(const SystemConfig& config) {
  applyConfig(config);
}

void Simulator::applyConfig(const SystemConfig& cfg) {
  currentConfig = cfg;
  movement.setSystemConfig(currentConfig);
  gravity.setSystemConfig(currentConfig);
}

StepReport Simulator::step(BodyRegistry& bodies, double dt) {
  if (!std::isfinite(dt) || dt < 0.0) {
    std::ostringstream msg;
    msg << "step dt must be finite and non-negative, got " << dt;
    throw std::invalid_argument(msg.str());
  }

  PROFILE_SCOPE("Simulator::step");

  StepReport report;

  movement.update(bodies, dt);
  Systems::CollisionDetectionSystem::update(bodies, events);
  gravity.update(bodies, dt);
  report.gravityPairsSkipped = gravity.getSkippedPairs();
  report.resolution = Systems::CollisionResolutionSystem::update(bodies, events, currentConfig.MinSeparation);

  // The events belong to this step only; hand them to the caller
  report.collisions = std::move(events.events);
  events.clear();

  DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[Simulator] step dt=" << dt
            << " collisions=" << report.collisions.size()
            << " resolved=" << report.resolution.resolved << "\n");

  return report;
}
