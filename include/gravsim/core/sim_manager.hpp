/**
 * @file sim_manager.hpp
 * @brief Frame loop of the viewer: input, stepping and drawing.
 */

#pragma once

#include <cstdint>
#include <random>

#include "gravsim/arch/native/renderer_native.hpp"
#include "gravsim/core/body_registry.hpp"
#include "gravsim/core/simulator.hpp"
#include "gravsim/scenarios/planetary_collision.hpp"

/**
 * @class SimManager
 * @brief Owns the bodies, the simulator and the renderer for one window.
 */
class SimManager {
 public:
  explicit SimManager(std::uint64_t seed = 1,
                      const PlanetaryCollisionConfig& config = PlanetaryCollisionConfig());

  /**
   * @brief Opens the window and builds the initial population.
   * @return false if the window could not be created.
   */
  bool init();

  /**
   * @brief Runs frames until the window is closed.
   */
  void run();

 private:
  bool handleEvents();
  void tick(double frameSeconds);
  void render(float fps);

  void togglePause();
  void resetSimulation();

  PlanetaryCollisionScenario scenario;
  BodyRegistry bodies;
  Simulator simulator;
  Renderer renderer;
  std::mt19937_64 rng;
  std::uint64_t seed;

  double timeScale;
  std::size_t lastCollisions;
  bool running;
  bool paused;
  bool stepFrame;
};
