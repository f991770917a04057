/**
 * @file sim_manager.cpp
 * @brief Implementation of SimManager, the viewer's frame loop.
 */

#include <algorithm>
#include <iostream>

#include <SFML/System/Clock.hpp>
#include <SFML/Window/Event.hpp>

#include "gravsim/core/constants.hpp"
#include "gravsim/core/profile.hpp"
#include "gravsim/core/sim_manager.hpp"

namespace {
  // Longer frames (window drags, breakpoints) are cut to this many seconds
  const double MaxFrameSeconds = 0.1;
  // Step length used by single-frame stepping while paused
  const double PausedStepSeconds = 1.0 / 60.0;
  const double TimeScaleStep = 0.25;
}

SimManager::SimManager(std::uint64_t seed, const PlanetaryCollisionConfig& config)
    : scenario(config)
    , simulator(scenario.getConfig())
    , renderer(static_cast<int>(SimulatorConstants::ScreenLength),
               static_cast<int>(SimulatorConstants::ScreenLength))
    , rng(seed)
    , seed(seed)
    , timeScale(1.0)
    , lastCollisions(0)
    , running(true)
    , paused(false)
    , stepFrame(false)
{
}

bool SimManager::init()
{
  if (!renderer.init())
  {
    std::cerr << "[SimManager] Renderer initialization failed." << std::endl;
    return false;
  }

  scenario.createBodies(bodies, rng);
  return true;
}

void SimManager::run()
{
  if (!init())
  {
    return;
  }

  sf::Clock frameClock;
  while (running)
  {
    sf::Time const elapsed = frameClock.restart();

    if (!handleEvents())
    {
      break;
    }

    tick(std::min(static_cast<double>(elapsed.asSeconds()), MaxFrameSeconds));

    float const fps = elapsed.asSeconds() > 0.0F ? 1.0F / elapsed.asSeconds() : 0.0F;
    render(fps);
  }

  renderer.getWindow().close();
}

bool SimManager::handleEvents()
{
  sf::RenderWindow& window = renderer.getWindow();

  sf::Event event;
  while (window.pollEvent(event))
  {
    if (event.type == sf::Event::Closed)
    {
      running = false;
    }
    else if (event.type == sf::Event::KeyPressed)
    {
      switch (event.key.code)
      {
        case sf::Keyboard::Escape:
          running = false;
          break;
        case sf::Keyboard::P:
          togglePause();
          break;
        case sf::Keyboard::Space: // Advance one frame if paused
          if (paused)
          {
            stepFrame = true;
          }
          break;
        case sf::Keyboard::R:
          resetSimulation();
          break;
        case sf::Keyboard::PageUp:
          timeScale += TimeScaleStep;
          break;
        case sf::Keyboard::PageDown:
          timeScale = std::max(0.0, timeScale - TimeScaleStep);
          break;
        default:
          break;
      }
    }
  }

  return running;
}

void SimManager::tick(double frameSeconds)
{
  if (paused && !stepFrame)
  {
    return;
  }

  double const dt = (stepFrame ? PausedStepSeconds : frameSeconds) * timeScale;
  StepReport const report = simulator.step(bodies, dt);
  lastCollisions = report.collisions.size();
  stepFrame = false;

  if (bodies.hasNonFiniteState())
  {
    std::cerr << "[SimManager] Warning: non-finite body state, pausing" << std::endl;
    paused = true;
  }
}

void SimManager::render(float fps)
{
  renderer.clear();
  renderer.renderBodies(bodies);

  Renderer::HudInfo info;
  info.fps = fps;
  info.timeScale = timeScale;
  info.paused = paused;
  info.bodyCount = bodies.size();
  info.collisions = lastCollisions;
  renderer.renderHud(info);

  renderer.present();
}

void SimManager::togglePause()
{
  paused = !paused;
}

void SimManager::resetSimulation()
{
  // A fresh seed per reset gives a new debris cloud
  rng.seed(++seed);
  bodies.clear();
  scenario.createBodies(bodies, rng);
  lastCollisions = 0;
  paused = false;
}
