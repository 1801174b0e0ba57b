/**
 * @fileoverview sim_manager.hpp
 * @brief High-level controller for the viewer: main loop, input and scenario selection.
 */

#pragma once

#include <optional>

#include "diagramsim/core/scenario_manager.hpp"
#include "diagramsim/core/simulator.hpp"
#include "diagramsim/rendering/renderer.hpp"

/**
 * @class SimManager
 * @brief Owns the renderer, simulator and scenario catalog and runs the main loop.
 *
 * Keys: P pause, Space single step while paused, R reset, 1/2/3 pick a
 * scenario, Escape quit.
 */
class SimManager {
 public:
  SimManager();

  /**
   * @brief Opens the window and loads the first scenario.
   * @return true on success, false otherwise.
   */
  bool init();

  /**
   * @brief Runs until the window is closed. Requires a successful init().
   */
  void run();

  /**
   * @brief Processes window events for the current frame.
   * @return false if the application should quit, true otherwise.
   */
  bool handleEvents();

  /** @brief Steps the simulation (unless paused). */
  void tick();

  void render(float fps);

  void togglePause();
  void resetSimulator();
  void stepOnce();

  void selectScenario(SimulatorConstants::SimulationType scenario);

  Renderer renderer;
  ECSSimulator simulator;
  ScenarioManager scenarioManager;

  bool running;
  bool paused;
  bool stepFrame;

 private:
  /**
   * @brief Previews the loaded scene to learn where its bodies travel, then
   * hands the result to the renderer's transform.
   */
  void refreshTransform();
};
