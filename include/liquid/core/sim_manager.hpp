/**
 * @fileoverview sim_manager.hpp
 * @brief High-level controller for simulation execution and input.
 */

#pragma once

#include <memory>

#include "liquid/core/constants.hpp"
#include "liquid/core/simulator.hpp"
#include "liquid/rendering/renderer.hpp"

/**
 * @brief Creates the scenario object for a scenario type
 */
std::unique_ptr<IScenario> makeScenario(SimulatorConstants::SimulationType type);

/**
 * @class SimManager
 * @brief Orchestrates the main loop, owns the renderer and the simulator.
 */
class SimManager {
 public:
  SimManager();

  /**
   * @brief Opens the window and loads the initial scenario.
   * @return true on success, false otherwise.
   */
  bool init();

  /**
   * @brief Runs until the window is closed or Escape is pressed.
   */
  void run();

  /**
   * @brief Processes window events and pointer input for the current frame.
   * @return false if the application should quit, true otherwise.
   */
  bool handleEvents();

  /**
   * @brief Steps the simulation (unless paused).
   */
  void tick();

  /**
   * @brief Renders shapes, fluid and overlays.
   * @param fps The current frames-per-second.
   */
  void render(float fps);

  void togglePause();
  void toggleCollisions();
  void resetSimulator();
  void stepOnce();

  /**
   * @brief Loads and resets into a new scenario.
   */
  void selectScenario(SimulatorConstants::SimulationType scenario);

 private:
  /** Copies the mouse state into the SpawnInput component */
  void updatePointer();

  Renderer renderer;
  ECSSimulator simulator;
  SimulatorConstants::SimulationType currentScenario;

  bool running;
  bool paused;
  bool stepFrame;
};
