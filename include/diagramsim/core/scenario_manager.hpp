/**
 * @fileoverview scenario_manager.hpp
 * @brief Maintains the list of example scenarios and loads them into a simulator.
 */

#ifndef DIAGRAMSIM_SCENARIO_MANAGER_HPP
#define DIAGRAMSIM_SCENARIO_MANAGER_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "diagramsim/core/constants.hpp"
#include "diagramsim/core/simulator.hpp"
#include "diagramsim/normalization/scene_normalizer.hpp"
#include "diagramsim/scenarios/i_scenario.hpp"

/**
 * @class ScenarioManager
 * @brief Catalog of available scenarios and a factory to create them.
 */
class ScenarioManager {
 public:
  /**
   * @brief Builds an internal list of all available scenarios.
   */
  void buildScenarioList();

  const std::vector<std::pair<SimulatorConstants::SimulationType, std::string>>&
  getScenarioList() const;

  void setInitialScenario(SimulatorConstants::SimulationType scenario);

  SimulatorConstants::SimulationType getCurrentScenario() const;

  /**
   * @brief Creates a new scenario object of the specified type.
   */
  std::unique_ptr<IScenario> createScenario(
      SimulatorConstants::SimulationType scenarioType) const;

  /**
   * @brief Makes scenarioType current and loads its scene into the simulator.
   *
   * Scenarios that ask for it are normalized against their image first; the
   * report of that run is kept in getLastNormalization().
   */
  void updateSimulatorState(ECSSimulator& simulator,
                            SimulatorConstants::SimulationType scenarioType);

  /** @brief Configuration of the scenario last loaded */
  const ScenarioConfig& getCurrentConfig() const { return currentConfig; }

  const Normalization::NormalizationReport& getLastNormalization() const { return lastNormalization; }

 private:
  std::vector<std::pair<SimulatorConstants::SimulationType, std::string>> scenarioList;
  SimulatorConstants::SimulationType currentScenario =
      SimulatorConstants::SimulationType::PULLEY;
  ScenarioConfig currentConfig;
  Normalization::NormalizationReport lastNormalization;
};

#endif  // DIAGRAMSIM_SCENARIO_MANAGER_HPP
