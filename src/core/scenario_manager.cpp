/**
 * @fileoverview scenario_manager.cpp
 * @brief Implementation of ScenarioManager.
 */

#include <vector>

#include "diagramsim/core/debug.hpp"
#include "diagramsim/core/scenario_manager.hpp"
#include "diagramsim/scenarios/ground_block.hpp"
#include "diagramsim/scenarios/pulley.hpp"
#include "diagramsim/scenarios/ramp_block.hpp"

void ScenarioManager::buildScenarioList() {
  scenarioList.clear();
  for (auto s : SimulatorConstants::getAllScenarios()) {
    scenarioList.emplace_back(s, SimulatorConstants::getScenarioName(s));
  }
}

const std::vector<std::pair<SimulatorConstants::SimulationType, std::string>>&
ScenarioManager::getScenarioList() const {
  return scenarioList;
}

void ScenarioManager::setInitialScenario(SimulatorConstants::SimulationType scenario) {
  currentScenario = scenario;
}

SimulatorConstants::SimulationType ScenarioManager::getCurrentScenario() const {
  return currentScenario;
}

std::unique_ptr<IScenario> ScenarioManager::createScenario(
    SimulatorConstants::SimulationType scenarioType) const {
  switch (scenarioType) {
    case SimulatorConstants::SimulationType::PULLEY:
      return std::make_unique<PulleyScenario>();

    case SimulatorConstants::SimulationType::GROUND_BLOCK:
      return std::make_unique<GroundBlockScenario>();

    case SimulatorConstants::SimulationType::RAMP_BLOCK:
      return std::make_unique<RampBlockScenario>();

    default:
      return std::make_unique<PulleyScenario>();
  }
}

void ScenarioManager::updateSimulatorState(ECSSimulator& simulator,
                                           SimulatorConstants::SimulationType scenarioType) {
  currentScenario = scenarioType;
  auto scenario = createScenario(scenarioType);
  currentConfig = scenario->getConfig();
  lastNormalization = Normalization::NormalizationReport();

  Simulation::Scene scene = scenario->createScene();
  if (currentConfig.normalize && scene.mapping && currentConfig.imageSize) {
    auto result = Normalization::SceneNormalizer::normalize(
        scene, *scene.mapping, *currentConfig.imageSize, currentConfig.normalization);
    scene = std::move(result.scene);
    lastNormalization = std::move(result.report);
  }

  DIAGRAMSIM_INFO("Loading scenario: " << currentConfig.name);
  simulator.applyConfig(makeSystemConfig(currentConfig));
  simulator.loadScene(scene);
}
