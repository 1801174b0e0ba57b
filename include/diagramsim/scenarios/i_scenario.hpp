#ifndef DIAGRAMSIM_I_SCENARIO_HPP
#define DIAGRAMSIM_I_SCENARIO_HPP

#include "diagramsim/scenarios/scenario_config.hpp"
#include "diagramsim/scene/scene.hpp"

/**
 * @brief Abstract base class for any simulation scenario
 *
 * Each scenario must provide:
 *  - getConfig() returning ScenarioConfig
 *  - createScene() building the scene to simulate
 */
class IScenario {
public:
    virtual ~IScenario() = default;

    virtual ScenarioConfig getConfig() const = 0;

    virtual Simulation::Scene createScene() const = 0;
};

#endif // DIAGRAMSIM_I_SCENARIO_HPP
