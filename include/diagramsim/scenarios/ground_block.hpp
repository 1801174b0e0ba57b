/**
 * @file ground_block.hpp
 * @brief A block drawn slightly sunk into the ground of a 1024x768 diagram
 */

#pragma once

#include "diagramsim/scenarios/i_scenario.hpp"

/**
 * @brief Ground 8 x 0.2 m centered at (0, -0.1) and a 0.4 m block at
 * (0, -0.02), mapped onto a 1024 x 768 image at 0.01 m/px with the origin
 * at the image center.
 */
Simulation::Scene exampleGroundBlockScene();

/**
 * @class GroundBlockScenario
 *
 * Normalizes the scene against its image before loading, which lifts the
 * block out of the ground.
 */
class GroundBlockScenario : public IScenario {
public:
    GroundBlockScenario() = default;
    ~GroundBlockScenario() override = default;

    ScenarioConfig getConfig() const override;
    Simulation::Scene createScene() const override;
};
