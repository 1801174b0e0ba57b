/**
 * @file ramp_block.hpp
 * @brief A block resting on an inclined plane
 */

#pragma once

#include "diagramsim/scenarios/i_scenario.hpp"

/**
 * @brief Static ground, a static triangular ramp rising to the left and a
 * 3 kg block sitting halfway up the slope, rotated to match it.
 *
 * @param angle_deg Ramp inclination; values outside (0, 90) fall back to 30
 * @param mu_k Kinetic friction of the ramp and block surfaces
 */
Simulation::Scene exampleRampBlockScene(double angle_deg = 30.0, double mu_k = 0.0);

/**
 * @class RampBlockScenario
 */
class RampBlockScenario : public IScenario {
public:
    RampBlockScenario() = default;
    ~RampBlockScenario() override = default;

    ScenarioConfig getConfig() const override;
    Simulation::Scene createScene() const override;
};
