/**
 * @file pulley.hpp
 * @brief Two masses joined by a rope over an ideal fixed pulley
 */

#pragma once

#include "diagramsim/scenarios/i_scenario.hpp"

struct PulleySceneParams {
    double m1_kg = 2.0;   ///< Mass resting on the table
    double m2_kg = 5.0;   ///< Hanging mass
    double mu_k = 0.0;    ///< Kinetic friction under m1
    double gravity = 9.81;
};

/**
 * @brief Builds the table-and-hanging-mass pulley scene.
 *
 * m1 at (-0.5, 1.0), m2 at (0.5, 2.0), wheel at (0, 2.5) with radius 0.1 m.
 * The rope length is taken from the initial geometry.
 */
Simulation::Scene examplePulleyScene(const PulleySceneParams& params = PulleySceneParams());

/**
 * @class PulleyScenario
 */
class PulleyScenario : public IScenario {
public:
    explicit PulleyScenario(const PulleySceneParams& params = PulleySceneParams());
    ~PulleyScenario() override = default;

    ScenarioConfig getConfig() const override;
    Simulation::Scene createScene() const override;

private:
    PulleySceneParams params;
};
