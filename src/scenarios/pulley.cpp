/**
 * @file pulley.cpp
 * @brief A block on a table pulled by a hanging mass over a fixed pulley
 */

#include "diagramsim/scenarios/pulley.hpp"

#include "diagramsim/core/constants.hpp"
#include "diagramsim/scene/scene_validation.hpp"

static constexpr double KBlockSize      = 0.2;
static constexpr double KTableWidth     = 1.2;
static constexpr double KTableThickness = 0.1;

Simulation::Scene examplePulleyScene(const PulleySceneParams& params)
{
    Simulation::Scene scene;
    scene.world.gravity_m_s2 = params.gravity;
    scene.world.time_step_s = SimulatorConstants::DefaultTimeStep;
    scene.notes = "Fixed pulley: m1 on a table, m2 hanging";

    // Table top sits flush with the bottom of m1
    Simulation::Body table;
    table.id = "surface_1";
    table.type = Simulation::BodyType::Static;
    table.position_m = Position(-0.5, 1.0 - (KBlockSize + KTableThickness) / 2.0);
    table.mass_kg = 0.0;
    table.collider = Simulation::Collider::rectangle(KTableWidth, KTableThickness);
    table.material.name = "table";
    table.material.friction = params.mu_k;
    scene.bodies.push_back(table);

    Simulation::Body m1;
    m1.id = "m1";
    m1.position_m = Position(-0.5, 1.0);
    m1.mass_kg = params.m1_kg;
    m1.collider = Simulation::Collider::rectangle(KBlockSize, KBlockSize);
    m1.material.friction = params.mu_k;
    scene.bodies.push_back(m1);

    Simulation::Body m2;
    m2.id = "m2";
    m2.position_m = Position(0.5, 2.0);
    m2.mass_kg = params.m2_kg;
    m2.collider = Simulation::Collider::rectangle(KBlockSize, KBlockSize);
    scene.bodies.push_back(m2);

    Simulation::IdealFixedPulleyConstraint pulley;
    pulley.id = "pulley_1";
    pulley.body_a = "m1";
    pulley.body_b = "m2";
    pulley.pulley_anchor_m = Position(0.0, 2.5);
    pulley.wheel_radius_m = SimulatorConstants::DefaultWheelRadius;
    scene.constraints.emplace_back(pulley);

    return Simulation::resolveRopeLengths(scene);
}

PulleyScenario::PulleyScenario(const PulleySceneParams& params)
    : params(params)
{
}

ScenarioConfig PulleyScenario::getConfig() const
{
    ScenarioConfig cfg;
    cfg.name = SimulatorConstants::getScenarioName(SimulatorConstants::SimulationType::PULLEY);
    return cfg;
}

Simulation::Scene PulleyScenario::createScene() const
{
    return examplePulleyScene(params);
}
