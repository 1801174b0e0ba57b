/**
 * @file ground_block.cpp
 * @brief Ground and block scenario built on an image mapping
 */

#include "diagramsim/scenarios/ground_block.hpp"

#include "diagramsim/core/constants.hpp"

static constexpr double KImageWidthPx  = 1024.0;
static constexpr double KImageHeightPx = 768.0;
static constexpr double KMetersPerPx   = 0.01;

Simulation::Scene exampleGroundBlockScene()
{
    Simulation::Scene scene;
    scene.world.time_step_s = SimulatorConstants::DefaultTimeStep;
    scene.notes = "Block resting on the ground";

    Simulation::SceneMapping mapping;
    mapping.origin_px = Position(KImageWidthPx / 2.0, KImageHeightPx / 2.0);
    mapping.scale_m_per_px = KMetersPerPx;
    scene.mapping = mapping;

    Simulation::Body ground;
    ground.id = "ground_1";
    ground.type = Simulation::BodyType::Static;
    ground.position_m = Position(0.0, -0.1);
    ground.mass_kg = 0.0;
    ground.collider = Simulation::Collider::rectangle(8.0, 0.2);
    ground.material.name = "ground";
    ground.material.friction = 0.5;
    scene.bodies.push_back(ground);

    Simulation::Body block;
    block.id = "block_1";
    block.position_m = Position(0.0, -0.02);
    block.collider = Simulation::Collider::rectangle(0.4, 0.4);
    block.material.name = "wood";
    block.material.friction = 0.5;
    scene.bodies.push_back(block);

    return scene;
}

ScenarioConfig GroundBlockScenario::getConfig() const
{
    ScenarioConfig cfg;
    cfg.name = SimulatorConstants::getScenarioName(SimulatorConstants::SimulationType::GROUND_BLOCK);
    cfg.imageSize = Simulation::ImageSize{KImageWidthPx, KImageHeightPx};
    cfg.normalize = true;

    // Nothing holds the block up, so it is shown where normalization put it
    cfg.activeSystems = {
        Systems::SystemType::MOVEMENT,
    };
    return cfg;
}

Simulation::Scene GroundBlockScenario::createScene() const
{
    return exampleGroundBlockScene();
}
