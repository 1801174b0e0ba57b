/**
 * @file ramp_block.cpp
 * @brief Block on an inclined plane
 */

#include "diagramsim/scenarios/ramp_block.hpp"

#include <cmath>

#include "diagramsim/core/constants.hpp"

static constexpr double KRampBase    = 2.0;   // horizontal length of the ramp
static constexpr double KBlockSize   = 0.3;
static constexpr double KBlockMass   = 3.0;

Simulation::Scene exampleRampBlockScene(double angle_deg, double mu_k)
{
    if (!std::isfinite(angle_deg) || angle_deg <= 0.0 || angle_deg >= 90.0) {
        angle_deg = 30.0;
    }
    double const angle = SimulatorConstants::degreesToRadians(angle_deg);
    double const height = KRampBase * std::tan(angle);

    Simulation::Scene scene;
    scene.world.time_step_s = SimulatorConstants::DefaultTimeStep;
    scene.notes = "Block on a ramp";

    Simulation::Body ground;
    ground.id = "ground_1";
    ground.type = Simulation::BodyType::Static;
    ground.position_m = Position(0.0, -0.1);
    ground.mass_kg = 0.0;
    ground.collider = Simulation::Collider::rectangle(6.0, 0.2);
    scene.bodies.push_back(ground);

    // Right triangle with the vertical side on the left
    Position const left(-KRampBase / 2.0, 0.0);
    Position const right(KRampBase / 2.0, 0.0);
    Position const top(-KRampBase / 2.0, height);

    Simulation::Body ramp;
    ramp.id = "ramp_1";
    ramp.type = Simulation::BodyType::Static;
    ramp.position_m = (left + right + top) / 3.0;
    ramp.mass_kg = 0.0;
    ramp.collider = Simulation::Collider::polygon({left, right, top});
    ramp.material.name = "ramp";
    ramp.material.friction = mu_k;
    scene.bodies.push_back(ramp);

    // Midpoint of the slope, pushed out along its normal by half the block
    Position const mid = (top + right) / 2.0;
    Vector const normal = Vector(0.0, 1.0).rotateByAngle(-angle);

    Simulation::Body block;
    block.id = "block_1";
    block.position_m = mid + Position(normal * (KBlockSize / 2.0));
    block.angle_rad = -angle;
    block.mass_kg = KBlockMass;
    block.collider = Simulation::Collider::rectangle(KBlockSize, KBlockSize);
    block.material.friction = mu_k;
    scene.bodies.push_back(block);

    return scene;
}

ScenarioConfig RampBlockScenario::getConfig() const
{
    ScenarioConfig cfg;
    cfg.name = SimulatorConstants::getScenarioName(SimulatorConstants::SimulationType::RAMP_BLOCK);

    // No contact solver: the block is displayed at rest on the slope
    cfg.activeSystems = {
        Systems::SystemType::MOVEMENT,
    };
    return cfg;
}

Simulation::Scene RampBlockScenario::createScene() const
{
    return exampleRampBlockScene();
}
