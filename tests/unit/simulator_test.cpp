#include <gtest/gtest.h>
#include <cmath>
#include <string>
#include "diagramsim/core/simulator.hpp"
#include "diagramsim/core/scenario_manager.hpp"
#include "diagramsim/scenarios/ground_block.hpp"
#include "diagramsim/scenarios/pulley.hpp"
#include "diagramsim/scene/scene_validation.hpp"

using namespace Simulation;

class SimulatorTest : public ::testing::Test {
protected:
    ECSSimulator simulator;

    static Body makeBody(const std::string& id, BodyType type, double x, double y) {
        Body b;
        b.id = id;
        b.type = type;
        b.position_m = Position(x, y);
        b.collider = Collider::circle(0.1);
        return b;
    }

    static double ropeLength(const SimulationFrame& frame, const Position& anchor) {
        return frame.find("m1")->position_m.dist(anchor) + frame.find("m2")->position_m.dist(anchor);
    }
};

TEST_F(SimulatorTest, GravityActsOnDynamicBodiesOnly) {
    Scene scene;
    scene.bodies.push_back(makeBody("ball", BodyType::Dynamic, 0.0, 0.0));
    scene.bodies.push_back(makeBody("wall", BodyType::Static, 1.0, 0.0));
    Body cart = makeBody("cart", BodyType::Kinematic, 2.0, 0.0);
    cart.velocity_m_s = Vector(1.0, 0.0);
    scene.bodies.push_back(cart);

    simulator.loadScene(scene);
    simulator.tick();

    double const dt = 0.016;
    SimulationFrame frame = simulator.snapshot();
    EXPECT_NEAR(frame.t, dt, 1e-12);

    // Semi-implicit Euler: velocity first, then position
    EXPECT_NEAR(frame.find("ball")->velocity_m_s.y, -9.81 * dt, 1e-12);
    EXPECT_NEAR(frame.find("ball")->position_m.y, -9.81 * dt * dt, 1e-12);

    EXPECT_DOUBLE_EQ(frame.find("wall")->position_m.y, 0.0);

    EXPECT_NEAR(frame.find("cart")->position_m.x, 2.0 + dt, 1e-12);
    EXPECT_DOUBLE_EQ(frame.find("cart")->velocity_m_s.y, 0.0);
}

TEST_F(SimulatorTest, AngularVelocityIntegrates) {
    Scene scene;
    Body spinner = makeBody("spinner", BodyType::Dynamic, 0.0, 0.0);
    spinner.angular_velocity_rad_s = 2.0;
    scene.bodies.push_back(spinner);

    simulator.loadScene(scene);
    simulator.tick();
    EXPECT_NEAR(simulator.snapshot().find("spinner")->angle_rad, 0.032, 1e-12);
}

TEST_F(SimulatorTest, InvalidTimeStepFallsBack) {
    Scene scene;
    scene.world.time_step_s = 0.0;
    scene.bodies.push_back(makeBody("ball", BodyType::Dynamic, 0.0, 0.0));

    simulator.loadScene(scene);
    EXPECT_DOUBLE_EQ(simulator.timeStep(), 0.016);

    scene.world.time_step_s = std::nan("");
    simulator.loadScene(scene);
    EXPECT_DOUBLE_EQ(simulator.timeStep(), 0.016);

    scene.world.time_step_s = 0.01;
    simulator.loadScene(scene);
    EXPECT_DOUBLE_EQ(simulator.timeStep(), 0.01);
}

TEST_F(SimulatorTest, EmptySceneDoesNotAdvance) {
    simulator.loadScene(Scene());
    simulator.tick();
    EXPECT_DOUBLE_EQ(simulator.elapsedSeconds(), 0.0);
    EXPECT_TRUE(simulator.snapshot().bodies.empty());
}

TEST_F(SimulatorTest, RunFrameCount) {
    Scene scene;
    scene.bodies.push_back(makeBody("ball", BodyType::Dynamic, 0.0, 0.0));
    simulator.loadScene(scene);

    auto frames = simulator.run(1.0);
    // ceil(1.0 / 0.016) steps plus the initial state
    ASSERT_EQ(frames.size(), 64u);
    EXPECT_DOUBLE_EQ(frames.front().t, 0.0);
    EXPECT_DOUBLE_EQ(frames.front().find("ball")->position_m.y, 0.0);
    EXPECT_NEAR(frames.back().t, 63 * 0.016, 1e-9);

    simulator.reset();
    EXPECT_EQ(simulator.run(5.0, 10).size(), 11u);
}

TEST_F(SimulatorTest, ResetRestoresLoadedScene) {
    Scene scene;
    scene.bodies.push_back(makeBody("ball", BodyType::Dynamic, 0.0, 1.0));
    simulator.loadScene(scene);
    simulator.run(0.5);
    EXPECT_LT(simulator.snapshot().find("ball")->position_m.y, 1.0);

    simulator.reset();
    EXPECT_DOUBLE_EQ(simulator.elapsedSeconds(), 0.0);
    EXPECT_DOUBLE_EQ(simulator.snapshot().find("ball")->position_m.y, 1.0);
}

TEST_F(SimulatorTest, PulleyKeepsRopeLength) {
    Scene scene = examplePulleyScene();
    const auto& pulley = std::get<IdealFixedPulleyConstraint>(scene.constraints[0]);
    ASSERT_TRUE(pulley.rope_length_m.has_value());

    simulator.loadScene(scene);
    EXPECT_TRUE(simulator.warnings().empty());

    auto frames = simulator.run(1.0);
    for (const auto& frame : frames) {
        EXPECT_NEAR(ropeLength(frame, pulley.pulley_anchor_m), *pulley.rope_length_m, 1e-4) << "t=" << frame.t;
    }

    // m2 starts moving down
    EXPECT_LT(frames[1].find("m2")->position_m.y, frames[0].find("m2")->position_m.y);
}

TEST_F(SimulatorTest, MovementOnlyConfigSkipsGravity) {
    SystemConfig cfg;
    cfg.activeSystems = {Systems::SystemType::MOVEMENT};
    simulator.applyConfig(cfg);

    Scene scene = exampleGroundBlockScene();
    simulator.loadScene(scene);
    simulator.run(1.0);

    EXPECT_DOUBLE_EQ(simulator.snapshot().find("block_1")->position_m.y, -0.02);
}

TEST_F(SimulatorTest, DanglingPulleyIsReported) {
    Scene scene;
    scene.bodies.push_back(makeBody("m1", BodyType::Dynamic, 0.0, 0.0));
    IdealFixedPulleyConstraint pulley;
    pulley.body_a = "m1";
    pulley.body_b = "ghost";
    scene.constraints.emplace_back(pulley);

    simulator.loadScene(scene);
    ASSERT_FALSE(simulator.warnings().empty());

    // Still steps the bodies that exist
    simulator.tick();
    EXPECT_LT(simulator.snapshot().find("m1")->position_m.y, 0.0);
}

TEST_F(SimulatorTest, WriteBackMovesPolygonVertices) {
    Scene scene;
    Body wedge;
    wedge.id = "wedge";
    wedge.position_m = Position(0.0, 0.0);
    wedge.collider = Collider::polygon({Position(-1.0, 0.0), Position(1.0, 0.0), Position(0.0, 1.0)});
    scene.bodies.push_back(wedge);
    scene.bodies.push_back(makeBody("other", BodyType::Static, 5.0, 5.0));

    simulator.loadScene(scene);
    simulator.tick();

    Scene out = simulator.writeBack(scene);
    const Body* moved = findBody(out, "wedge");
    ASSERT_NE(moved, nullptr);
    double const dy = moved->position_m.y;
    EXPECT_LT(dy, 0.0);
    EXPECT_NEAR(moved->collider.vertices_m[2].y, 1.0 + dy, 1e-12);
    EXPECT_NEAR(moved->velocity_m_s.y, -9.81 * 0.016, 1e-12);

    // The input is untouched
    EXPECT_DOUBLE_EQ(scene.bodies[0].position_m.y, 0.0);
    EXPECT_DOUBLE_EQ(scene.bodies[0].collider.vertices_m[2].y, 1.0);
}

TEST_F(SimulatorTest, ScenarioManagerNormalizesGroundBlock) {
    ScenarioManager manager;
    manager.buildScenarioList();
    EXPECT_EQ(manager.getScenarioList().size(), 3u);

    manager.updateSimulatorState(simulator, SimulatorConstants::SimulationType::GROUND_BLOCK);
    EXPECT_EQ(manager.getCurrentScenario(), SimulatorConstants::SimulationType::GROUND_BLOCK);
    EXPECT_TRUE(manager.getLastNormalization().applied);
    EXPECT_NEAR(simulator.snapshot().find("block_1")->position_m.y, 0.2005, 1e-9);

    manager.updateSimulatorState(simulator, SimulatorConstants::SimulationType::PULLEY);
    EXPECT_FALSE(manager.getLastNormalization().applied);
    EXPECT_NE(simulator.snapshot().find("m1"), nullptr);
}
