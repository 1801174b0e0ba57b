#include <gtest/gtest.h>
#include <string>
#include <unordered_map>
#include "diagramsim/systems/pulley_constraint.hpp"
#include "diagramsim/components/basic.hpp"
#include "diagramsim/components/sim.hpp"

using namespace Systems;

class PulleyConstraintTest : public ::testing::Test {
protected:
    entt::registry registry;
    PulleyConfig config;

    // Helper to create a body entity
    entt::entity createBody(double x, double y, double mass,
                            Simulation::BodyType type = Simulation::BodyType::Dynamic) {
        auto entity = registry.create();
        registry.emplace<Components::Position>(entity, x, y);
        registry.emplace<Components::Velocity>(entity, 0.0, 0.0);
        registry.emplace<Components::Mass>(entity, mass);
        registry.emplace<Components::BodyKind>(entity, type);
        return entity;
    }

    Components::PulleyRope makeRope(entt::entity a, entt::entity b, double length) {
        Components::PulleyRope rope;
        rope.id = "pulley_1";
        rope.bodyA = a;
        rope.bodyB = b;
        rope.anchor = Position(0.0, 0.0);
        rope.totalLength = length;
        return rope;
    }

    double ropeLength(const Components::PulleyRope& rope) {
        return registry.get<Components::Position>(rope.bodyA).dist(rope.anchor) +
               registry.get<Components::Position>(rope.bodyB).dist(rope.anchor);
    }
};

TEST_F(PulleyConstraintTest, EqualMassesShareLengthCorrection) {
    auto a = createBody(-3.0, -4.0, 1.0);
    auto b = createBody(0.0, -5.0, 1.0);
    auto rope = makeRope(a, b, 9.0);

    EXPECT_TRUE(PulleyConstraintSystem::enforce(registry, rope, config));

    const auto& posA = registry.get<Components::Position>(a);
    const auto& posB = registry.get<Components::Position>(b);
    EXPECT_NEAR(posA.x, -2.7, 1e-12);
    EXPECT_NEAR(posA.y, -3.6, 1e-12);
    EXPECT_NEAR(posB.x, 0.0, 1e-12);
    EXPECT_NEAR(posB.y, -4.5, 1e-12);
    EXPECT_NEAR(ropeLength(rope), 9.0, 1e-12);
}

TEST_F(PulleyConstraintTest, HeavierBodyMovesLess) {
    auto a = createBody(0.0, -5.0, 1.0);
    auto b = createBody(0.0, -5.0, 3.0);
    auto rope = makeRope(a, b, 8.0);

    PulleyConstraintSystem::enforce(registry, rope, config);

    EXPECT_NEAR(registry.get<Components::Position>(a).y, -3.5, 1e-12);
    EXPECT_NEAR(registry.get<Components::Position>(b).y, -4.5, 1e-12);
}

TEST_F(PulleyConstraintTest, StaticBodyTakesNoCorrection) {
    auto a = createBody(0.0, -5.0, 1.0);
    auto b = createBody(0.0, -5.0, 1.0, Simulation::BodyType::Static);
    auto rope = makeRope(a, b, 8.0);
    registry.get<Components::Velocity>(b) = Vector(0.0, -1.0);

    PulleyConstraintSystem::enforce(registry, rope, config);

    EXPECT_NEAR(registry.get<Components::Position>(a).y, -3.0, 1e-12);
    EXPECT_DOUBLE_EQ(registry.get<Components::Position>(b).y, -5.0);

    // The movable body absorbs the whole rope-direction speed
    EXPECT_NEAR(registry.get<Components::Velocity>(a).y, 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(registry.get<Components::Velocity>(b).y, -1.0);
}

TEST_F(PulleyConstraintTest, RemovesStretchingVelocity) {
    auto a = createBody(-3.0, -4.0, 1.0);
    auto b = createBody(0.0, -5.0, 1.0);
    auto rope = makeRope(a, b, 9.0);
    registry.get<Components::Velocity>(b) = Vector(0.0, -1.0);

    EXPECT_TRUE(PulleyConstraintSystem::enforce(registry, rope, config));

    // Length is restored along with the speed
    EXPECT_NEAR(registry.get<Components::Position>(a).x, -2.7, 1e-12);
    EXPECT_NEAR(registry.get<Components::Position>(a).y, -3.6, 1e-12);
    EXPECT_NEAR(registry.get<Components::Position>(b).y, -4.5, 1e-12);

    const auto& velA = registry.get<Components::Velocity>(a);
    const auto& velB = registry.get<Components::Velocity>(b);
    EXPECT_NEAR(velA.x, 0.3, 1e-12);
    EXPECT_NEAR(velA.y, 0.4, 1e-12);
    EXPECT_NEAR(velB.y, -0.5, 1e-12);

    // One body falls exactly as fast as the other rises
    Vector const dirA = Vector(-0.6, -0.8);
    Vector const dirB = Vector(0.0, -1.0);
    EXPECT_NEAR(velA.dotProduct(dirA) + velB.dotProduct(dirB), 0.0, 1e-12);
}

TEST_F(PulleyConstraintTest, WithinToleranceIsUntouched) {
    auto a = createBody(-3.0, -4.0, 1.0);
    auto b = createBody(0.0, -5.0, 1.0);
    auto rope = makeRope(a, b, 10.0 + 5e-5);
    registry.get<Components::Velocity>(b) = Vector(0.0, -1.0);

    EXPECT_FALSE(PulleyConstraintSystem::enforce(registry, rope, config));
    EXPECT_DOUBLE_EQ(registry.get<Components::Position>(a).x, -3.0);

    // Velocities are kept as well
    EXPECT_DOUBLE_EQ(registry.get<Components::Velocity>(a).x, 0.0);
    EXPECT_DOUBLE_EQ(registry.get<Components::Velocity>(a).y, 0.0);
    EXPECT_DOUBLE_EQ(registry.get<Components::Velocity>(b).y, -1.0);
}

TEST_F(PulleyConstraintTest, BothImmovableIsSkipped) {
    auto a = createBody(0.0, -5.0, 1.0, Simulation::BodyType::Static);
    auto b = createBody(0.0, -5.0, 1.0, Simulation::BodyType::Kinematic);
    auto rope = makeRope(a, b, 8.0);

    EXPECT_FALSE(PulleyConstraintSystem::enforce(registry, rope, config));
    EXPECT_DOUBLE_EQ(registry.get<Components::Position>(a).y, -5.0);
    EXPECT_DOUBLE_EQ(registry.get<Components::Position>(b).y, -5.0);
}

TEST_F(PulleyConstraintTest, BadMassCountsAsOneKilogram) {
    auto a = createBody(0.0, -5.0, 0.0);
    auto b = createBody(0.0, -5.0, 1.0);
    auto rope = makeRope(a, b, 8.0);

    PulleyConstraintSystem::enforce(registry, rope, config);

    EXPECT_NEAR(registry.get<Components::Position>(a).y, -4.0, 1e-12);
    EXPECT_NEAR(registry.get<Components::Position>(b).y, -4.0, 1e-12);
}

TEST_F(PulleyConstraintTest, RegisterPulleysFromScene) {
    Simulation::Scene scene;
    Simulation::Body m1;
    m1.id = "m1";
    m1.position_m = Position(-3.0, -4.0);
    Simulation::Body m2;
    m2.id = "m2";
    m2.position_m = Position(0.0, -5.0);
    scene.bodies = {m1, m2};

    Simulation::IdealFixedPulleyConstraint geometric;
    geometric.id = "geometric";
    geometric.body_a = "m1";
    geometric.body_b = "m2";
    geometric.pulley_anchor_m = Position(0.0, 0.0);

    Simulation::IdealFixedPulleyConstraint declared = geometric;
    declared.id = "declared";
    declared.rope_length_m = 12.0;

    Simulation::IdealFixedPulleyConstraint dangling = geometric;
    dangling.id = "dangling";
    dangling.body_b = "ghost";

    scene.constraints = {geometric, declared, dangling};

    std::unordered_map<std::string, entt::entity> bodies;
    bodies["m1"] = createBody(-3.0, -4.0, 1.0);
    bodies["m2"] = createBody(0.0, -5.0, 1.0);

    auto warnings = PulleyConstraintSystem::registerPulleys(registry, scene, bodies);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("dangling"), std::string::npos);
    EXPECT_NE(warnings[0].find("ghost"), std::string::npos);

    std::unordered_map<std::string, double> lengths;
    for (auto [entity, rope] : registry.view<Components::PulleyRope>().each()) {
        lengths[rope.id] = rope.totalLength;
    }
    ASSERT_EQ(lengths.size(), 2u);
    EXPECT_DOUBLE_EQ(lengths["geometric"], 10.0);
    EXPECT_DOUBLE_EQ(lengths["declared"], 12.0);
}

TEST_F(PulleyConstraintTest, UpdateEnforcesEveryRope) {
    auto a = createBody(0.0, -5.0, 1.0);
    auto b = createBody(0.0, -5.0, 1.0);
    registry.emplace<Components::PulleyRope>(registry.create(), makeRope(a, b, 8.0));

    PulleyConstraintSystem system;
    system.update(registry);

    EXPECT_NEAR(registry.get<Components::Position>(a).y, -4.0, 1e-12);
    EXPECT_NEAR(registry.get<Components::Position>(b).y, -4.0, 1e-12);
}

TEST_F(PulleyConstraintTest, OneEnforceRestoresRopeLength) {
    auto a = createBody(0.0, -1.3, 2.0);
    auto b = createBody(0.0, -0.9, 5.0);
    auto rope = makeRope(a, b, 2.0);

    EXPECT_NEAR(ropeLength(rope), 2.2, 1e-12);
    PulleyConstraintSystem::enforce(registry, rope, config);
    EXPECT_NEAR(ropeLength(rope), 2.0, 1e-4);
}
