#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include "diagramsim/normalization/scene_normalizer.hpp"
#include "diagramsim/scenarios/ground_block.hpp"
#include "diagramsim/scene/scene_geometry.hpp"
#include "diagramsim/scene/scene_validation.hpp"

using namespace Simulation;
using Normalization::NormalizationOptions;
using Normalization::SceneNormalizer;
using Normalization::TargetBodies;

class SceneNormalizerTest : public ::testing::Test {
protected:
    // Image of 2 m x 1 m whose top-left pixel is the meter origin:
    // x in [0, 2], y in [-1, 0]
    SceneMapping mapping;
    ImageSize image{200.0, 100.0};

    void SetUp() override {
        mapping.origin_px = Position(0.0, 0.0);
        mapping.scale_m_per_px = 0.01;
    }

    static Body dynamicCircle(const std::string& id, double x, double y, double r = 0.1) {
        Body b;
        b.id = id;
        b.position_m = Position(x, y);
        b.collider = Collider::circle(r);
        return b;
    }

    static Body rectangle(const std::string& id, BodyType type, double x, double y, double w, double h) {
        Body b;
        b.id = id;
        b.type = type;
        b.position_m = Position(x, y);
        b.collider = Collider::rectangle(w, h);
        return b;
    }

    static bool hasWarningContaining(const Normalization::NormalizationReport& report,
                                     const std::string& text) {
        return std::any_of(report.warnings.begin(), report.warnings.end(),
                           [&](const std::string& w) { return w.find(text) != std::string::npos; });
    }
};

TEST_F(SceneNormalizerTest, GroundBlockIsLiftedOutOfGround) {
    Scene scene = exampleGroundBlockScene();
    auto result = SceneNormalizer::normalize(scene, *scene.mapping, ImageSize{1024.0, 768.0});
    const auto& report = result.report;

    EXPECT_TRUE(report.applied);
    EXPECT_DOUBLE_EQ(report.translation_m.x, 0.0);
    EXPECT_DOUBLE_EQ(report.translation_m.y, 0.0);
    EXPECT_FALSE(report.scale.has_value());
    ASSERT_EQ(report.adjustedBodyIds.size(), 1u);
    EXPECT_EQ(report.adjustedBodyIds[0], "block_1");
    EXPECT_TRUE(hasWarningContaining(report, "Contact separation applied to block_1"));

    const Body* ground = findBody(result.scene, "ground_1");
    const Body* block = findBody(result.scene, "block_1");
    ASSERT_NE(ground, nullptr);
    ASSERT_NE(block, nullptr);

    // Ground never moves
    EXPECT_DOUBLE_EQ(ground->position_m.x, 0.0);
    EXPECT_DOUBLE_EQ(ground->position_m.y, -0.1);

    // The 0.2 m overlap push leaves the block 0.0195 m deep, a second pass lifts it clear
    EXPECT_NEAR(block->position_m.x, 0.0, 1e-12);
    EXPECT_NEAR(block->position_m.y, 0.2005, 1e-9);
    EXPECT_GT(bodyAabb(*block)->minY, bodyAabb(*ground)->maxY);

    ASSERT_TRUE(result.scene.meta.normalization.has_value());
    const auto& meta = *result.scene.meta.normalization;
    ASSERT_EQ(meta.contact_separation.size(), 1u);
    EXPECT_EQ(meta.contact_separation[0].id, "block_1");
    EXPECT_NEAR(meta.contact_separation[0].delta_m.x, 0.0, 1e-12);
    EXPECT_NEAR(meta.contact_separation[0].delta_m.y, 0.2205, 1e-9);
    EXPECT_DOUBLE_EQ(meta.scale, 1.0);
    EXPECT_DOUBLE_EQ(meta.margin_m, 0.02);
}

TEST_F(SceneNormalizerTest, InputSceneIsNotModified) {
    Scene scene = exampleGroundBlockScene();
    auto result = SceneNormalizer::normalize(scene, *scene.mapping, ImageSize{1024.0, 768.0});

    EXPECT_DOUBLE_EQ(findBody(scene, "block_1")->position_m.y, -0.02);
    EXPECT_FALSE(findBody(scene, "block_1")->material.restitution.has_value());
    EXPECT_FALSE(scene.meta.normalization.has_value());

    // Dynamic bodies pick up the default restitution, static ones do not
    ASSERT_TRUE(findBody(result.scene, "block_1")->material.restitution.has_value());
    EXPECT_DOUBLE_EQ(*findBody(result.scene, "block_1")->material.restitution, 1.0);
    EXPECT_FALSE(findBody(result.scene, "ground_1")->material.restitution.has_value());
}

TEST_F(SceneNormalizerTest, SecondPassIsNoOp) {
    Scene scene = exampleGroundBlockScene();
    auto first = SceneNormalizer::normalize(scene, *scene.mapping, ImageSize{1024.0, 768.0});
    auto second = SceneNormalizer::normalize(first.scene, *scene.mapping, ImageSize{1024.0, 768.0});

    EXPECT_FALSE(second.report.applied);
    EXPECT_TRUE(second.report.adjustedBodyIds.empty());
    EXPECT_DOUBLE_EQ(findBody(second.scene, "block_1")->position_m.y,
                     findBody(first.scene, "block_1")->position_m.y);
}

TEST_F(SceneNormalizerTest, TranslatesIntoMarginBox) {
    Scene scene;
    scene.bodies.push_back(dynamicCircle("ball", 3.0, 0.5));

    NormalizationOptions options;
    options.margin_m = 0.1;
    auto result = SceneNormalizer::normalize(scene, mapping, image, options);

    EXPECT_TRUE(result.report.applied);
    EXPECT_NEAR(result.report.translation_m.x, -1.2, 1e-9);
    EXPECT_NEAR(result.report.translation_m.y, -0.7, 1e-9);

    Aabb allowed(0.1, 1.9, -0.9, -0.1);
    for (const auto& body : result.scene.bodies) {
        EXPECT_TRUE(allowed.contains(*bodyAabb(body), 1e-9)) << body.id;
    }
}

TEST_F(SceneNormalizerTest, ShrinksGroupThatDoesNotFit) {
    Scene scene;
    scene.bodies.push_back(dynamicCircle("left", -5.0, -0.5));
    scene.bodies.push_back(dynamicCircle("right", 5.0, -0.5));

    NormalizationOptions options;
    options.margin_m = 0.1;
    auto result = SceneNormalizer::normalize(scene, mapping, image, options);

    ASSERT_TRUE(result.report.scale.has_value());
    double const expected = 1.8 / 10.2;
    EXPECT_NEAR(*result.report.scale, expected, 1e-9);
    EXPECT_EQ(result.report.adjustedBodyIds.size(), 2u);

    Aabb allowed(0.1, 1.9, -0.9, -0.1);
    for (const auto& body : result.scene.bodies) {
        EXPECT_TRUE(allowed.contains(*bodyAabb(body), 1e-9)) << body.id;
        EXPECT_NEAR(body.collider.radius_m, 0.1 * expected, 1e-12);
    }
    EXPECT_EQ(result.scene.meta.normalization->mode, NormalizationMode::TranslateAndScale);
}

TEST_F(SceneNormalizerTest, TranslateOnlyLetsUpperBoundWin) {
    Scene scene;
    scene.bodies.push_back(dynamicCircle("left", -5.0, -0.5));
    scene.bodies.push_back(dynamicCircle("right", 5.0, -0.5));

    NormalizationOptions options;
    options.margin_m = 0.1;
    options.mode = NormalizationMode::TranslateOnly;
    auto result = SceneNormalizer::normalize(scene, mapping, image, options);

    EXPECT_FALSE(result.report.scale.has_value());
    EXPECT_NEAR(bodyAabb(*findBody(result.scene, "right"))->maxX, 1.9, 1e-9);
    EXPECT_NEAR(result.report.translation_m.x, -3.2, 1e-9);
}

TEST_F(SceneNormalizerTest, ScalesVelocitiesOnlyWhenAsked) {
    Scene scene;
    Body left = dynamicCircle("left", -5.0, -0.5);
    left.velocity_m_s = Vector(1.0, 0.0);
    scene.bodies.push_back(left);
    scene.bodies.push_back(dynamicCircle("right", 5.0, -0.5));

    NormalizationOptions options;
    options.margin_m = 0.1;
    auto plain = SceneNormalizer::normalize(scene, mapping, image, options);
    EXPECT_DOUBLE_EQ(findBody(plain.scene, "left")->velocity_m_s.x, 1.0);

    options.scaleVelocities = true;
    auto scaled = SceneNormalizer::normalize(scene, mapping, image, options);
    EXPECT_NEAR(findBody(scaled.scene, "left")->velocity_m_s.x, 1.8 / 10.2, 1e-9);
}

TEST_F(SceneNormalizerTest, ConstraintAnchorsFollowTargets) {
    Scene scene;
    scene.bodies.push_back(dynamicCircle("ball", 3.0, 0.5));

    RopeConstraint rope;
    rope.id = "rope_1";
    rope.body_a = "ball";
    rope.anchor_a = Anchor{Position(3.0, 0.8), AnchorFrame::Absolute};
    rope.anchor_b = Anchor{Position(0.0, 0.1), AnchorFrame::BodyLocal};
    scene.constraints.emplace_back(rope);

    NormalizationOptions options;
    options.margin_m = 0.1;
    auto result = SceneNormalizer::normalize(scene, mapping, image, options);

    const auto& moved = std::get<RopeConstraint>(result.scene.constraints[0]);
    EXPECT_NEAR(moved.anchor_a.point_m.x, 1.8, 1e-9);
    EXPECT_NEAR(moved.anchor_a.point_m.y, 0.1, 1e-9);
    EXPECT_DOUBLE_EQ(moved.anchor_b.point_m.x, 0.0);
    EXPECT_DOUBLE_EQ(moved.anchor_b.point_m.y, 0.1);
}

TEST_F(SceneNormalizerTest, DanglingConstraintIsLeftAlone) {
    Scene scene;
    scene.bodies.push_back(dynamicCircle("ball", 3.0, 0.5));

    IdealFixedPulleyConstraint pulley;
    pulley.body_a = "ball";
    pulley.body_b = "ghost";
    pulley.pulley_anchor_m = Position(3.0, 1.0);
    scene.constraints.emplace_back(pulley);

    auto result = SceneNormalizer::normalize(scene, mapping, image);

    EXPECT_TRUE(result.report.applied);
    EXPECT_TRUE(hasWarningContaining(result.report, "ghost"));
    const auto& kept = std::get<IdealFixedPulleyConstraint>(result.scene.constraints[0]);
    EXPECT_DOUBLE_EQ(kept.pulley_anchor_m.x, 3.0);
    EXPECT_DOUBLE_EQ(kept.pulley_anchor_m.y, 1.0);
}

TEST_F(SceneNormalizerTest, NoEligibleBodies) {
    Scene scene;
    Body wall;
    wall.id = "wall_1";
    wall.type = BodyType::Static;
    wall.position_m = Position(10.0, 10.0);
    scene.bodies.push_back(wall);

    auto result = SceneNormalizer::normalize(scene, mapping, image);
    EXPECT_FALSE(result.report.applied);
    EXPECT_FALSE(result.report.warnings.empty());
    EXPECT_FALSE(result.scene.meta.normalization.has_value());
    EXPECT_DOUBLE_EQ(result.scene.bodies[0].position_m.x, 10.0);

    // Static bodies become targets when asked for
    NormalizationOptions all;
    all.targetBodies = TargetBodies::All;
    auto moved = SceneNormalizer::normalize(scene, mapping, image, all);
    EXPECT_TRUE(moved.report.applied);
    EXPECT_LT(moved.scene.bodies[0].position_m.x, 2.0);
}

TEST_F(SceneNormalizerTest, UnusableInputsAreReported) {
    Scene scene;
    scene.bodies.push_back(dynamicCircle("ball", 3.0, 0.5));

    SceneMapping badMapping = mapping;
    badMapping.scale_m_per_px = -1.0;
    auto invalidMapping = SceneNormalizer::normalize(scene, badMapping, image);
    EXPECT_FALSE(invalidMapping.report.applied);
    EXPECT_FALSE(invalidMapping.report.warnings.empty());

    auto emptyImage = SceneNormalizer::normalize(scene, mapping, ImageSize{0.0, 100.0});
    EXPECT_FALSE(emptyImage.report.applied);
    EXPECT_FALSE(emptyImage.report.warnings.empty());

    NormalizationOptions wide;
    wide.margin_m = 0.6;
    auto noRoom = SceneNormalizer::normalize(scene, mapping, image, wide);
    EXPECT_FALSE(noRoom.report.applied);
    EXPECT_DOUBLE_EQ(noRoom.scene.bodies[0].position_m.x, 3.0);
}

TEST_F(SceneNormalizerTest, NegativeMarginIsTreatedAsZero) {
    Scene scene;
    scene.bodies.push_back(dynamicCircle("ball", 3.0, -0.5));

    NormalizationOptions options;
    options.margin_m = -1.0;
    auto result = SceneNormalizer::normalize(scene, mapping, image, options);

    EXPECT_DOUBLE_EQ(result.scene.meta.normalization->margin_m, 0.0);
    EXPECT_NEAR(bodyAabb(result.scene.bodies[0])->maxX, 2.0, 1e-9);
}

TEST_F(SceneNormalizerTest, SeparationPrefersPushThatStaysInBounds) {
    // The wall fills the left edge of the image, so the short push to the
    // left would leave the image and the block is moved right instead
    Scene scene;
    scene.bodies.push_back(rectangle("wall_1", BodyType::Static, 0.3, -0.5, 0.6, 1.0));
    scene.bodies.push_back(rectangle("block_1", BodyType::Dynamic, 0.15, -0.5, 0.2, 0.4));

    auto result = SceneNormalizer::normalize(scene, mapping, image);
    const auto& report = result.report;

    EXPECT_TRUE(report.applied);
    EXPECT_FALSE(hasWarningContaining(report, "left image bounds"));
    EXPECT_FALSE(hasWarningContaining(report, "did not converge"));

    const Body* wall = findBody(result.scene, "wall_1");
    const Body* block = findBody(result.scene, "block_1");
    EXPECT_DOUBLE_EQ(wall->position_m.x, 0.3);
    EXPECT_NEAR(block->position_m.x, 0.7005, 1e-9);
    EXPECT_NEAR(block->position_m.y, -0.5, 1e-12);

    Aabb const allowed(0.02, 1.98, -0.98, -0.02);
    Aabb const blockBox = *bodyAabb(*block);
    EXPECT_TRUE(allowed.contains(blockBox, 1e-9));
    Vector const overlap = aabbOverlap(blockBox, *bodyAabb(*wall));
    EXPECT_FALSE(overlap.x > 0.0 && overlap.y > 0.0);

    auto again = SceneNormalizer::normalize(result.scene, mapping, image);
    EXPECT_FALSE(again.report.applied);
}

TEST_F(SceneNormalizerTest, SeparationWarnsWhenBodyLeavesImage) {
    // 0.3 m square image, every way out of the wall crosses the margin box
    ImageSize const small{30.0, 30.0};
    Scene scene;
    scene.bodies.push_back(rectangle("wall_1", BodyType::Static, 0.15, -0.2, 0.3, 0.2));
    scene.bodies.push_back(rectangle("block_1", BodyType::Dynamic, 0.15, -0.15, 0.2, 0.2));

    auto result = SceneNormalizer::normalize(scene, mapping, small);

    EXPECT_TRUE(result.report.applied);
    EXPECT_TRUE(hasWarningContaining(result.report, "block_1 left image bounds after contact separation"));

    // Falls back to the least-penetration push
    const Body* block = findBody(result.scene, "block_1");
    EXPECT_NEAR(block->position_m.x, 0.15, 1e-12);
    EXPECT_NEAR(block->position_m.y, 0.0005, 1e-9);
}

TEST_F(SceneNormalizerTest, WedgedBodyReportsNonConvergence) {
    // The gap between the two walls is narrower than the block
    Scene scene;
    scene.bodies.push_back(rectangle("wall_a", BodyType::Static, 0.475, -0.5, 0.95, 1.0));
    scene.bodies.push_back(rectangle("wall_b", BodyType::Static, 1.525, -0.5, 0.95, 1.0));
    scene.bodies.push_back(rectangle("block_1", BodyType::Dynamic, 1.0, -0.5, 0.2, 0.2));

    auto result = SceneNormalizer::normalize(scene, mapping, image);
    const auto& report = result.report;

    EXPECT_TRUE(hasWarningContaining(report, "did not converge after 5 passes for block_1"));
    EXPECT_TRUE(report.applied);
    ASSERT_TRUE(result.scene.meta.normalization.has_value());
    ASSERT_FALSE(result.scene.meta.normalization->contact_separation.empty());
    EXPECT_EQ(result.scene.meta.normalization->contact_separation[0].id, "block_1");

    // Best effort: the block stays finite and between the walls, the walls stay put
    const Body* block = findBody(result.scene, "block_1");
    EXPECT_TRUE(block->position_m.isFinite());
    EXPECT_GT(block->position_m.x, 0.8);
    EXPECT_LT(block->position_m.x, 1.2);
    EXPECT_DOUBLE_EQ(findBody(result.scene, "wall_a")->position_m.x, 0.475);
    EXPECT_DOUBLE_EQ(findBody(result.scene, "wall_b")->position_m.x, 1.525);
}
