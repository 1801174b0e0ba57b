/**
 * @file scene.hpp
 * @brief In-memory physics scene: world settings, bodies, constraints, mapping
 *
 * All types are plain values. Copying a Scene copies everything it owns, so a
 * function that takes a Scene by const reference and returns a new one never
 * aliases the caller's state.
 *
 * Coordinates are physical meters with Y up.
 */

#ifndef DIAGRAMSIM_SCENE_HPP
#define DIAGRAMSIM_SCENE_HPP

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "diagramsim/math/vector_math.hpp"

namespace Simulation {

struct WorldSettings {
    double gravity_m_s2 = 9.81;          ///< Magnitude, applied along -y
    double time_step_s = 0.016;
    double air_resistance_coeff = 0.0;
};

enum class BodyType {
    Static,
    Dynamic,
    Kinematic
};

/**
 * @brief Parses an upstream type string into a BodyType.
 *
 * "static" and "environment" are Static, "dynamic" is Dynamic, "kinematic" is
 * Kinematic (case-insensitive). Any other value, including an empty string,
 * falls back to the id: ids starting with an environment prefix (ground,
 * surface, platform, wall, ramp, floor, incline, support, anchor) are Static,
 * everything else Dynamic.
 */
BodyType bodyTypeFromString(const std::string& type, const std::string& id);

const char* toString(BodyType type);

enum class ColliderType {
    None,
    Circle,
    Rectangle,
    Polygon
};

/**
 * @brief Collision shape.
 *
 * Circle uses radius_m, Rectangle width_m/height_m (rotated by the body's
 * angle), Polygon uses vertices_m given in world meters.
 */
struct Collider {
    ColliderType type = ColliderType::None;
    double radius_m = 0.0;
    double width_m = 0.0;
    double height_m = 0.0;
    std::vector<Position> vertices_m;

    static Collider circle(double radius);
    static Collider rectangle(double width, double height);
    static Collider polygon(std::vector<Position> vertices);
};

struct Material {
    std::string name = "default";
    double friction = 0.0;
    std::optional<double> restitution;
};

struct Body {
    std::string id;
    BodyType type = BodyType::Dynamic;
    Position position_m;
    Vector velocity_m_s;
    double angle_rad = 0.0;
    double angular_velocity_rad_s = 0.0;
    double mass_kg = 1.0;
    Collider collider;
    Material material;
};

enum class AnchorFrame {
    Absolute,   ///< World meters
    BodyLocal   ///< Offset from the owning body's position
};

struct Anchor {
    Position point_m;
    AnchorFrame frame = AnchorFrame::BodyLocal;
};

struct RopeConstraint {
    std::string id;
    std::string body_a;
    std::string body_b;
    Anchor anchor_a;
    Anchor anchor_b;
    std::optional<double> length_m;
};

struct SpringConstraint {
    std::string id;
    std::string body_a;
    std::string body_b;
    Anchor anchor_a;
    Anchor anchor_b;
    std::optional<double> rest_length_m;
    double stiffness = 0.5;
    double damping = 0.2;
};

/**
 * @brief Pin joint at a world pivot. body_b may be empty (pinned to world).
 */
struct HingeConstraint {
    std::string id;
    std::string body_a;
    std::string body_b;
    Position pivot_m;
};

struct FixedConstraint {
    std::string id;
    std::string body_a;
    std::string body_b;
    Anchor anchor_a;
    Anchor anchor_b;
};

struct DistanceConstraint {
    std::string id;
    std::string body_a;
    std::string body_b;
    Anchor anchor_a;
    Anchor anchor_b;
    std::optional<double> length_m;
};

/**
 * @brief Inextensible rope of fixed total length over a frictionless wheel at
 * a fixed world anchor, connecting body_a and body_b.
 */
struct IdealFixedPulleyConstraint {
    std::string id = "pulley_1";
    std::string body_a;
    std::string body_b;
    Position pulley_anchor_m{0.0, 2.0};
    std::optional<double> rope_length_m;
    double wheel_radius_m = 0.1;
    double rope_mass_kg = 0.0;
};

using Constraint = std::variant<
    RopeConstraint,
    SpringConstraint,
    HingeConstraint,
    FixedConstraint,
    DistanceConstraint,
    IdealFixedPulleyConstraint>;

/**
 * @brief Builds a visitor from a set of lambdas, one per constraint kind.
 */
template<class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

/** @brief Identifier of any constraint kind */
const std::string& constraintId(const Constraint& constraint);

/** @brief "rope", "spring", "hinge", "fixed", "distance" or "ideal_fixed_pulley" */
const char* constraintKind(const Constraint& constraint);

/** @brief Non-empty body ids referenced by the constraint */
std::vector<std::string> referencedBodies(const Constraint& constraint);

/**
 * @brief Frozen relationship between the source image's pixel grid and meters.
 *
 * origin_px is where meter (0,0) sits in the image (pixel Y down).
 */
struct SceneMapping {
    Position origin_px;
    double scale_m_per_px = 0.01;
};

enum class NormalizationMode {
    TranslateOnly,
    TranslateAndScale
};

const char* toString(NormalizationMode mode);

struct ContactSeparation {
    std::string id;
    Vector delta_m;
};

/**
 * @brief Diagnostic block written by the scene normalizer.
 */
struct NormalizationMeta {
    Vector translation_m;
    double scale = 1.0;
    NormalizationMode mode = NormalizationMode::TranslateAndScale;
    double margin_m = 0.0;
    std::vector<ContactSeparation> contact_separation;
};

struct SceneMeta {
    std::optional<NormalizationMeta> normalization;
};

struct Scene {
    WorldSettings world;
    std::vector<Body> bodies;
    std::vector<Constraint> constraints;
    std::optional<SceneMapping> mapping;
    SceneMeta meta;
    std::string notes;
};

} // namespace Simulation

#endif // DIAGRAMSIM_SCENE_HPP
