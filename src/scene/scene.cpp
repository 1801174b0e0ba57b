#include "diagramsim/scene/scene.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace Simulation {

namespace {

std::string toLower(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

const std::array<const char*, 9> kEnvironmentPrefixes = {
    "ground", "surface", "platform", "wall", "ramp",
    "floor", "incline", "support", "anchor"
};

bool hasEnvironmentPrefix(const std::string& lowered) {
    return std::any_of(kEnvironmentPrefixes.begin(), kEnvironmentPrefixes.end(),
                       [&](const char* prefix) { return lowered.rfind(prefix, 0) == 0; });
}

} // namespace

BodyType bodyTypeFromString(const std::string& type, const std::string& id) {
    std::string const t = toLower(type);
    if (t == "dynamic") {
        return BodyType::Dynamic;
    }
    if (t == "kinematic") {
        return BodyType::Kinematic;
    }
    if (t == "static" || t == "environment" || hasEnvironmentPrefix(t)) {
        return BodyType::Static;
    }
    return hasEnvironmentPrefix(toLower(id)) ? BodyType::Static : BodyType::Dynamic;
}

const char* toString(BodyType type) {
    switch (type) {
        case BodyType::Static:    return "static";
        case BodyType::Kinematic: return "kinematic";
        case BodyType::Dynamic:
        default:                  return "dynamic";
    }
}

const char* toString(NormalizationMode mode) {
    return mode == NormalizationMode::TranslateOnly ? "translate-only" : "translate-and-scale";
}

Collider Collider::circle(double radius) {
    Collider c;
    c.type = ColliderType::Circle;
    c.radius_m = radius;
    return c;
}

Collider Collider::rectangle(double width, double height) {
    Collider c;
    c.type = ColliderType::Rectangle;
    c.width_m = width;
    c.height_m = height;
    return c;
}

Collider Collider::polygon(std::vector<Position> vertices) {
    Collider c;
    c.type = ColliderType::Polygon;
    c.vertices_m = std::move(vertices);
    return c;
}

const std::string& constraintId(const Constraint& constraint) {
    return std::visit([](const auto& c) -> const std::string& { return c.id; }, constraint);
}

const char* constraintKind(const Constraint& constraint) {
    return std::visit(Overloaded{
        [](const RopeConstraint&) { return "rope"; },
        [](const SpringConstraint&) { return "spring"; },
        [](const HingeConstraint&) { return "hinge"; },
        [](const FixedConstraint&) { return "fixed"; },
        [](const DistanceConstraint&) { return "distance"; },
        [](const IdealFixedPulleyConstraint&) { return "ideal_fixed_pulley"; },
    }, constraint);
}

std::vector<std::string> referencedBodies(const Constraint& constraint) {
    std::vector<std::string> ids;
    std::visit([&](const auto& c) {
        if (!c.body_a.empty()) {
            ids.push_back(c.body_a);
        }
        if (!c.body_b.empty()) {
            ids.push_back(c.body_b);
        }
    }, constraint);
    return ids;
}

} // namespace Simulation
