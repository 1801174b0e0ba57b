/**
 * @file pulley_constraint.cpp
 * @brief Mass-weighted projection for ideal fixed pulleys
 */

#include "diagramsim/systems/pulley_constraint.hpp"

#include <cmath>
#include <variant>

#include "diagramsim/components/basic.hpp"
#include "diagramsim/core/constants.hpp"
#include "diagramsim/core/debug.hpp"
#include "diagramsim/core/profile.hpp"

namespace Systems {

namespace {

/**
 * Static and kinematic bodies are not pushed by the rope, so they get zero
 * inverse mass. Missing or non-positive masses count as 1 kg.
 */
double inverseMass(const entt::registry& registry, entt::entity entity) {
    const auto* kind = registry.try_get<Components::BodyKind>(entity);
    if (kind && kind->type != Simulation::BodyType::Dynamic) {
        return 0.0;
    }
    const auto* mass = registry.try_get<Components::Mass>(entity);
    if (!mass || !std::isfinite(mass->value) || mass->value <= 0.0) {
        return 1.0;
    }
    return 1.0 / mass->value;
}

} // namespace

PulleyConstraintSystem::PulleyConstraintSystem() {
    specificConfig.lengthTolerance = SimulatorConstants::PulleyLengthTolerance;
    specificConfig.speedTolerance = SimulatorConstants::PulleySpeedTolerance;
}

std::vector<std::string> PulleyConstraintSystem::registerPulleys(
    entt::registry& registry,
    const Simulation::Scene& scene,
    const std::unordered_map<std::string, entt::entity>& bodies) {
    std::vector<std::string> warnings;

    for (const auto& constraint : scene.constraints) {
        const auto* pulley = std::get_if<Simulation::IdealFixedPulleyConstraint>(&constraint);
        if (!pulley) {
            continue;
        }

        auto a = bodies.find(pulley->body_a);
        auto b = bodies.find(pulley->body_b);
        if (a == bodies.end() || b == bodies.end()) {
            std::string const missing = (a == bodies.end()) ? pulley->body_a : pulley->body_b;
            std::string message = "Pulley " + pulley->id + " references unknown body " +
                                  missing + "; skipped";
            DIAGRAMSIM_WARN(message);
            warnings.push_back(std::move(message));
            continue;
        }

        Components::PulleyRope rope;
        rope.id = pulley->id;
        rope.bodyA = a->second;
        rope.bodyB = b->second;
        rope.anchor = pulley->pulley_anchor_m;
        rope.wheelRadius = pulley->wheel_radius_m;

        const auto& posA = registry.get<Components::Position>(rope.bodyA);
        const auto& posB = registry.get<Components::Position>(rope.bodyB);
        double const geometric = posA.dist(rope.anchor) + posB.dist(rope.anchor);
        if (pulley->rope_length_m && std::isfinite(*pulley->rope_length_m) &&
            *pulley->rope_length_m > 0.0) {
            rope.totalLength = *pulley->rope_length_m;
        } else {
            rope.totalLength = geometric;
        }

        DIAGRAMSIM_VERBOSE("Registered pulley " << rope.id << " (length " << rope.totalLength << " m)");
        registry.emplace<Components::PulleyRope>(registry.create(), rope);
    }
    return warnings;
}

bool PulleyConstraintSystem::enforce(entt::registry& registry,
                                     const Components::PulleyRope& rope,
                                     const PulleyConfig& config) {
    if (!registry.valid(rope.bodyA) || !registry.valid(rope.bodyB)) {
        return false;
    }

    auto& posA = registry.get<Components::Position>(rope.bodyA);
    auto& posB = registry.get<Components::Position>(rope.bodyB);
    auto& velA = registry.get<Components::Velocity>(rope.bodyA);
    auto& velB = registry.get<Components::Velocity>(rope.bodyB);

    double const invA = inverseMass(registry, rope.bodyA);
    double const invB = inverseMass(registry, rope.bodyB);
    double const invSum = invA + invB;
    if (invSum <= 0.0) {
        return false;
    }

    // Unit directions from the wheel towards each body
    Vector const dirA = Vector(posA - rope.anchor).normalized();
    Vector const dirB = Vector(posB - rope.anchor).normalized();

    // A rope within tolerance is left alone, velocities included
    double const error = posA.dist(rope.anchor) + posB.dist(rope.anchor) - rope.totalLength;
    if (std::abs(error) < config.lengthTolerance) {
        return false;
    }
    posA += dirA * (-error * invA / invSum);
    posB += dirB * (-error * invB / invSum);

    double const totalVn = velA.dotProduct(dirA) + velB.dotProduct(dirB);
    if (std::abs(totalVn) > config.speedTolerance) {
        if (invA > 0.0 && invB > 0.0) {
            velA -= dirA * (totalVn * 0.5);
            velB -= dirB * (totalVn * 0.5);
        } else if (invA > 0.0) {
            velA -= dirA * totalVn;
        } else {
            velB -= dirB * totalVn;
        }
    }
    return true;
}

void PulleyConstraintSystem::update(entt::registry& registry) {
    PROFILE_SCOPE("PulleyConstraintSystem");

    auto view = registry.view<Components::PulleyRope>();
    for (auto [entity, rope] : view.each()) {
        enforce(registry, rope, specificConfig);
    }
}

} // namespace Systems
