#include "diagramsim/scene/scene_geometry.hpp"

#include <cmath>

#include "diagramsim/core/constants.hpp"

namespace Simulation {

namespace {

double positiveOr(double value, double fallback) {
    return (std::isfinite(value) && value > 0.0) ? value : fallback;
}

void translateAnchor(Anchor& anchor, const Vector& delta) {
    if (anchor.frame == AnchorFrame::Absolute) {
        anchor.point_m += delta;
    }
}

void scaleAnchor(Anchor& anchor, const Position& center, double factor) {
    if (anchor.frame == AnchorFrame::Absolute) {
        anchor.point_m = scaleAbout(anchor.point_m, center, factor);
    } else {
        anchor.point_m = anchor.point_m * factor;
    }
}

void scaleLength(std::optional<double>& length, double factor) {
    if (length) {
        *length *= factor;
    }
}

Aabb polygonBounds(const Collider& collider) {
    Aabb bounds;
    for (const auto& v : collider.vertices_m) {
        if (v.isFinite()) {
            bounds.expand(v);
        }
    }
    return bounds;
}

} // namespace

Vector colliderHalfExtents(const Body& body) {
    const double fallback = SimulatorConstants::DefaultColliderHalfExtent;
    const Collider& collider = body.collider;

    switch (collider.type) {
        case ColliderType::Circle: {
            double const r = positiveOr(collider.radius_m, fallback);
            return {r, r};
        }
        case ColliderType::Rectangle: {
            double const hw = positiveOr(collider.width_m / 2.0, fallback);
            double const hh = positiveOr(collider.height_m / 2.0, fallback);
            double const angle = finiteOr(body.angle_rad, 0.0);
            double const c = std::fabs(std::cos(angle));
            double const s = std::fabs(std::sin(angle));
            return {hw * c + hh * s, hw * s + hh * c};
        }
        case ColliderType::Polygon: {
            Aabb const bounds = polygonBounds(collider);
            if (bounds.isEmpty()) {
                return {fallback, fallback};
            }
            return {positiveOr(bounds.width() / 2.0, fallback),
                    positiveOr(bounds.height() / 2.0, fallback)};
        }
        case ColliderType::None:
        default:
            return {fallback, fallback};
    }
}

std::optional<Aabb> bodyAabb(const Body& body) {
    if (!body.position_m.isFinite()) {
        return std::nullopt;
    }
    Vector const half = colliderHalfExtents(body);
    if (body.collider.type == ColliderType::Polygon) {
        Aabb const bounds = polygonBounds(body.collider);
        if (!bounds.isEmpty()) {
            return Aabb::around(bounds.center(), half.x, half.y);
        }
    }
    return Aabb::around(body.position_m, half.x, half.y);
}

void translateBody(Body& body, const Vector& delta) {
    if (body.position_m.isFinite()) {
        body.position_m += delta;
    }
    for (auto& v : body.collider.vertices_m) {
        v += delta;
    }
}

void scaleBody(Body& body, const Position& center, double factor, bool scaleVelocity) {
    if (body.position_m.isFinite()) {
        body.position_m = scaleAbout(body.position_m, center, factor);
    }
    if (scaleVelocity) {
        body.velocity_m_s = body.velocity_m_s * factor;
    }

    Collider& collider = body.collider;
    collider.radius_m *= factor;
    collider.width_m *= factor;
    collider.height_m *= factor;
    for (auto& v : collider.vertices_m) {
        v = scaleAbout(v, center, factor);
    }
}

void translateConstraint(Constraint& constraint, const Vector& delta) {
    std::visit(Overloaded{
        [&](HingeConstraint& c) { c.pivot_m += delta; },
        [&](IdealFixedPulleyConstraint& c) { c.pulley_anchor_m += delta; },
        [&](auto& c) {
            translateAnchor(c.anchor_a, delta);
            translateAnchor(c.anchor_b, delta);
        },
    }, constraint);
}

void scaleConstraint(Constraint& constraint, const Position& center, double factor) {
    std::visit(Overloaded{
        [&](RopeConstraint& c) {
            scaleAnchor(c.anchor_a, center, factor);
            scaleAnchor(c.anchor_b, center, factor);
            scaleLength(c.length_m, factor);
        },
        [&](SpringConstraint& c) {
            scaleAnchor(c.anchor_a, center, factor);
            scaleAnchor(c.anchor_b, center, factor);
            scaleLength(c.rest_length_m, factor);
        },
        [&](HingeConstraint& c) {
            c.pivot_m = scaleAbout(c.pivot_m, center, factor);
        },
        [&](FixedConstraint& c) {
            scaleAnchor(c.anchor_a, center, factor);
            scaleAnchor(c.anchor_b, center, factor);
        },
        [&](DistanceConstraint& c) {
            scaleAnchor(c.anchor_a, center, factor);
            scaleAnchor(c.anchor_b, center, factor);
            scaleLength(c.length_m, factor);
        },
        [&](IdealFixedPulleyConstraint& c) {
            c.pulley_anchor_m = scaleAbout(c.pulley_anchor_m, center, factor);
            scaleLength(c.rope_length_m, factor);
            c.wheel_radius_m *= factor;
        },
    }, constraint);
}

} // namespace Simulation
