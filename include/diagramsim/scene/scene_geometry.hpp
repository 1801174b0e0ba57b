/**
 * @file scene_geometry.hpp
 * @brief Bounding boxes and rigid edits of scene bodies and constraints
 *
 * The edit functions mutate the value they are given; callers work on their
 * own copy of a Scene.
 */

#pragma once

#include <optional>

#include "diagramsim/math/aabb.hpp"
#include "diagramsim/scene/scene.hpp"

namespace Simulation {

/**
 * @brief Half extents of a body's collider along X and Y.
 *
 * Missing or non-positive sizes fall back to the default half extent. Polygon
 * extents are half the span of the vertex bounds. Rectangles account for the
 * body's rotation.
 */
Vector colliderHalfExtents(const Body& body);

/**
 * @brief World AABB of a body, or nullopt if its position is not finite.
 *
 * Polygon bodies use their world vertex bounds; other colliders are centered
 * on the body position.
 */
std::optional<Aabb> bodyAabb(const Body& body);

/**
 * @brief Moves a body and its world-space polygon vertices.
 */
void translateBody(Body& body, const Vector& delta);

/**
 * @brief Scales a body about center: position, collider sizes, polygon
 * vertices, and velocity when scaleVelocity is set.
 */
void scaleBody(Body& body, const Position& center, double factor, bool scaleVelocity);

/**
 * @brief Moves the absolute (world-space) anchors of a constraint.
 *
 * Body-local anchors follow their body and are left alone.
 */
void translateConstraint(Constraint& constraint, const Vector& delta);

/**
 * @brief Scales a constraint: absolute anchors about center, body-local
 * anchors about their body, and every length (rope, rest, wheel radius).
 */
void scaleConstraint(Constraint& constraint, const Position& center, double factor);

} // namespace Simulation
