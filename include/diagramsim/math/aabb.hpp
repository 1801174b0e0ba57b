/**
 * @file aabb.hpp
 * @brief Axis-aligned bounding boxes
 */

#ifndef DIAGRAMSIM_AABB_HPP
#define DIAGRAMSIM_AABB_HPP

#include <algorithm>
#include <limits>

#include "diagramsim/math/vector_math.hpp"

/**
 * @brief Axis-aligned bounding box. A default-constructed box is empty
 * (inverted infinite bounds) so that merging into it yields the other box.
 */
struct Aabb {
    double minX = std::numeric_limits<double>::infinity();
    double maxX = -std::numeric_limits<double>::infinity();
    double minY = std::numeric_limits<double>::infinity();
    double maxY = -std::numeric_limits<double>::infinity();

    Aabb() = default;
    Aabb(double minX, double maxX, double minY, double maxY)
        : minX(minX), maxX(maxX), minY(minY), maxY(maxY) {}

    static Aabb around(const Position& center, double halfX, double halfY) {
        return {center.x - halfX, center.x + halfX, center.y - halfY, center.y + halfY};
    }

    bool isEmpty() const { return !(minX <= maxX && minY <= maxY); }
    double width() const { return maxX - minX; }
    double height() const { return maxY - minY; }
    Position center() const { return {(minX + maxX) / 2.0, (minY + maxY) / 2.0}; }

    void expand(const Position& p) {
        minX = std::min(minX, p.x);
        maxX = std::max(maxX, p.x);
        minY = std::min(minY, p.y);
        maxY = std::max(maxY, p.y);
    }

    void merge(const Aabb& other) {
        minX = std::min(minX, other.minX);
        maxX = std::max(maxX, other.maxX);
        minY = std::min(minY, other.minY);
        maxY = std::max(maxY, other.maxY);
    }

    Aabb translated(double dx, double dy) const {
        return {minX + dx, maxX + dx, minY + dy, maxY + dy};
    }

    /** @brief Shrinks every side by margin */
    Aabb inset(double margin) const {
        return {minX + margin, maxX - margin, minY + margin, maxY - margin};
    }

    /** @brief True if other lies inside this box, allowing tolerance on each side */
    bool contains(const Aabb& other, double tolerance = 0.0) const {
        return other.minX >= minX - tolerance && other.maxX <= maxX + tolerance &&
               other.minY >= minY - tolerance && other.maxY <= maxY + tolerance;
    }
};

/**
 * @brief Overlap lengths of two boxes along X and Y. Non-positive means separated.
 */
inline Vector aabbOverlap(const Aabb& a, const Aabb& b) {
    return {std::min(a.maxX, b.maxX) - std::max(a.minX, b.minX),
            std::min(a.maxY, b.maxY) - std::max(a.minY, b.minY)};
}

#endif // DIAGRAMSIM_AABB_HPP
