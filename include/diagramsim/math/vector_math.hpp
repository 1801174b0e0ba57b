/**
 * @file vector_math.hpp
 * @brief 2D vector and position primitives shared by every coordinate space
 *
 * Positions are absolute points (meters, image pixels or canvas pixels,
 * depending on context). Vectors are directions and displacements.
 */

#ifndef DIAGRAMSIM_VECTOR_MATH_HPP
#define DIAGRAMSIM_VECTOR_MATH_HPP

class Vector;

/**
 * @brief Slack for floating point comparisons
 */
constexpr double EPSILON = 1e-9;

/**
 * @brief Returns value if it is finite, otherwise fallback
 */
double finiteOr(double value, double fallback);

/**
 * @brief Represents a 2D point in space
 */
class Position {
public:
    double x;  ///< X coordinate
    double y;  ///< Y coordinate

    Position();
    Position(double x, double y);

    Position operator+(const Position& b) const;
    Position operator-(const Position& b) const;
    Position operator*(double scalar) const;
    Position operator/(double scalar) const;

    /**
     * @brief Euclidean distance to another position
     */
    double dist(const Position& p) const;

    /** @brief True when both coordinates are finite */
    bool isFinite() const;

    Position& operator+=(const Position& p);
    Position& operator-=(const Position& p);
};

/**
 * @brief Represents a 2D vector with direction and magnitude
 */
class Vector {
public:
    double x;  ///< X component
    double y;  ///< Y component

    Vector();
    Vector(double x, double y);
    Vector(const Position& p);

    operator Position() const;

    Vector operator-() const;
    Vector operator+(const Vector& b) const;
    Vector operator-(const Vector& b) const;
    Vector operator*(double scalar) const;
    Vector operator/(double scalar) const;

    /** @brief Returns vector magnitude */
    double length() const;

    /**
     * @brief Dot product with another vector
     */
    double dotProduct(const Vector& v) const;

    /**
     * @brief Returns normalized vector (length = 1)
     *
     * Zero-length vectors normalize to (1, 0).
     */
    Vector normalized() const;

    /**
     * @brief Rotates vector by specified angle
     * @param angle Rotation angle in radians (counter-clockwise)
     */
    Vector rotateByAngle(double angle) const;

    /** @brief True when both components are finite */
    bool isFinite() const;

    Vector& operator+=(const Vector& v);
    Vector& operator-=(const Vector& v);
};

/**
 * @brief Scales a point about a center
 *
 * @param p Point to scale
 * @param center Fixed point of the scaling
 * @param factor Uniform scale factor
 * @return center + (p - center) * factor
 */
Position scaleAbout(const Position& p, const Position& center, double factor);

#endif // DIAGRAMSIM_VECTOR_MATH_HPP
