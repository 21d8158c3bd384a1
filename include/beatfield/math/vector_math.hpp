/**
 * @file vector_math.hpp
 * @brief 2D vector and position mathematics
 *
 * Provides the two geometric primitives used by the particle components:
 * - Position for point locations in world space
 * - Vector for velocities, offsets and collision normals
 */

#ifndef BEATFIELD_VECTOR_MATH_HPP
#define BEATFIELD_VECTOR_MATH_HPP

class Vector;

/**
 * @brief Threshold for floating point equality tests and degenerate lengths
 */
constexpr double EPSILON = 1e-9;

/**
 * @brief Compares two doubles for approximate equality
 * @return true if |a-b| < epsilon
 */
bool nearlyEqual(double a, double b, double epsilon = EPSILON);

/**
 * @brief Represents a 2D point in world space
 */
class Position {
public:
    double x;  ///< X coordinate
    double y;  ///< Y coordinate

    /** @brief Constructs a Position at (0,0) */
    Position();
    Position(double x, double y);

    Position operator+(const Vector& offset) const;

    /**
     * @brief Offset from another position to this one
     * @return Vector pointing from b to this
     */
    Vector operator-(const Position& b) const;

    /**
     * @brief Moves this position by an offset
     * @return Reference to this position
     */
    Position& operator+=(const Vector& offset);
    Position& operator-=(const Vector& offset);

    /**
     * @brief Euclidean distance to another position
     */
    double dist(const Position& p) const;

    /** @brief True when both coordinates are finite */
    bool isFinite() const;
};

/**
 * @brief Represents a 2D vector with direction and magnitude
 */
class Vector {
public:
    double x;  ///< X component
    double y;  ///< Y component

    /** @brief Constructs a zero vector (0,0) */
    Vector();
    Vector(double x, double y);

    Vector operator-() const;
    Vector operator+(const Vector& b) const;
    Vector operator-(const Vector& b) const;
    Vector operator*(double scalar) const;
    Vector operator/(double scalar) const;

    Vector& operator+=(const Vector& v);
    Vector& operator-=(const Vector& v);
    Vector& operator*=(double scalar);

    /** @brief Returns vector magnitude */
    double length() const;

    /** @brief Returns squared magnitude, avoids the square root */
    double lengthSquared() const;

    double dotProduct(const Vector& v) const;

    /**
     * @brief Returns the unit vector in this direction
     *
     * Zero-length (below EPSILON) vectors have no direction; +x is returned
     * so callers always receive a unit vector.
     */
    Vector normalized() const;

    /** @brief True when both components are finite */
    bool isFinite() const;
};

#endif
