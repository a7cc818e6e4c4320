/**
 * @file vector_math.hpp
 * @brief 2D vector and position primitives used by the fluid solver
 *
 * Provides the two value types everything else is built on:
 * - Vector for displacements, velocities, normals and impulses
 * - Position for absolute points in world space
 *
 * A Position converts implicitly to a Vector so that body positions can be
 * fed straight into vector arithmetic; the reverse conversion is explicit.
 */

#ifndef LIQUID_VECTOR_MATH_HPP
#define LIQUID_VECTOR_MATH_HPP

// Forward declarations
class Vector;

/**
 * @brief Length below which a vector counts as zero
 */
constexpr double EPSILON = 1e-9;

/**
 * @brief A point in 2D world space
 */
class Position {
public:
    double x;  ///< X coordinate
    double y;  ///< Y coordinate

    Position();
    Position(double x, double y);
    explicit Position(const Vector& v);

    Position operator+(const Vector& offset) const;
    Position operator-(const Vector& offset) const;
    Position& operator+=(const Vector& offset);
    Position& operator-=(const Vector& offset);

    /**
     * @brief Euclidean distance to another position
     */
    double dist(const Position& p) const;

    /**
     * @brief Squared distance to another position (no square root)
     */
    double distSquared(const Position& p) const;
};

/**
 * @brief A 2D vector with direction and magnitude
 */
class Vector {
public:
    double x;  ///< X component
    double y;  ///< Y component

    /** @brief Constructs a zero vector (0,0) */
    Vector();
    Vector(double x, double y);
    Vector(const Position& p);

    Vector operator-() const;
    Vector operator+(const Vector& b) const;
    Vector operator-(const Vector& b) const;
    Vector operator*(double scalar) const;
    Vector operator/(double scalar) const;

    Vector& operator+=(const Vector& v);
    Vector& operator-=(const Vector& v);
    Vector& operator*=(double scalar);

    bool operator==(const Vector& other) const;
    bool operator!=(const Vector& other) const;

    /** @brief Returns vector magnitude */
    double length() const;

    /** @brief Returns squared magnitude */
    double lengthSquared() const;

    /**
     * @brief Dot product with another vector
     */
    double dotProduct(const Vector& v) const;

    /**
     * @brief 2D cross product (z-component of the 3D cross product)
     */
    double cross(const Vector& other) const;

    /**
     * @brief Returns the unit vector in the same direction
     *
     * A zero-length vector has no direction; (1,0) is returned instead so that
     * callers building contact normals never divide by zero.
     */
    Vector normalized() const;

    /**
     * @brief Rotates vector by the given angle
     * @param angle Rotation angle in radians
     */
    Vector rotateByAngle(double angle) const;

    /**
     * @brief Component-wise finiteness check
     */
    bool isFinite() const;
};

/**
 * @brief Scalar-first multiplication, e.g. `0.05 * normal`
 */
Vector operator*(double scalar, const Vector& v);

/**
 * @brief Displacement between two positions
 */
Vector operator-(const Position& a, const Position& b);

#endif // LIQUID_VECTOR_MATH_HPP
