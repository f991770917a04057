/**
 * @file vector_math.hpp
 * @brief 3D vector and position mathematics library
 *
 * This file provides the geometric primitives used by the simulation:
 * - Vector class for directions, velocities and displacements
 * - Position class for point locations in 3D space
 * - Dot and cross products, lengths, normalization
 * - Utility functions for floating point comparisons
 */

#ifndef GRAVSIM_VECTOR_MATH_HPP
#define GRAVSIM_VECTOR_MATH_HPP

// Forward declarations
class Vector;

/**
 * @brief Constants for floating-point comparisons
 */
constexpr double EPSILON = 1e-9;  ///< Threshold for floating point equality tests

/**
 * @brief Compares two doubles for approximate equality
 *
 * @param a First value
 * @param b Second value
 * @param epsilon Maximum allowed difference
 * @return true if |a-b| < epsilon
 */
bool nearlyEqual(double a, double b, double epsilon=EPSILON);

/**
 * @brief Represents a point in 3D space
 *
 * The difference of two positions is a Vector, and a position can be
 * offset by a Vector.
 */
class Position {
public:
    double x;  ///< X coordinate
    double y;  ///< Y coordinate
    double z;  ///< Z coordinate

    /** @brief Constructs a Position at the origin */
    Position();

    /**
     * @brief Constructs a Position at specified coordinates
     */
    Position(double x, double y, double z);

    /** @brief Position vector from the origin */
    operator Vector() const;

    /**
     * @brief Displacement from another position to this one
     * @param b Origin of the displacement
     * @return Vector pointing from b to this position
     */
    Vector operator-(const Position& b) const;

    /** @brief Offsets this position by a vector */
    Position operator+(const Vector& v) const;

    /** @brief Offsets this position by the negation of a vector */
    Position operator-(const Vector& v) const;

    Position& operator+=(const Vector& v);
    Position& operator-=(const Vector& v);

    /**
     * @brief Calculates Euclidean distance to another position
     * @param p Target position
     * @return Distance between positions
     */
    double dist(const Position& p) const;
};

/**
 * @brief Represents a 3D vector with direction and magnitude
 */
class Vector {
public:
    double x;  ///< X component
    double y;  ///< Y component
    double z;  ///< Z component

    /** @brief Constructs a zero vector */
    Vector();

    /**
     * @brief Constructs a vector with given components
     */
    Vector(double x, double y, double z);

    /** @brief Converts Vector to Position */
    operator Position() const;

    /** @brief Returns negation of this vector */
    Vector operator-() const;

    Vector operator+(const Vector& b) const;
    Vector operator-(const Vector& b) const;

    /**
     * @brief Scales vector by scalar value
     * @param scalar Scale factor
     * @return Scaled vector
     */
    Vector operator*(double scalar) const;

    /**
     * @brief Divides vector by scalar value
     * @param scalar Divisor
     * @return Divided vector
     */
    Vector operator/(double scalar) const;

    Vector& operator+=(const Vector& v);
    Vector& operator-=(const Vector& v);
    Vector& operator*=(double scalar);

    /** @brief Returns vector magnitude */
    double length() const;

    /** @brief Returns squared magnitude, avoids the square root */
    double lengthSquared() const;

    /**
     * @brief Calculates dot product with another vector
     * @param v Other vector
     * @return Dot product value
     */
    double dotProduct(const Vector& v) const;

    /**
     * @brief Calculates the cross product with another vector
     * @param other Other vector
     * @return Vector perpendicular to both operands
     */
    Vector cross(const Vector& other) const;

    /**
     * @brief Returns normalized vector (length = 1)
     *
     * The zero vector has no direction; it is returned unchanged.
     */
    Vector normalized() const;

    /**
     * @brief Scales vector to specified length
     * @param length Target length
     * @return Vector with same direction but new length
     */
    Vector scale(double length) const;

    /**
     * @brief Projects vector onto another vector
     * @param onto Vector to project onto
     * @return Projected vector
     */
    Vector projectOnto(const Vector& onto) const;

    /** @brief True if every component is a finite number */
    bool isFinite() const;
};

/** @brief Scalar-first multiplication, same as v * scalar */
Vector operator*(double scalar, const Vector& v);

#endif // GRAVSIM_VECTOR_MATH_HPP
