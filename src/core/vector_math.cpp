#include "gravsim/math/vector_math.hpp"

#include <cmath>

bool nearlyEqual(double a, double b, double epsilon) {
  return std::fabs(a - b) < epsilon;
}

// Position

Position::Position() : x(0), y(0), z(0) {}
Position::Position(double x, double y, double z) : x(x), y(y), z(z) {}

Position::operator Vector() const {
  return Vector(this->x, this->y, this->z);
}

Vector Position::operator-(const Position& b) const {
  return Vector(this->x - b.x, this->y - b.y, this->z - b.z);
}

Position Position::operator+(const Vector& v) const {
  return Position(this->x + v.x, this->y + v.y, this->z + v.z);
}

Position Position::operator-(const Vector& v) const {
  return Position(this->x - v.x, this->y - v.y, this->z - v.z);
}

Position& Position::operator+=(const Vector& v) {
  this->x += v.x;
  this->y += v.y;
  this->z += v.z;
  return *this;
}

Position& Position::operator-=(const Vector& v) {
  this->x -= v.x;
  this->y -= v.y;
  this->z -= v.z;
  return *this;
}

double Position::dist(const Position& p) const {
  return (*this - p).length();
}

// Vector

Vector::Vector() : x(0), y(0), z(0) {}
Vector::Vector(double x, double y, double z) : x(x), y(y), z(z) {}

Vector::operator Position() const {
  return Position(this->x, this->y, this->z);
}

Vector Vector::operator-() const {
  return Vector(-this->x, -this->y, -this->z);
}

Vector Vector::operator+(const Vector& b) const {
  return Vector(this->x + b.x, this->y + b.y, this->z + b.z);
}

Vector Vector::operator-(const Vector& b) const {
  return Vector(this->x - b.x, this->y - b.y, this->z - b.z);
}

Vector Vector::operator*(const double scalar) const {
  return Vector(this->x * scalar, this->y * scalar, this->z * scalar);
}

Vector Vector::operator/(const double scalar) const {
  return Vector(this->x / scalar, this->y / scalar, this->z / scalar);
}

Vector& Vector::operator+=(const Vector& b) {
  this->x += b.x;
  this->y += b.y;
  this->z += b.z;
  return *this;
}

Vector& Vector::operator-=(const Vector& b) {
  this->x -= b.x;
  this->y -= b.y;
  this->z -= b.z;
  return *this;
}

Vector& Vector::operator*=(const double scalar) {
  this->x *= scalar;
  this->y *= scalar;
  this->z *= scalar;
  return *this;
}

double Vector::length() const {
  return std::sqrt(lengthSquared());
}

double Vector::lengthSquared() const {
  return this->x * this->x + this->y * this->y + this->z * this->z;
}

double Vector::dotProduct(const Vector& v) const {
  return this->x * v.x + this->y * v.y + this->z * v.z;
}

Vector Vector::cross(const Vector& other) const {
  return Vector(this->y * other.z - this->z * other.y,
                this->z * other.x - this->x * other.z,
                this->x * other.y - this->y * other.x);
}

Vector Vector::normalized() const {
  double const len = length();
  if (len < EPSILON) {
    return *this;
  }
  return *this / len;
}

Vector Vector::scale(double length) const {
  return normalized() * length;
}

Vector Vector::projectOnto(const Vector& onto) const {
  double const denom = onto.lengthSquared();
  if (denom < EPSILON * EPSILON) {
    return Vector();
  }
  return onto * (dotProduct(onto) / denom);
}

bool Vector::isFinite() const {
  return std::isfinite(this->x) && std::isfinite(this->y) && std::isfinite(this->z);
}

Vector operator*(double scalar, const Vector& v) {
  return v * scalar;
}
