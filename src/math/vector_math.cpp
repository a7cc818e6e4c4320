#include "liquid/math/vector_math.hpp"

#include <cmath>

// Position

Position::Position() : x(0), y(0) {}
Position::Position(double x, double y) : x(x), y(y) {}
Position::Position(const Vector& v) : x(v.x), y(v.y) {}

Position Position::operator+(const Vector& offset) const {
  return {this->x + offset.x, this->y + offset.y};
}

Position Position::operator-(const Vector& offset) const {
  return {this->x - offset.x, this->y - offset.y};
}

Position& Position::operator+=(const Vector& offset) {
  this->x += offset.x;
  this->y += offset.y;
  return *this;
}

Position& Position::operator-=(const Vector& offset) {
  this->x -= offset.x;
  this->y -= offset.y;
  return *this;
}

double Position::dist(const Position& p) const {
  return std::sqrt(distSquared(p));
}

double Position::distSquared(const Position& p) const {
  double const dx = this->x - p.x;
  double const dy = this->y - p.y;
  return dx * dx + dy * dy;
}

// Vector

Vector::Vector() : x(0), y(0) {}
Vector::Vector(double x, double y) : x(x), y(y) {}
Vector::Vector(const Position& p) : x(p.x), y(p.y) {}

Vector Vector::operator-() const {
  return {-this->x, -this->y};
}

Vector Vector::operator+(const Vector& b) const {
  return {this->x + b.x, this->y + b.y};
}

Vector Vector::operator-(const Vector& b) const {
  return {this->x - b.x, this->y - b.y};
}

Vector Vector::operator*(double scalar) const {
  return {this->x * scalar, this->y * scalar};
}

Vector Vector::operator/(double scalar) const {
  return {this->x / scalar, this->y / scalar};
}

Vector& Vector::operator+=(const Vector& v) {
  this->x += v.x;
  this->y += v.y;
  return *this;
}

Vector& Vector::operator-=(const Vector& v) {
  this->x -= v.x;
  this->y -= v.y;
  return *this;
}

Vector& Vector::operator*=(double scalar) {
  this->x *= scalar;
  this->y *= scalar;
  return *this;
}

bool Vector::operator==(const Vector& other) const {
  return this->x == other.x && this->y == other.y;
}

bool Vector::operator!=(const Vector& other) const {
  return !(*this == other);
}

double Vector::length() const {
  return std::sqrt(lengthSquared());
}

double Vector::lengthSquared() const {
  return this->x * this->x + this->y * this->y;
}

double Vector::dotProduct(const Vector& v) const {
  return this->x * v.x + this->y * v.y;
}

double Vector::cross(const Vector& other) const {
  return this->x * other.y - this->y * other.x;
}

Vector Vector::normalized() const {
  double const len = this->length();
  if (len > EPSILON) {
    return {this->x / len, this->y / len};
  }
  return {1.0, 0.0};
}

Vector Vector::rotateByAngle(double angle) const {
  double const c = std::cos(angle);
  double const s = std::sin(angle);
  return {this->x * c - this->y * s, this->x * s + this->y * c};
}

bool Vector::isFinite() const {
  return std::isfinite(this->x) && std::isfinite(this->y);
}

Vector operator*(double scalar, const Vector& v) {
  return v * scalar;
}

Vector operator-(const Position& a, const Position& b) {
  return {a.x - b.x, a.y - b.y};
}
