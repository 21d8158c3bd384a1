#include "beatfield/math/vector_math.hpp"

#include <cmath>

bool nearlyEqual(double a, double b, double epsilon) {
  return std::fabs(a - b) < epsilon;
}

// Position

Position::Position() : x(0), y(0) {}
Position::Position(double x, double y) : x(x), y(y) {}

Position Position::operator+(const Vector& offset) const {
  return {this->x + offset.x, this->y + offset.y};
}

Vector Position::operator-(const Position& b) const {
  return {this->x - b.x, this->y - b.y};
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
  return (*this - p).length();
}

bool Position::isFinite() const {
  return std::isfinite(this->x) && std::isfinite(this->y);
}

// Vector

Vector::Vector() : x(0), y(0) {}
Vector::Vector(double x, double y) : x(x), y(y) {}

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

double Vector::length() const {
  return std::sqrt(this->lengthSquared());
}

double Vector::lengthSquared() const {
  return this->x * this->x + this->y * this->y;
}

double Vector::dotProduct(const Vector& v) const {
  return this->x * v.x + this->y * v.y;
}

Vector Vector::normalized() const {
  double const len = this->length();
  if (len > EPSILON) {
    return {this->x / len, this->y / len};
  }
  return {1.0, 0.0};
}

bool Vector::isFinite() const {
  return std::isfinite(this->x) && std::isfinite(this->y);
}
