#include "diagramsim/math/vector_math.hpp"

#include <cmath>

double finiteOr(double value, double fallback) {
  return std::isfinite(value) ? value : fallback;
}

// Position

Position::Position() : x(0), y(0) {}
Position::Position(double x, double y) : x(x), y(y) {}

Position Position::operator+(const Position& b) const {
  return {this->x + b.x, this->y + b.y};
}

Position Position::operator-(const Position& b) const {
  return {this->x - b.x, this->y - b.y};
}

Position Position::operator*(double scalar) const {
  return {this->x * scalar, this->y * scalar};
}

Position Position::operator/(double scalar) const {
  return {this->x / scalar, this->y / scalar};
}

double Position::dist(const Position& p) const {
  double const dx = this->x - p.x;
  double const dy = this->y - p.y;
  return std::hypot(dx, dy);
}

bool Position::isFinite() const {
  return std::isfinite(this->x) && std::isfinite(this->y);
}

Position& Position::operator+=(const Position& p) {
  this->x += p.x;
  this->y += p.y;
  return *this;
}

Position& Position::operator-=(const Position& p) {
  this->x -= p.x;
  this->y -= p.y;
  return *this;
}

// Vector

Vector::Vector() : x(0), y(0) {}
Vector::Vector(double x, double y) : x(x), y(y) {}
Vector::Vector(const Position& p) : x(p.x), y(p.y) {}

Vector::operator Position() const {
  return {this->x, this->y};
}

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

double Vector::length() const {
  return std::hypot(this->x, this->y);
}

double Vector::dotProduct(const Vector& v) const {
  return this->x * v.x + this->y * v.y;
}

Vector Vector::normalized() const {
  double const len = this->length();
  if (len > 1e-9) {
    return {this->x / len, this->y / len};
  }
  // default direction if zero-length vector
  return {1.0, 0.0};
}

Vector Vector::rotateByAngle(double angle) const {
  double const c = std::cos(angle);
  double const s = std::sin(angle);
  return {this->x*c - this->y*s, this->x*s + this->y*c};
}

bool Vector::isFinite() const {
  return std::isfinite(this->x) && std::isfinite(this->y);
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

Position scaleAbout(const Position& p, const Position& center, double factor) {
  return {center.x + (p.x - center.x) * factor,
          center.y + (p.y - center.y) * factor};
}
