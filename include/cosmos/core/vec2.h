#pragma once
#include <cmath>

namespace cosmos {

// 2D vector on the exploration surface. Origin is the surface center,
// units are surface pixels.
struct Vec2 {
  double x{0.0};
  double y{0.0};

  Vec2() = default;
  Vec2(double x_, double y_) : x(x_), y(y_) {}

  Vec2 operator+(const Vec2& rhs) const { return {x + rhs.x, y + rhs.y}; }
  Vec2 operator-(const Vec2& rhs) const { return {x - rhs.x, y - rhs.y}; }
  Vec2 operator*(double s) const { return {x * s, y * s}; }

  double length() const { return std::sqrt(x * x + y * y); }

  // Polar (degrees, radius) to Cartesian.
  static Vec2 from_polar_deg(double angle_deg, double radius) {
    const double rad = angle_deg * 3.14159265358979323846 / 180.0;
    return {std::cos(rad) * radius, std::sin(rad) * radius};
  }
};

} // namespace cosmos
