#pragma once
#include <cmath>

namespace starclaim {

// 2D position in field units (the presentation layer maps these 1:1 to pixels).
struct Vec2 {
  double x{0.0};
  double y{0.0};

  Vec2() = default;
  Vec2(double x_, double y_) : x(x_), y(y_) {}

  Vec2 operator+(const Vec2& rhs) const { return {x + rhs.x, y + rhs.y}; }
  Vec2 operator-(const Vec2& rhs) const { return {x - rhs.x, y - rhs.y}; }
  Vec2 operator*(double s) const { return {x * s, y * s}; }

  bool operator==(const Vec2& rhs) const { return x == rhs.x && y == rhs.y; }
  bool operator!=(const Vec2& rhs) const { return !(*this == rhs); }

  double length() const { return std::sqrt(x * x + y * y); }
  double length_squared() const { return x * x + y * y; }
};

inline double distance(const Vec2& a, const Vec2& b) { return (b - a).length(); }

inline Vec2 lerp(const Vec2& a, const Vec2& b, double t) { return a + (b - a) * t; }

// Cubic ease-in/out on [0,1]; inputs outside the range are clamped.
inline double smoothstep(double t) {
  if (t <= 0.0) return 0.0;
  if (t >= 1.0) return 1.0;
  return t * t * (3.0 - 2.0 * t);
}

} // namespace starclaim
