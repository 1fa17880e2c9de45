#pragma once

namespace plangrid::core {

struct Vec2d {
  double x = 0.0;
  double y = 0.0;
};

inline Vec2d operator+(const Vec2d& a, const Vec2d& b) {
  return {a.x + b.x, a.y + b.y};
}

inline Vec2d operator-(const Vec2d& a, const Vec2d& b) {
  return {a.x - b.x, a.y - b.y};
}

// Axis-aligned rectangle in grid units. y grows downward.
struct Rectd {
  double x = 0.0;
  double y = 0.0;
  double width = 0.0;
  double height = 0.0;

  [[nodiscard]] double right() const { return x + width; }
  [[nodiscard]] double bottom() const { return y + height; }
  [[nodiscard]] double area() const { return width * height; }
  [[nodiscard]] Vec2d center() const { return {x + width * 0.5, y + height * 0.5}; }
};

inline bool horizontally_overlaps(const Rectd& a, const Rectd& b) {
  return a.x < b.right() && b.x < a.right();
}

// Strict horizontal overlap; vertical overlap is widened by buffer.
inline bool collides(const Rectd& a, const Rectd& b, double buffer) {
  return horizontally_overlaps(a, b) && a.y < b.bottom() + buffer && b.y < a.bottom() + buffer;
}

}  // namespace plangrid::core
