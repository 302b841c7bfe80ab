#ifndef BREACH_GEOMETRY_H
#define BREACH_GEOMETRY_H

#include <cmath>

namespace breach {

constexpr float PI = 3.14159265358979323846f;
constexpr float TWO_PI = 2.0f * PI;

// ─── Primitives ───────────────────────────────────────────
// Top-down map space: X grows right, Z grows down.
struct Vec2 {
  float x, z;
}; // 8 bytes

// Axis-aligned rectangle, (x, z) is the top-left corner.
struct Rect {
  float x, z;
  float width, height;
}; // 16 bytes

inline bool operator==(const Vec2 &a, const Vec2 &b) {
  return a.x == b.x && a.z == b.z;
}
inline bool operator!=(const Vec2 &a, const Vec2 &b) { return !(a == b); }

inline float distance(const Vec2 &a, const Vec2 &b) {
  float dx = b.x - a.x;
  float dz = b.z - a.z;
  return std::sqrt(dx * dx + dz * dz);
}

// Bearing from a to b, atan2(dz, dx).
inline float angle_to(const Vec2 &a, const Vec2 &b) {
  return std::atan2(b.z - a.z, b.x - a.x);
}

inline Vec2 rect_center(const Rect &r) {
  return {r.x + r.width * 0.5f, r.z + r.height * 0.5f};
}

// Wraps any angle into [-PI, PI].
float wrap_angle(float radians);

// Shortest distance from p to the segment a-b.
float point_segment_distance(const Vec2 &p, const Vec2 &a, const Vec2 &b);

// Liang-Barsky clip of segment a-b against rect. True if any part of
// the segment lies inside or on the rectangle.
bool segment_intersects_rect(const Vec2 &a, const Vec2 &b, const Rect &rect);

// Inclusive on all four edges.
bool rect_contains(const Rect &rect, const Vec2 &p);

// Strict overlap: touching edges do not count.
bool rects_overlap(const Rect &a, const Rect &b);

} // namespace breach

#endif // BREACH_GEOMETRY_H
