#include "geometry.h"
#include <algorithm>

namespace breach {

float wrap_angle(float radians) {
  float a = std::fmod(radians, TWO_PI);
  if (a > PI)
    a -= TWO_PI;
  else if (a < -PI)
    a += TWO_PI;
  return a;
}

float point_segment_distance(const Vec2 &p, const Vec2 &a, const Vec2 &b) {
  float dx = b.x - a.x;
  float dz = b.z - a.z;
  float len_sq = dx * dx + dz * dz;
  if (len_sq < 1e-12f)
    return distance(p, a);

  float t = ((p.x - a.x) * dx + (p.z - a.z) * dz) / len_sq;
  t = std::max(0.0f, std::min(1.0f, t));
  Vec2 closest = {a.x + t * dx, a.z + t * dz};
  return distance(p, closest);
}

bool segment_intersects_rect(const Vec2 &a, const Vec2 &b, const Rect &rect) {
  const float left = rect.x;
  const float right = rect.x + rect.width;
  const float top = rect.z;
  const float bottom = rect.z + rect.height;

  const float dx = b.x - a.x;
  const float dz = b.z - a.z;

  // (p, q) per clip edge: left, right, top, bottom
  const float p[4] = {-dx, dx, -dz, dz};
  const float q[4] = {a.x - left, right - a.x, a.z - top, bottom - a.z};

  float t0 = 0.0f;
  float t1 = 1.0f;
  for (int i = 0; i < 4; i++) {
    if (std::fabs(p[i]) < 1e-10f) {
      // Parallel to this edge and outside of it
      if (q[i] < 0.0f)
        return false;
      continue;
    }
    float r = q[i] / p[i];
    if (p[i] < 0.0f)
      t0 = std::max(t0, r);
    else
      t1 = std::min(t1, r);
    if (t0 > t1)
      return false;
  }
  return true;
}

bool rect_contains(const Rect &rect, const Vec2 &p) {
  return p.x >= rect.x && p.x <= rect.x + rect.width && p.z >= rect.z &&
         p.z <= rect.z + rect.height;
}

bool rects_overlap(const Rect &a, const Rect &b) {
  return a.x < b.x + b.width && a.x + a.width > b.x && a.z < b.z + b.height &&
         a.z + a.height > b.z;
}

} // namespace breach
