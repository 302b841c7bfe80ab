#ifndef BREACH_BOMB_LOGIC_H
#define BREACH_BOMB_LOGIC_H

#include "geometry.h"
#include "map_data.h"

namespace breach {

constexpr float PLANT_SECONDS = 3.0f;
constexpr float DEFUSE_SECONDS = 5.0f;
constexpr float DEFUSE_KIT_SECONDS = 3.0f;
constexpr float DEFUSE_RANGE = 50.0f;
constexpr char NO_SITE = '\0';

// Site id of the plant zone containing pos, or NO_SITE.
char plant_zone_at(const MapData &map, const Vec2 &pos);

// Anywhere on a site's general area (wider than the plant zone).
bool is_on_bomb_site(const MapData &map, const Vec2 &pos);

bool is_in_defuse_range(const Vec2 &pos, const Vec2 &bomb_pos);

inline float defuse_duration(bool has_kit) {
  return has_kit ? DEFUSE_KIT_SECONDS : DEFUSE_SECONDS;
}

// Progress only survives while the gating condition holds; any break
// drops it back to zero.
inline float advance_action(float progress, float dt, bool condition_held) {
  if (!condition_held)
    return 0.0f;
  float next = progress + dt;
  return next < 0.0f ? 0.0f : next;
}

} // namespace breach

#endif // BREACH_BOMB_LOGIC_H
