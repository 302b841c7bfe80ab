#include "bomb_logic.h"

namespace breach {

char plant_zone_at(const MapData &map, const Vec2 &pos) {
  for (const BombSite &site : map.bomb_sites) {
    if (rect_contains(site.plant_zone, pos))
      return site.id;
  }
  return NO_SITE;
}

bool is_on_bomb_site(const MapData &map, const Vec2 &pos) {
  for (const BombSite &site : map.bomb_sites) {
    if (rect_contains(site.zone, pos))
      return true;
  }
  return false;
}

bool is_in_defuse_range(const Vec2 &pos, const Vec2 &bomb_pos) {
  return distance(pos, bomb_pos) <= DEFUSE_RANGE;
}

} // namespace breach
