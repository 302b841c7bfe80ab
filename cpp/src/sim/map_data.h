#ifndef BREACH_MAP_DATA_H
#define BREACH_MAP_DATA_H

#include "geometry.h"
#include <string>
#include <vector>

namespace breach {

struct BombSite {
  char id;         // 'A', 'B', ...
  Rect zone;       // General site area
  Rect plant_zone; // Where the bomb can actually go down
};

// Map description, immutable once loaded.
struct MapData {
  std::string name = "Untitled";
  std::string theme = "desert";
  float width = 3000.0f;
  float height = 2000.0f;
  Rect attacker_spawn = {100.0f, 200.0f, 300.0f, 1600.0f};
  Rect defender_spawn = {2550.0f, 200.0f, 300.0f, 1600.0f};
  std::vector<BombSite> bomb_sites;
  std::vector<Rect> walls;
};

} // namespace breach

#endif // BREACH_MAP_DATA_H
