#ifndef BREACH_PATHFINDER_H
#define BREACH_PATHFINDER_H

#include "geometry.h"
#include <cstdint>
#include <vector>

namespace breach {

// ═════════════════════════════════════════════════════════════
// NAVIGATION GRID + A*
//
// Built once per map from the wall rectangles, then shared
// read-only by every match on that map. All queries are const.
// ═════════════════════════════════════════════════════════════
class Pathfinder {
public:
  static constexpr float CELL_SIZE = 50.0f;

  struct Cell {
    int col, row;
  };

  Pathfinder(float map_width, float map_height, std::vector<Rect> walls);

  // Empty when either end is off-grid or blocked, or the goal is
  // unreachable. Otherwise smoothed, with the first and last points
  // equal to `from` and `to`.
  std::vector<Vec2> find_path(const Vec2 &from, const Vec2 &to) const;

  // Greedy LOS skipping. Lengths <= 2 are returned unchanged.
  std::vector<Vec2> smooth_path(const std::vector<Vec2> &path) const;

  // Segment against every wall (no smoke).
  bool has_line_of_sight(const Vec2 &a, const Vec2 &b) const;

  Cell world_to_grid(const Vec2 &p) const;
  Vec2 grid_to_world(int col, int row) const; // Cell center
  bool in_bounds(int col, int row) const;
  bool is_cell_walkable(int col, int row) const;
  bool is_walkable(const Vec2 &p) const;

  int cols() const { return cols_; }
  int rows() const { return rows_; }
  const std::vector<Rect> &walls() const { return walls_; }

private:
  int cols_;
  int rows_;
  std::vector<Rect> walls_;
  std::vector<uint8_t> walkable_; // row-major, 1 = open
};

} // namespace breach

#endif // BREACH_PATHFINDER_H
