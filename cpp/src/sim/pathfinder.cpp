#include "pathfinder.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace breach {

namespace {

struct Neighbor {
  int dc, dr;
  float cost;
};

constexpr float DIAGONAL_COST = 1.41421356f;

// Fixed expansion order keeps tie-breaking reproducible.
constexpr Neighbor NEIGHBORS[8] = {
    {-1, -1, DIAGONAL_COST}, {0, -1, 1.0f}, {1, -1, DIAGONAL_COST},
    {-1, 0, 1.0f},           {1, 0, 1.0f},  {-1, 1, DIAGONAL_COST},
    {0, 1, 1.0f},            {1, 1, DIAGONAL_COST},
};

struct OpenNode {
  int col, row;
  float f;
};

// Zero-area walls still seal the cells on both sides of their line.
bool cell_blocked_by(const Rect &cell, const Rect &wall) {
  if (wall.width > 0.0f && wall.height > 0.0f)
    return rects_overlap(cell, wall);
  return cell.x <= wall.x + wall.width && cell.x + cell.width >= wall.x &&
         cell.z <= wall.z + wall.height && cell.z + cell.height >= wall.z;
}

} // namespace

Pathfinder::Pathfinder(float map_width, float map_height,
                       std::vector<Rect> walls)
    : cols_((int)std::ceil(map_width / CELL_SIZE)),
      rows_((int)std::ceil(map_height / CELL_SIZE)), walls_(std::move(walls)) {
  if (cols_ < 1)
    cols_ = 1;
  if (rows_ < 1)
    rows_ = 1;

  walkable_.assign((size_t)cols_ * rows_, 1);
  for (int r = 0; r < rows_; r++) {
    for (int c = 0; c < cols_; c++) {
      Rect cell = {c * CELL_SIZE, r * CELL_SIZE, CELL_SIZE, CELL_SIZE};
      for (const Rect &wall : walls_) {
        if (cell_blocked_by(cell, wall)) {
          walkable_[(size_t)r * cols_ + c] = 0;
          break;
        }
      }
    }
  }
}

Pathfinder::Cell Pathfinder::world_to_grid(const Vec2 &p) const {
  return {(int)std::floor(p.x / CELL_SIZE), (int)std::floor(p.z / CELL_SIZE)};
}

Vec2 Pathfinder::grid_to_world(int col, int row) const {
  return {col * CELL_SIZE + CELL_SIZE * 0.5f,
          row * CELL_SIZE + CELL_SIZE * 0.5f};
}

bool Pathfinder::in_bounds(int col, int row) const {
  return col >= 0 && col < cols_ && row >= 0 && row < rows_;
}

bool Pathfinder::is_cell_walkable(int col, int row) const {
  return in_bounds(col, row) && walkable_[(size_t)row * cols_ + col] != 0;
}

bool Pathfinder::is_walkable(const Vec2 &p) const {
  Cell c = world_to_grid(p);
  return is_cell_walkable(c.col, c.row);
}

bool Pathfinder::has_line_of_sight(const Vec2 &a, const Vec2 &b) const {
  for (const Rect &wall : walls_) {
    if (segment_intersects_rect(a, b, wall))
      return false;
  }
  return true;
}

std::vector<Vec2> Pathfinder::find_path(const Vec2 &from,
                                        const Vec2 &to) const {
  Cell start = world_to_grid(from);
  Cell goal = world_to_grid(to);
  if (!is_cell_walkable(start.col, start.row) ||
      !is_cell_walkable(goal.col, goal.row))
    return {};

  const size_t n = (size_t)cols_ * rows_;
  std::vector<float> g_score(n, std::numeric_limits<float>::infinity());
  std::vector<int> came_from(n, -1);
  std::vector<uint8_t> closed(n, 0);

  auto index = [this](int col, int row) { return (size_t)row * cols_ + col; };
  auto heuristic = [&goal](int col, int row) {
    return (float)(std::abs(col - goal.col) + std::abs(row - goal.row));
  };

  // Sorted ascending by f. Equal f keeps insertion order.
  std::vector<OpenNode> open;
  open.push_back({start.col, start.row, heuristic(start.col, start.row)});
  g_score[index(start.col, start.row)] = 0.0f;

  bool found = false;
  while (!open.empty()) {
    OpenNode current = open.front();
    open.erase(open.begin());

    size_t ci = index(current.col, current.row);
    if (closed[ci])
      continue;
    if (current.col == goal.col && current.row == goal.row) {
      found = true;
      break;
    }
    closed[ci] = 1;

    for (const Neighbor &nb : NEIGHBORS) {
      int nc = current.col + nb.dc;
      int nr = current.row + nb.dr;
      if (!is_cell_walkable(nc, nr))
        continue;
      size_t ni = index(nc, nr);
      if (closed[ni])
        continue;

      // No corner cutting past a blocked cardinal cell
      if (nb.dc != 0 && nb.dr != 0) {
        if (!is_cell_walkable(current.col, current.row + nb.dr) ||
            !is_cell_walkable(current.col + nb.dc, current.row))
          continue;
      }

      float tentative = g_score[ci] + nb.cost;
      if (tentative < g_score[ni]) {
        g_score[ni] = tentative;
        came_from[ni] = (int)ci;
        OpenNode node = {nc, nr, tentative + heuristic(nc, nr)};
        auto pos = std::upper_bound(
            open.begin(), open.end(), node,
            [](const OpenNode &a, const OpenNode &b) { return a.f < b.f; });
        open.insert(pos, node);
      }
    }
  }

  if (!found)
    return {};

  // Walk back from the goal
  std::vector<Vec2> path;
  for (int at = (int)index(goal.col, goal.row); at != -1;
       at = came_from[(size_t)at]) {
    path.push_back(grid_to_world(at % cols_, at / cols_));
  }
  std::reverse(path.begin(), path.end());

  path.front() = from;
  path.back() = to;
  return smooth_path(path);
}

std::vector<Vec2> Pathfinder::smooth_path(const std::vector<Vec2> &path) const {
  if (path.size() <= 2)
    return path;

  std::vector<Vec2> smoothed;
  smoothed.push_back(path.front());

  size_t current = 0;
  while (current < path.size() - 1) {
    // Farthest later point still in sight, else the next one
    size_t next = current + 1;
    for (size_t ahead = path.size() - 1; ahead > current + 1; ahead--) {
      if (has_line_of_sight(path[current], path[ahead])) {
        next = ahead;
        break;
      }
    }
    smoothed.push_back(path[next]);
    current = next;
  }
  return smoothed;
}

} // namespace breach
