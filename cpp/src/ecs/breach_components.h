#ifndef BREACH_COMPONENTS_H
#define BREACH_COMPONENTS_H

#include "../sim/bomb_logic.h"
#include "../sim/economy.h"
#include "../sim/equipment.h"
#include "../sim/geometry.h"
#include "../sim/map_data.h"
#include "../sim/match_config.h"
#include "../sim/pathfinder.h"
#include "../sim/seeded_rng.h"
#include "../sim/stat_formulas.h"
#include <cstdint>
#include <flecs.h>
#include <memory>
#include <vector>

/**
 * Breach Engine: ECS Component Definitions
 *
 * Per-soldier data is POD. Match-wide state lives in singletons on
 * the match's own world, so two matches never share anything.
 */

namespace breach {

// ─── Spatial ───────────────────────────────────────────────
struct Position {
  float x, z;
}; // 8 bytes
struct Facing {
  float angle; // atan2(dz, dx)
}; // 4 bytes

inline Vec2 to_vec(const Position &p) { return {p.x, p.z}; }

// ─── Identity ─────────────────────────────────────────────
struct Squad {
  uint8_t team;  // 0/1, player slot
  uint8_t index; // 0-4 within the team
  Side side;     // Swaps at half time
}; // 3 bytes

struct Health {
  float hp; // 0-100
}; // 4 bytes

struct IsAlive {};     // Tag (0 bytes)
struct BombCarrier {}; // Tag, at most one attacker

// Attributes (sim/match_config.h) is attached as-is: 10 bytes.

// ─── Equipment ────────────────────────────────────────────
struct Loadout {
  WeaponId weapon;
  ArmorTier armor;
  bool helmet;
  bool defuse_kit;
  uint8_t utility_count;
  UtilityType utility[MAX_UTILITY];
}; // 9 bytes

Loadout default_loadout();
bool loadout_take_utility(Loadout &lo, UtilityType type);

// ─── Movement ─────────────────────────────────────────────
// Smoothed paths rarely exceed a dozen points. Overflow drops the
// points before the destination, never the destination itself.
constexpr int MAX_WAYPOINTS = 48;

struct Waypoints {
  uint8_t count;
  Vec2 points[MAX_WAYPOINTS]; // points[0] is the next stop
}; // 388 bytes

void waypoints_assign(Waypoints &wp, const std::vector<Vec2> &path,
                      size_t first);
void waypoints_pop(Waypoints &wp);

// ─── Vision & Combat ──────────────────────────────────────
struct Vision {
  uint8_t detected; // Bit i = enemy squad index i
}; // 1 byte

struct CombatState {
  bool in_combat;
  bool moving;
  int8_t target; // Enemy squad index, -1 = none
  uint16_t shots_fired;
}; // 6 bytes

struct Blinded {
  float remaining; // Seconds. Removed at zero.
}; // 4 bytes

// ─── Objective ────────────────────────────────────────────
enum ActionKind : uint8_t { ACTION_NONE = 0, ACTION_PLANT, ACTION_DEFUSE };

// kind != NONE is the "holding the key" signal
struct ObjectiveAction {
  ActionKind kind;
  float progress; // Seconds accumulated
}; // 8 bytes

// ═════════════════════════════════════════════════════════════
// SINGLETONS (one set per match world)
// ═════════════════════════════════════════════════════════════

struct Roster {
  flecs::entity_t units[TEAM_COUNT][SQUAD_SIZE];
};

struct RoundState {
  Phase phase = PHASE_BUY;
  uint32_t tick = 0;
  float time = 0.0f; // Seconds since LIVE began
  Side team_side[TEAM_COUNT] = {SIDE_ATTACKER, SIDE_DEFENDER};

  bool bomb_planted = false;
  bool bomb_defused = false;
  bool bomb_exploded = false;
  Vec2 bomb_pos = {0.0f, 0.0f};
  char bomb_site = NO_SITE;
  float bomb_timer = 0.0f;
  float bomb_fuse = 40.0f;

  Side winner = SIDE_NONE; // Set by RoundEndCheck

  int team_of(Side s) const { return team_side[0] == s ? 0 : 1; }
};

// Shared, immutable map + nav grid
struct Arena {
  std::shared_ptr<const MapData> map;
  std::shared_ptr<const Pathfinder> nav;
  float tick_seconds = 0.2f; // Fixed step length
};

struct ActiveEffect {
  uint32_t id; // util_<id>
  UtilityType type;
  Vec2 center;
  float radius;
  float remaining;
  float total;
  uint8_t owner_team;
  uint8_t owner_index;
  bool instant_applied;
};

struct UtilityField {
  std::vector<ActiveEffect> effects;
  uint32_t next_id = 1;
};

enum EventType : uint8_t {
  EVENT_SHOT_FIRED = 0,
  EVENT_HIT,
  EVENT_KILL,
  EVENT_BOMB_PLANTED,
  EVENT_BOMB_DEFUSED,
  EVENT_BOMB_EXPLODED,
  EVENT_UTILITY_THROWN,
  EVENT_UTILITY_EXPIRED
};

const char *event_name(EventType type);

// Flat render/animation payload. Unused fields stay zero.
struct SimEvent {
  EventType type;
  uint32_t tick;
  uint8_t actor_team;  // Shooter / killer / planter / thrower
  uint8_t actor_index;
  uint8_t target_team; // Victim
  uint8_t target_index;
  WeaponId weapon;
  HitLocation location;
  bool headshot;
  float damage;
  Vec2 pos;        // Shot origin, bomb or effect position
  float direction; // Shot bearing
  char site;
  UtilityType utility;
  uint32_t effect_id;
};

struct TickEvents {
  std::vector<SimEvent> events; // Cleared at the start of each tick
};

struct KillLog {
  std::vector<KillRecord> kills; // Whole round
};

} // namespace breach

#endif // BREACH_COMPONENTS_H
