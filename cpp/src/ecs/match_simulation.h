#ifndef BREACH_MATCH_SIMULATION_H
#define BREACH_MATCH_SIMULATION_H

#include "../sim/command_queue.h"
#include "breach_components.h"
#include <flecs.h>
#include <memory>
#include <vector>

namespace breach {

// ═════════════════════════════════════════════════════════════
// FOG-OF-WAR VIEW
// ═════════════════════════════════════════════════════════════

struct UnitSnapshot {
  uint8_t index;
  Side side;
  Vec2 pos;
  float facing;
  float health;
  bool alive;
  Attributes stats;
  float reaction_ms;
  Loadout loadout;
  std::vector<Vec2> waypoints;
  uint8_t detected; // Bitmask over enemy indices
  bool in_combat;
  bool moving;
  int8_t target;
  bool blinded;
  bool has_bomb;
  ActionKind action;
  float action_progress;
};

// What a team is allowed to know about an enemy it can see.
struct EnemySnapshot {
  uint8_t index;
  Vec2 pos;
  float facing;
  float health;
  bool alive;
  WeaponId weapon;
  bool moving;
  bool in_combat;
  bool planting;
  bool defusing;
};

struct FilteredState {
  uint32_t tick = 0;
  Phase phase = PHASE_BUY;
  int team = 0;
  Side side = SIDE_ATTACKER;
  std::vector<UnitSnapshot> own;
  std::vector<EnemySnapshot> enemies;
  bool bomb_planted = false;
  Vec2 bomb_pos = {0.0f, 0.0f};
  char bomb_site = NO_SITE;
  float bomb_timer = 0.0f;
};

// ═════════════════════════════════════════════════════════════
// MATCH SIMULATION
//
// One flecs world per match. Owns the ten unit entities, the
// command queue and the PRNG (as the MatchRng singleton). tick()
// is the only thing that advances state during a round.
// ═════════════════════════════════════════════════════════════
class MatchSimulation {
public:
  static constexpr int MAX_PLAN_POINTS = 8;

  MatchSimulation(std::shared_ptr<const MapData> map,
                  std::shared_ptr<const Pathfinder> nav,
                  const MatchConfig &config);

  MatchSimulation(const MatchSimulation &) = delete;
  MatchSimulation &operator=(const MatchSimulation &) = delete;

  // Respawn everyone and clear round state. Survivors keep their
  // loadout unless reset_all_loadouts is set.
  void start_round(bool reset_all_loadouts);

  void set_phase(Phase phase);

  // Team 0 <-> team 1 sides. Takes effect at the next start_round.
  void swap_sides();

  // One fixed step. No-op outside LIVE / POST_PLANT.
  void tick();

  // Radio-delayed order. False on cooldown, queue bound, dead unit
  // or a bad slot.
  bool issue_command(int team, int unit, CommandType type,
                     const CommandOptions &options);

  // STRATEGY plan: an ordered list of stops for one unit, replaced
  // wholesale. Empty clears it. False for a dead unit, a bad slot or
  // more than MAX_PLAN_POINTS stops.
  bool set_plan(int team, int unit, const std::vector<Vec2> &points);
  const std::vector<Vec2> &plan(int team, int unit) const;

  // Routes every living unit along its plan with no radio delay.
  // Plans are consumed.
  void apply_plans();

  FilteredState project_for_team(int team) const;

  const std::vector<SimEvent> &tick_events() const;
  const std::vector<KillRecord> &kill_log() const;
  const RoundState &round_state() const;
  const MatchConfig &config() const { return config_; }
  const CommandQueue &commands() const { return commands_; }
  const MapData &map() const { return *map_; }

  // Direct access for the lifecycle, bridges and tests.
  flecs::world &world() { return ecs_; }
  const flecs::world &world() const { return ecs_; }
  flecs::entity unit(int team, int index) const;

private:
  void spawn_units();
  void execute_command(const Command &cmd);
  void assign_path(flecs::entity u, const Vec2 &target);
  Rect spawn_zone(Side side) const;

  MatchConfig config_;
  std::shared_ptr<const MapData> map_;
  std::shared_ptr<const Pathfinder> nav_;
  flecs::world ecs_;
  CommandQueue commands_;
  std::vector<Vec2> plans_[TEAM_COUNT][SQUAD_SIZE];
};

} // namespace breach

#endif // BREACH_MATCH_SIMULATION_H
