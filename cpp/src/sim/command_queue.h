#ifndef BREACH_COMMAND_QUEUE_H
#define BREACH_COMMAND_QUEUE_H

#include "equipment.h"
#include "geometry.h"
#include "match_config.h"
#include "seeded_rng.h"
#include <cstdint>
#include <vector>

namespace breach {

enum CommandType : uint8_t {
  CMD_MOVE = 0,
  CMD_RUSH,
  CMD_HOLD,
  CMD_RETREAT,
  CMD_PLANT,
  CMD_DEFUSE,
  CMD_USE_UTILITY,
  CMD_REGROUP
};

// Movement-class orders supersede each other; at most one in flight.
bool is_movement_command(CommandType type);
const char *command_name(CommandType type);
bool command_from_name(const char *name, CommandType &out);

struct Command {
  CommandType type;
  uint8_t team;
  uint8_t unit;
  bool has_target = false;
  Vec2 target = {0.0f, 0.0f};
  UtilityType utility = UTILITY_NONE;
  float issued_at = 0.0f;
  float execute_at = 0.0f;
  bool executed = false;
};

struct CommandOptions {
  bool has_target = false;
  Vec2 target = {0.0f, 0.0f};
  UtilityType utility = UTILITY_NONE;
};

// ═════════════════════════════════════════════════════════════
// RADIO DELAY QUEUE
//
// Orders are not instant: each accepted command waits
// uniform(0.3, 0.8)s (+0.2s under fire) before it executes.
// A 0.5s per-unit cooldown rejects spam.
// ═════════════════════════════════════════════════════════════
class CommandQueue {
public:
  static constexpr float COOLDOWN = 0.5f;
  static constexpr float MIN_DELAY = 0.3f;
  static constexpr float MAX_DELAY = 0.8f;
  static constexpr float COMBAT_DELAY = 0.2f;
  static constexpr int MAX_PENDING_ACTIONS = 4; // Non-movement, per unit

  CommandQueue() { reset_cooldowns(); }

  // Draws one jitter value from `rng` only when accepted.
  bool issue(CommandType type, int team, int unit, float time, bool in_combat,
             const CommandOptions &options, SeededRng &rng);

  // Removes and returns everything due at `time`, in issue order.
  std::vector<Command> drain_ready(float time);

  bool is_on_cooldown(int team, int unit, float time) const;
  float cooldown_remaining(int team, int unit, float time) const;
  int pending_count(int team, int unit) const;
  int pending_actions(int team, int unit) const;
  int pending_total() const { return (int)pending_.size(); }

  void clear_unit(int team, int unit);
  void clear_all();

private:
  static constexpr float NEVER = -1.0e9f;

  void reset_cooldowns();

  std::vector<Command> pending_;
  float last_command_time_[TEAM_COUNT][SQUAD_SIZE];
};

} // namespace breach

#endif // BREACH_COMMAND_QUEUE_H
