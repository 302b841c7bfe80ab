#include "command_queue.h"
#include <algorithm>
#include <cstring>

namespace breach {

static const char *COMMAND_NAMES[] = {"MOVE",   "RUSH",   "HOLD",
                                      "RETREAT", "PLANT",  "DEFUSE",
                                      "USE_UTILITY", "REGROUP"};

bool is_movement_command(CommandType type) {
  return type == CMD_MOVE || type == CMD_RUSH || type == CMD_HOLD ||
         type == CMD_RETREAT || type == CMD_REGROUP;
}

const char *command_name(CommandType type) {
  if (type > CMD_REGROUP)
    return "UNKNOWN";
  return COMMAND_NAMES[type];
}

bool command_from_name(const char *name, CommandType &out) {
  for (int i = 0; i <= CMD_REGROUP; i++) {
    if (std::strcmp(name, COMMAND_NAMES[i]) == 0) {
      out = (CommandType)i;
      return true;
    }
  }
  return false;
}

static bool valid_slot(int team, int unit) {
  return team >= 0 && team < TEAM_COUNT && unit >= 0 && unit < SQUAD_SIZE;
}

bool CommandQueue::issue(CommandType type, int team, int unit, float time,
                         bool in_combat, const CommandOptions &options,
                         SeededRng &rng) {
  if (!valid_slot(team, unit))
    return false;
  if (is_on_cooldown(team, unit, time))
    return false;

  bool movement = is_movement_command(type);
  if (!movement && pending_actions(team, unit) >= MAX_PENDING_ACTIONS)
    return false;

  float delay = (float)rng.range(MIN_DELAY, MAX_DELAY);
  if (in_combat)
    delay += COMBAT_DELAY;

  if (movement) {
    pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                  [&](const Command &c) {
                                    return c.team == team && c.unit == unit &&
                                           is_movement_command(c.type);
                                  }),
                   pending_.end());
  }

  Command cmd;
  cmd.type = type;
  cmd.team = (uint8_t)team;
  cmd.unit = (uint8_t)unit;
  cmd.has_target = options.has_target;
  cmd.target = options.target;
  cmd.utility = options.utility;
  cmd.issued_at = time;
  cmd.execute_at = time + delay;
  pending_.push_back(cmd);

  last_command_time_[team][unit] = time;
  return true;
}

std::vector<Command> CommandQueue::drain_ready(float time) {
  std::vector<Command> ready;
  for (Command &c : pending_) {
    if (time >= c.execute_at) {
      c.executed = true;
      ready.push_back(c);
    }
  }
  pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                [](const Command &c) { return c.executed; }),
                 pending_.end());
  return ready;
}

bool CommandQueue::is_on_cooldown(int team, int unit, float time) const {
  return cooldown_remaining(team, unit, time) > 0.0f;
}

float CommandQueue::cooldown_remaining(int team, int unit, float time) const {
  if (!valid_slot(team, unit))
    return 0.0f;
  float elapsed = time - last_command_time_[team][unit];
  return std::max(0.0f, COOLDOWN - elapsed);
}

int CommandQueue::pending_actions(int team, int unit) const {
  return (int)std::count_if(pending_.begin(), pending_.end(),
                            [&](const Command &c) {
                              return c.team == team && c.unit == unit &&
                                     !is_movement_command(c.type);
                            });
}

int CommandQueue::pending_count(int team, int unit) const {
  return (int)std::count_if(
      pending_.begin(), pending_.end(),
      [&](const Command &c) { return c.team == team && c.unit == unit; });
}

void CommandQueue::reset_cooldowns() {
  for (auto &team : last_command_time_)
    for (float &t : team)
      t = NEVER;
}

void CommandQueue::clear_unit(int team, int unit) {
  pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                [&](const Command &c) {
                                  return c.team == team && c.unit == unit;
                                }),
                 pending_.end());
}

void CommandQueue::clear_all() {
  pending_.clear();
  reset_cooldowns();
}

} // namespace breach
