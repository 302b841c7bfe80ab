#ifndef BREACH_ECONOMY_H
#define BREACH_ECONOMY_H

#include "equipment.h"
#include <cstdint>
#include <vector>

namespace breach {

enum Side : uint8_t { SIDE_ATTACKER = 0, SIDE_DEFENDER = 1, SIDE_NONE = 0xFF };

inline Side opposite(Side s) {
  return s == SIDE_ATTACKER ? SIDE_DEFENDER : SIDE_ATTACKER;
}
const char *side_name(Side s);

// ─── Economy constants ────────────────────────────────────
constexpr int STARTING_MONEY = 800;
constexpr int MAX_MONEY = 16000;
constexpr int WIN_REWARD = 3250;
constexpr int LOSS_REWARDS[] = {1400, 1900, 2400, 2900};
constexpr int LOSS_REWARD_STEPS = 4;
constexpr int PLANT_BONUS = 300;
constexpr int DEFUSE_BONUS = 300;
constexpr int OVERTIME_MONEY = 10000;

struct TeamEconomy {
  int money = STARTING_MONEY;
  int loss_streak = 0;
  int total_kills = 0;
  int applied_updates = 0; // apply_update calls since match start
};

struct KillRecord {
  uint8_t killer_team;
  uint8_t killer_index;
  uint8_t victim_team;
  uint8_t victim_index;
  WeaponId weapon;
  bool headshot;
  uint32_t tick;
};

// Round settlement for one team. Computed, then applied exactly once.
struct EconomyUpdate {
  int round_reward = 0;
  int kill_reward = 0;
  int objective_bonus = 0;
  int total_earned = 0;
  int new_money = 0;
  int new_loss_streak = 0;
  int kills_this_round = 0;
};

// `kills` is the whole round's log; only kills by `team` count.
EconomyUpdate calculate_round_economy(int team, Side side, bool won,
                                      const TeamEconomy &prior,
                                      const std::vector<KillRecord> &kills,
                                      bool bomb_planted, bool bomb_defused);

// One-shot mutation. Callers must not apply the same update twice.
void apply_update(TeamEconomy &economy, const EconomyUpdate &update);

// Side swap: both teams start over.
void reset_for_half(TeamEconomy &economy, int starting_money = STARTING_MONEY);

void apply_overtime_money(TeamEconomy &a, TeamEconomy &b,
                          int amount = OVERTIME_MONEY);

// Deducts `cost` if affordable. Money never goes negative.
bool try_spend(TeamEconomy &economy, int cost);

} // namespace breach

#endif // BREACH_ECONOMY_H
