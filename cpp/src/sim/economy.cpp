#include "economy.h"
#include <algorithm>

namespace breach {

const char *side_name(Side s) {
  switch (s) {
  case SIDE_ATTACKER:
    return "ATTACKER";
  case SIDE_DEFENDER:
    return "DEFENDER";
  default:
    return "NONE";
  }
}

EconomyUpdate calculate_round_economy(int team, Side side, bool won,
                                      const TeamEconomy &prior,
                                      const std::vector<KillRecord> &kills,
                                      bool bomb_planted, bool bomb_defused) {
  EconomyUpdate u;

  if (won) {
    u.round_reward = WIN_REWARD;
    u.new_loss_streak = 0;
  } else {
    u.new_loss_streak = prior.loss_streak + 1;
    int idx = std::min(u.new_loss_streak - 1, LOSS_REWARD_STEPS - 1);
    u.round_reward = LOSS_REWARDS[idx];
  }

  for (const KillRecord &k : kills) {
    if (k.killer_team != team || k.victim_team == team)
      continue;
    u.kill_reward += kill_reward_for(k.weapon);
    u.kills_this_round++;
  }

  // Paid win or lose
  if (side == SIDE_ATTACKER && bomb_planted)
    u.objective_bonus = PLANT_BONUS;
  else if (side == SIDE_DEFENDER && bomb_defused)
    u.objective_bonus = DEFUSE_BONUS;

  u.total_earned = u.round_reward + u.kill_reward + u.objective_bonus;
  u.new_money = std::min(MAX_MONEY, prior.money + u.total_earned);
  return u;
}

void apply_update(TeamEconomy &economy, const EconomyUpdate &update) {
  economy.money = update.new_money;
  economy.loss_streak = update.new_loss_streak;
  economy.total_kills += update.kills_this_round;
  economy.applied_updates++;
}

void reset_for_half(TeamEconomy &economy, int starting_money) {
  economy.money = std::min(MAX_MONEY, starting_money);
  economy.loss_streak = 0;
}

void apply_overtime_money(TeamEconomy &a, TeamEconomy &b, int amount) {
  a.money = std::min(MAX_MONEY, amount);
  b.money = std::min(MAX_MONEY, amount);
  a.loss_streak = 0;
  b.loss_streak = 0;
}

bool try_spend(TeamEconomy &economy, int cost) {
  if (cost < 0 || economy.money < cost)
    return false;
  economy.money -= cost;
  return true;
}

} // namespace breach
