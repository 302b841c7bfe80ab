#include "match_lifecycle.h"
#include "breach_systems.h"
#include <utility>

namespace breach {

// Float clocks built from 0.2s steps land a hair off zero.
constexpr float CLOCK_EPSILON = 1e-4f;

MatchLifecycle::MatchLifecycle(std::shared_ptr<const MapData> map,
                               std::shared_ptr<const Pathfinder> nav,
                               const MatchConfig &config)
    : config_(config), sim_(std::move(map), std::move(nav), config) {
  start_match();
}

void MatchLifecycle::start_match() {
  if (sim_.round_state().team_side[0] != SIDE_ATTACKER)
    sim_.swap_sides();

  for (TeamEconomy &econ : economy_) {
    econ = TeamEconomy();
    econ.money = config_.starting_money;
  }
  score_[0] = 0;
  score_[1] = 0;
  round_ = 1;
  overtime_ = false;
  winner_team_ = -1;
  results_.clear();

  sim_.start_round(true);
  enter_phase(PHASE_BUY);
}

void MatchLifecycle::enter_phase(Phase phase) {
  sim_.set_phase(phase);
  time_remaining_ = config_.phase_duration(phase);
  tick_accumulator_ = 0.0f;
  ready_[0] = false;
  ready_[1] = false;

  if (phase == PHASE_LIVE)
    sim_.apply_plans();
}

// ═════════════════════════════════════════════════════════════
// CLOCK
// ═════════════════════════════════════════════════════════════

void MatchLifecycle::advance(float dt) {
  if (dt <= 0.0f)
    return;

  Phase current = phase();
  if (current == PHASE_MATCH_END)
    return;

  if (current != PHASE_LIVE && current != PHASE_POST_PLANT) {
    step_phase_clock(dt);
    return;
  }

  tick_accumulator_ += dt;
  while (tick_accumulator_ + CLOCK_EPSILON >= config_.tick_seconds) {
    tick_accumulator_ -= config_.tick_seconds;
    if (tick_accumulator_ < 0.0f)
      tick_accumulator_ = 0.0f;

    sim_.tick();
    const RoundState &rs = sim_.round_state();

    if (rs.phase == PHASE_POST_PLANT)
      time_remaining_ = rs.bomb_timer; // Fuse is the clock
    else
      time_remaining_ = config_.live_seconds -
                        (float)rs.tick * config_.tick_seconds;

    if (rs.winner != SIDE_NONE) {
      end_round(rs.winner);
      return;
    }
    if (rs.phase == PHASE_LIVE && time_remaining_ <= CLOCK_EPSILON) {
      end_round(SIDE_DEFENDER); // Clock ran out without a plant
      return;
    }
  }
}

void MatchLifecycle::step_phase_clock(float dt) {
  time_remaining_ -= dt;
  if (time_remaining_ > CLOCK_EPSILON)
    return;
  finish_timed_phase();
}

void MatchLifecycle::finish_timed_phase() {
  switch (phase()) {
  case PHASE_BUY:
    enter_phase(PHASE_STRATEGY);
    break;
  case PHASE_STRATEGY:
    enter_phase(PHASE_LIVE);
    break;
  case PHASE_ROUND_END:
    start_next_round();
    break;
  default:
    break;
  }
}

// ═════════════════════════════════════════════════════════════
// ROUND SETTLEMENT
// ═════════════════════════════════════════════════════════════

void MatchLifecycle::end_round(Side winner) {
  Phase current = phase();
  if (current != PHASE_LIVE && current != PHASE_POST_PLANT)
    return;
  if (winner != SIDE_ATTACKER && winner != SIDE_DEFENDER)
    return;

  const RoundState &rs = sim_.round_state();
  int winning_team = rs.team_of(winner);
  score_[winning_team]++;

  RoundResult result;
  result.round = round_;
  result.winner_side = winner;
  result.winner_team = winning_team;
  result.bomb_planted = rs.bomb_planted;
  result.bomb_defused = rs.bomb_defused;
  result.bomb_detonated = rs.bomb_exploded;
  result.kills = sim_.kill_log();

  // Exactly one settlement per team per round
  for (int t = 0; t < TEAM_COUNT; t++) {
    result.economy[t] = calculate_round_economy(
        t, rs.team_side[t], t == winning_team, economy_[t], result.kills,
        rs.bomb_planted, rs.bomb_defused);
    apply_update(economy_[t], result.economy[t]);
  }
  results_.push_back(std::move(result));

  bool decided = score_[winning_team] >= config_.rounds_to_win ||
                 round_ >= config_.max_rounds;
  if (!decided) {
    enter_phase(PHASE_ROUND_END);
    return;
  }

  if (score_[0] != score_[1])
    winner_team_ = score_[0] > score_[1] ? 0 : 1;
  enter_phase(PHASE_MATCH_END);
}

void MatchLifecycle::start_next_round() {
  if (phase() == PHASE_MATCH_END)
    return;

  round_++;

  bool half_time = round_ == config_.rounds_per_half + 1;
  if (half_time) {
    sim_.swap_sides();
    for (TeamEconomy &econ : economy_)
      reset_for_half(econ, config_.starting_money);
  }

  if (round_ == config_.max_rounds &&
      score_[0] == config_.rounds_to_win - 1 &&
      score_[1] == config_.rounds_to_win - 1) {
    apply_overtime_money(economy_[0], economy_[1], config_.overtime_money);
    overtime_ = true;
  }

  sim_.start_round(half_time);
  enter_phase(PHASE_BUY);
}

bool MatchLifecycle::issue_command(int team, int unit, CommandType type,
                                   const CommandOptions &options) {
  Phase current = phase();
  if (current != PHASE_LIVE && current != PHASE_POST_PLANT)
    return false;
  return sim_.issue_command(team, unit, type, options);
}

bool MatchLifecycle::submit_plan(int team, int unit,
                                 const std::vector<Vec2> &points) {
  if (phase() != PHASE_STRATEGY)
    return false;
  return sim_.set_plan(team, unit, points);
}

bool MatchLifecycle::set_ready(int team) {
  if (team < 0 || team >= TEAM_COUNT)
    return false;
  Phase current = phase();
  if (current != PHASE_BUY && current != PHASE_STRATEGY)
    return false;

  ready_[team] = true;
  if (ready_[0] && ready_[1])
    finish_timed_phase();
  return true;
}

// ═════════════════════════════════════════════════════════════
// BUY SERVICE
// ═════════════════════════════════════════════════════════════

flecs::entity MatchLifecycle::buyer(int team, int unit) const {
  if (phase() != PHASE_BUY)
    return flecs::entity();
  flecs::entity u = sim_.unit(team, unit);
  if (!is_alive(u))
    return flecs::entity();
  return u;
}

bool MatchLifecycle::buy_weapon(int team, int unit, WeaponId weapon) {
  flecs::entity u = buyer(team, unit);
  if (!u.is_valid() || weapon >= WEAPON_COUNT)
    return false;
  if (u.get<Loadout>().weapon == weapon)
    return false;

  int cost = weapon == WEAPON_PISTOL ? 0 : weapon_stats(weapon).cost;
  if (!try_spend(economy_[team], cost))
    return false;
  u.ensure<Loadout>().weapon = weapon;
  return true;
}

bool MatchLifecycle::buy_armor(int team, int unit, ArmorTier tier) {
  flecs::entity u = buyer(team, unit);
  if (!u.is_valid() || tier == ARMOR_NONE || tier > ARMOR_HEAVY)
    return false;
  if (u.get<Loadout>().armor == tier)
    return false;

  if (!try_spend(economy_[team], armor_stats(tier).cost))
    return false;
  u.ensure<Loadout>().armor = tier;
  return true;
}

bool MatchLifecycle::buy_helmet(int team, int unit) {
  flecs::entity u = buyer(team, unit);
  if (!u.is_valid() || u.get<Loadout>().helmet)
    return false;

  if (!try_spend(economy_[team], HELMET_COST))
    return false;
  u.ensure<Loadout>().helmet = true;
  return true;
}

bool MatchLifecycle::buy_defuse_kit(int team, int unit) {
  flecs::entity u = buyer(team, unit);
  if (!u.is_valid() || u.get<Squad>().side != SIDE_DEFENDER)
    return false;
  if (u.get<Loadout>().defuse_kit)
    return false;

  if (!try_spend(economy_[team], DEFUSE_KIT_COST))
    return false;
  u.ensure<Loadout>().defuse_kit = true;
  return true;
}

bool MatchLifecycle::buy_utility(int team, int unit, UtilityType type) {
  flecs::entity u = buyer(team, unit);
  if (!u.is_valid() || type >= UTILITY_COUNT)
    return false;
  if (u.get<Loadout>().utility_count >= MAX_UTILITY)
    return false;

  if (!try_spend(economy_[team], utility_stats(type).cost))
    return false;
  Loadout &lo = u.ensure<Loadout>();
  lo.utility[lo.utility_count++] = type;
  return true;
}

} // namespace breach
