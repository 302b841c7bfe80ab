#ifndef BREACH_MATCH_LIFECYCLE_H
#define BREACH_MATCH_LIFECYCLE_H

#include "match_simulation.h"
#include <memory>
#include <vector>

namespace breach {

struct RoundResult {
  int round;
  Side winner_side;
  int winner_team;
  bool bomb_planted;
  bool bomb_defused;
  bool bomb_detonated;
  std::vector<KillRecord> kills;
  EconomyUpdate economy[TEAM_COUNT];
};

// ═════════════════════════════════════════════════════════════
// MATCH LIFECYCLE
//
// Phase clock, score, per-team money and the between-round
// bookkeeping (settlement, side swap, overtime, respawn). Drives
// MatchSimulation::tick() at a fixed rate from a variable dt.
// ═════════════════════════════════════════════════════════════
class MatchLifecycle {
public:
  MatchLifecycle(std::shared_ptr<const MapData> map,
                 std::shared_ptr<const Pathfinder> nav,
                 const MatchConfig &config);

  // Round 1, BUY phase, fresh economies.
  void start_match();

  // Wall-clock step. Runs as many fixed ticks as dt covers.
  void advance(float dt);

  // Settles the round. No-op outside LIVE / POST_PLANT.
  void end_round(Side winner);

  void start_next_round();

  // ─── Orders & purchases ──────────────────────────────────
  bool issue_command(int team, int unit, CommandType type,
                     const CommandOptions &options);

  // STRATEGY only. Applied without radio delay when LIVE starts.
  bool submit_plan(int team, int unit, const std::vector<Vec2> &points);

  // BUY / STRATEGY only. The phase ends early once both teams are ready.
  bool set_ready(int team);
  bool is_ready(int team) const { return ready_[team]; }

  bool buy_weapon(int team, int unit, WeaponId weapon);
  bool buy_armor(int team, int unit, ArmorTier tier);
  bool buy_helmet(int team, int unit);
  bool buy_defuse_kit(int team, int unit);
  bool buy_utility(int team, int unit, UtilityType type);

  // ─── Queries ─────────────────────────────────────────────
  Phase phase() const { return sim_.round_state().phase; }
  float time_remaining() const { return time_remaining_; }
  int round() const { return round_; }
  int score(int team) const { return score_[team]; }
  Side side_of(int team) const { return sim_.round_state().team_side[team]; }
  bool overtime() const { return overtime_; }
  int winner_team() const { return winner_team_; }
  const TeamEconomy &economy(int team) const { return economy_[team]; }
  const std::vector<RoundResult> &results() const { return results_; }

  MatchSimulation &simulation() { return sim_; }
  const MatchSimulation &simulation() const { return sim_; }

private:
  void enter_phase(Phase phase);
  void step_phase_clock(float dt);
  void finish_timed_phase();
  flecs::entity buyer(int team, int unit) const;

  MatchConfig config_;
  MatchSimulation sim_;
  TeamEconomy economy_[TEAM_COUNT];
  int score_[TEAM_COUNT] = {0, 0};
  int round_ = 1;
  float time_remaining_ = 0.0f;
  float tick_accumulator_ = 0.0f;
  bool overtime_ = false;
  bool ready_[TEAM_COUNT] = {false, false};
  int winner_team_ = -1; // Match winner, -1 while undecided
  std::vector<RoundResult> results_;
};

} // namespace breach

#endif // BREACH_MATCH_LIFECYCLE_H
