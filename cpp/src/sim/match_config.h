#ifndef BREACH_MATCH_CONFIG_H
#define BREACH_MATCH_CONFIG_H

#include <cstdint>

namespace breach {

constexpr int TEAM_COUNT = 2;
constexpr int SQUAD_SIZE = 5;

// Ten 1-100 attributes, fixed for the whole match.
struct Attributes {
  uint8_t acc; // Accuracy
  uint8_t rea; // Reaction
  uint8_t spd; // Speed
  uint8_t stl; // Stealth
  uint8_t awr; // Awareness
  uint8_t rcl; // Recoil control
  uint8_t cmp; // Composure
  uint8_t clt; // Clutch
  uint8_t utl; // Utility
  uint8_t twk; // Teamwork
}; // 10 bytes

enum Phase : uint8_t {
  PHASE_BUY = 0,
  PHASE_STRATEGY,
  PHASE_LIVE,
  PHASE_POST_PLANT,
  PHASE_ROUND_END,
  PHASE_MATCH_END
};

const char *phase_name(Phase phase);

struct MatchConfig {
  uint32_t seed = 1;
  float tick_seconds = 0.2f;
  int starting_money = 800;

  float buy_seconds = 20.0f;
  float strategy_seconds = 15.0f;
  float live_seconds = 105.0f;
  float post_plant_seconds = 40.0f; // Also the bomb fuse
  float round_end_seconds = 5.0f;

  int rounds_to_win = 5;
  int rounds_per_half = 4;
  int max_rounds = 9;
  int overtime_money = 10000;

  Attributes profiles[TEAM_COUNT][SQUAD_SIZE];

  MatchConfig();

  float phase_duration(Phase phase) const;
};

// Stock five-man squad: rifler, support, entry, lurker, anchor.
const Attributes &default_profile(int index);

} // namespace breach

#endif // BREACH_MATCH_CONFIG_H
