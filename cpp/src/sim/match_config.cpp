#include "match_config.h"

namespace breach {

//                         ACC REA SPD STL AWR RCL CMP CLT UTL TWK
static const Attributes DEFAULT_PROFILES[SQUAD_SIZE] = {
    {65, 70, 60, 30, 50, 55, 55, 40, 35, 45},
    {45, 45, 50, 45, 55, 45, 50, 35, 70, 65},
    {75, 60, 35, 40, 55, 50, 60, 45, 30, 40},
    {50, 55, 55, 75, 65, 40, 50, 70, 35, 25},
    {55, 45, 40, 50, 65, 70, 70, 40, 40, 55},
};

const Attributes &default_profile(int index) {
  if (index < 0 || index >= SQUAD_SIZE)
    index = 0;
  return DEFAULT_PROFILES[index];
}

const char *phase_name(Phase phase) {
  switch (phase) {
  case PHASE_BUY:
    return "BUY_PHASE";
  case PHASE_STRATEGY:
    return "STRATEGY_PHASE";
  case PHASE_LIVE:
    return "LIVE_PHASE";
  case PHASE_POST_PLANT:
    return "POST_PLANT";
  case PHASE_ROUND_END:
    return "ROUND_END";
  case PHASE_MATCH_END:
    return "MATCH_END";
  }
  return "UNKNOWN";
}

MatchConfig::MatchConfig() {
  for (int t = 0; t < TEAM_COUNT; t++)
    for (int i = 0; i < SQUAD_SIZE; i++)
      profiles[t][i] = DEFAULT_PROFILES[i];
}

float MatchConfig::phase_duration(Phase phase) const {
  switch (phase) {
  case PHASE_BUY:
    return buy_seconds;
  case PHASE_STRATEGY:
    return strategy_seconds;
  case PHASE_LIVE:
    return live_seconds;
  case PHASE_POST_PLANT:
    return post_plant_seconds;
  case PHASE_ROUND_END:
    return round_end_seconds;
  case PHASE_MATCH_END:
    break;
  }
  return 0.0f;
}

} // namespace breach
