#include "stat_formulas.h"
#include <algorithm>

namespace breach {

float movement_speed(float spd, float weapon_speed_mod,
                     float armor_speed_mod) {
  constexpr float BASE_SPEED = 200.0f;
  return BASE_SPEED * (0.5f + spd / 100.0f) * weapon_speed_mod *
         armor_speed_mod;
}

float detection_radius(float awr) {
  constexpr float BASE_RADIUS = 400.0f;
  return BASE_RADIUS * (0.4f + awr / 83.3f);
}

float stealth_modifier(float stl) { return 1.0f - stl / 200.0f; }

float base_hit_chance(float acc) { return 0.15f + acc * 0.007f; }

float distance_modifier(float dist) {
  return std::max(0.3f, 1.0f - dist / 1500.0f);
}

float final_hit_chance(float acc, float dist, bool is_moving,
                       float weapon_accuracy_mod) {
  float chance = base_hit_chance(acc) * distance_modifier(dist) *
                 (is_moving ? 0.5f : 1.0f) * weapon_accuracy_mod;
  return std::max(0.05f, std::min(0.95f, chance));
}

float headshot_chance(float acc) { return 0.10f + acc / 500.0f; }

float spray_accuracy(float base_chance, int shots_fired, float rcl) {
  float shots = (float)shots_fired;
  float factor = 1.0f - shots * 0.08f + rcl * 0.0006f * shots;
  return base_chance * std::max(0.3f, factor);
}

float composure_modifier(float cmp, float health, int enemies_visible,
                         int allies_alive) {
  bool under_pressure =
      health < 30.0f || enemies_visible > allies_alive + 1;
  return under_pressure ? 0.6f + cmp * 0.004f : 1.0f;
}

float clutch_modifier(float clt, int allies_alive) {
  return allies_alive == 0 ? 1.0f + clt * 0.003f : 1.0f;
}

float teamwork_modifier(float twk, bool ally_nearby) {
  return ally_nearby ? 1.0f + twk * 0.002f : 1.0f;
}

float detection_probability(float dist, float effective_radius,
                            bool peripheral_only) {
  if (effective_radius <= 0.0f)
    return 0.0f;
  float p = 0.6f * (1.0f - 0.4f * dist / effective_radius);
  if (peripheral_only)
    p *= 0.5f;
  return std::max(0.0f, p);
}

float calculate_damage(float body_damage, float headshot_mult,
                       HitLocation location, float armor_body_reduction,
                       float armor_leg_reduction, bool has_helmet,
                       bool ignores_helmet) {
  switch (location) {
  case HIT_HEAD: {
    // Helmet halves the bonus portion; head hits skip body armor
    float mult = headshot_mult;
    if (has_helmet && !ignores_helmet)
      mult = 1.0f + (headshot_mult - 1.0f) * 0.5f;
    return body_damage * mult;
  }
  case HIT_BODY:
    return body_damage * (1.0f - armor_body_reduction);
  case HIT_LEGS:
  default:
    return body_damage * 0.75f * (1.0f - armor_leg_reduction);
  }
}

float reaction_time_ms(float rea, double roll) {
  float jitter = (float)(roll * 100.0 - 50.0);
  return std::max(100.0f, 800.0f - rea * 6.0f + jitter);
}

} // namespace breach
