#ifndef BREACH_STAT_FORMULAS_H
#define BREACH_STAT_FORMULAS_H

namespace breach {

// ═════════════════════════════════════════════════════════════
// STAT FORMULAS
//
// Pure functions from a soldier's 1-100 attributes plus context
// to derived numbers. Every probabilistic system calls these; no
// system keeps its own variant.
// ═════════════════════════════════════════════════════════════

enum HitLocation : unsigned char { HIT_HEAD = 0, HIT_BODY, HIT_LEGS };

constexpr float TEAMWORK_RANGE = 300.0f;
constexpr float MIN_HIT_CHANCE = 0.02f;
constexpr float MAX_HIT_CHANCE = 0.98f;

// Units per second. 200 at SPD 50 with no weight.
float movement_speed(float spd, float weapon_speed_mod, float armor_speed_mod);

float detection_radius(float awr);
float stealth_modifier(float stl);

float base_hit_chance(float acc);
float distance_modifier(float dist);

// Clamped to [0.05, 0.95] before situational modifiers.
float final_hit_chance(float acc, float dist, bool is_moving,
                       float weapon_accuracy_mod);

float headshot_chance(float acc);

// Sustained fire degradation, floor at 30% of the base chance.
float spray_accuracy(float base_chance, int shots_fired, float rcl);

float composure_modifier(float cmp, float health, int enemies_visible,
                         int allies_alive);
float clutch_modifier(float clt, int allies_alive);
float teamwork_modifier(float twk, bool ally_nearby);

// Per-tick detection chance inside the effective radius.
float detection_probability(float dist, float effective_radius,
                            bool peripheral_only);

float calculate_damage(float body_damage, float headshot_mult,
                       HitLocation location, float armor_body_reduction,
                       float armor_leg_reduction, bool has_helmet,
                       bool ignores_helmet);

// First-shot delay in ms, shown to the player. roll is a [0,1) value
// supplied by the caller; 0.5 gives the jitter-free figure.
float reaction_time_ms(float rea, double roll);

inline float clamp_hit_chance(float chance) {
  if (chance < MIN_HIT_CHANCE)
    return MIN_HIT_CHANCE;
  if (chance > MAX_HIT_CHANCE)
    return MAX_HIT_CHANCE;
  return chance;
}

} // namespace breach

#endif // BREACH_STAT_FORMULAS_H
