#ifndef BREACH_SYSTEMS_H
#define BREACH_SYSTEMS_H

#include "breach_components.h"
#include <flecs.h>

namespace breach {

// Component + singleton registration (call once per world)
void register_breach_components(flecs::world &ecs);

// Tick pipeline. flecs runs systems in declaration order, so the
// register_* calls below MUST stay in this order.
//   1. WaypointMovement
void register_movement_systems(flecs::world &ecs);
//   2. DetectionPass
void register_detection_systems(flecs::world &ecs);
//   3. CombatPass
void register_combat_systems(flecs::world &ecs);
//   4. UtilityPass + 5. BlindRecovery
void register_utility_systems(flecs::world &ecs);
//   6. ObjectivePass + 7. RoundEndCheck
void register_objective_systems(flecs::world &ecs);

void register_all_systems(flecs::world &ecs);

// ─── Pass bodies (systems call these; tests may call them directly) ──
void run_detection_pass(flecs::world &ecs);
void run_combat_pass(flecs::world &ecs);
void run_utility_pass(flecs::world &ecs, float dt);
void run_objective_pass(flecs::world &ecs, float dt);
void evaluate_round_end(flecs::world &ecs);

// ─── Shared helpers ───────────────────────────────────────
flecs::entity unit_at(const flecs::world &ecs, int team, int index);
bool is_alive(flecs::entity e);
int alive_count(const flecs::world &ecs, Side side);

// Walls and active smoke clouds.
bool has_clear_sight(const flecs::world &ecs, const Vec2 &a, const Vec2 &b);

// Detection test for one observer/target pair. Draws one PRNG value
// only when every deterministic gate passes.
bool try_detect(flecs::world &ecs, flecs::entity observer,
                flecs::entity target);

// Hit chance for the shooter's next shot, after every modifier and
// the final clamp. Uses the current shots_fired counter.
float shot_hit_chance(const flecs::world &ecs, flecs::entity shooter,
                      flecs::entity target);

// One shot. Returns true if the target died from it.
bool resolve_shot(flecs::world &ecs, flecs::entity shooter,
                  flecs::entity target);

// Health loss with the death transition built in. Returns true on kill.
bool apply_damage(flecs::world &ecs, flecs::entity victim, float amount,
                  int killer_team, int killer_index, WeaponId weapon,
                  bool headshot);

// Atomic death: hp 0, movement/vision/combat/action cleared, IsAlive
// removed, kill record + KILL event appended.
void kill_unit(flecs::world &ecs, flecs::entity victim, int killer_team,
               int killer_index, WeaponId weapon, bool headshot);

// Returns the effect id (util_<id>).
uint32_t throw_utility(flecs::world &ecs, UtilityType type, const Vec2 &pos,
                       int owner_team, int owner_index);

void emit_event(flecs::world &ecs, SimEvent ev);

// Dead-but-alive units or dead units with leftover state.
int count_invariant_violations(const flecs::world &ecs);

} // namespace breach

#endif // BREACH_SYSTEMS_H
