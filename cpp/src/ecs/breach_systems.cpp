#include "breach_systems.h"
#include "breach_components.h"
#include <algorithm>
#include <cmath>

// Pointer discipline: adding or removing a tag (IsAlive, Blinded,
// BombCarrier) moves the unit to another table, which invalidates any
// component reference into it. Unit components are therefore copied
// by value or touched through ensure<>() in short scopes, never held
// across a kill or a blind. Singleton references are stable.

namespace breach {

// ─── Small value helpers ──────────────────────────────────
Loadout default_loadout() {
  Loadout lo;
  lo.weapon = WEAPON_PISTOL;
  lo.armor = ARMOR_NONE;
  lo.helmet = false;
  lo.defuse_kit = false;
  lo.utility_count = 0;
  for (UtilityType &u : lo.utility)
    u = UTILITY_NONE;
  return lo;
}

bool loadout_take_utility(Loadout &lo, UtilityType type) {
  for (int i = 0; i < lo.utility_count; i++) {
    if (lo.utility[i] != type)
      continue;
    for (int k = i; k + 1 < lo.utility_count; k++)
      lo.utility[k] = lo.utility[k + 1];
    lo.utility_count--;
    lo.utility[lo.utility_count] = UTILITY_NONE;
    return true;
  }
  return false;
}

void waypoints_assign(Waypoints &wp, const std::vector<Vec2> &path,
                      size_t first) {
  wp.count = 0;
  for (size_t k = first; k < path.size() && wp.count < MAX_WAYPOINTS; k++)
    wp.points[wp.count++] = path[k];
  // Overflow: the last slot still holds the destination
  if (path.size() > first + MAX_WAYPOINTS)
    wp.points[MAX_WAYPOINTS - 1] = path.back();
}

void waypoints_pop(Waypoints &wp) {
  if (wp.count == 0)
    return;
  for (int k = 1; k < wp.count; k++)
    wp.points[k - 1] = wp.points[k];
  wp.count--;
}

const char *event_name(EventType type) {
  switch (type) {
  case EVENT_SHOT_FIRED:
    return "SHOT_FIRED";
  case EVENT_HIT:
    return "HIT";
  case EVENT_KILL:
    return "KILL";
  case EVENT_BOMB_PLANTED:
    return "BOMB_PLANTED";
  case EVENT_BOMB_DEFUSED:
    return "BOMB_DEFUSED";
  case EVENT_BOMB_EXPLODED:
    return "BOMB_EXPLODED";
  case EVENT_UTILITY_THROWN:
    return "UTILITY_THROWN";
  case EVENT_UTILITY_EXPIRED:
    return "UTILITY_EXPIRED";
  }
  return "UNKNOWN";
}

static int popcount5(uint8_t mask) {
  int n = 0;
  for (int i = 0; i < SQUAD_SIZE; i++)
    if (mask & (1u << i))
      n++;
  return n;
}

// ═════════════════════════════════════════════════════════════
// REGISTRATION
// ═════════════════════════════════════════════════════════════

void register_breach_components(flecs::world &ecs) {
  ecs.component<Position>("Position");
  ecs.component<Facing>("Facing");
  ecs.component<Squad>("Squad");
  ecs.component<Health>("Health");
  ecs.component<IsAlive>("IsAlive");
  ecs.component<BombCarrier>("BombCarrier");
  ecs.component<Attributes>("Attributes");
  ecs.component<Loadout>("Loadout");
  ecs.component<Waypoints>("Waypoints");
  ecs.component<Vision>("Vision");
  ecs.component<CombatState>("CombatState");
  ecs.component<Blinded>("Blinded");
  ecs.component<ObjectiveAction>("ObjectiveAction");

  // Singletons
  ecs.component<Roster>("Roster");
  ecs.component<RoundState>("RoundState");
  ecs.component<Arena>("Arena");
  ecs.component<UtilityField>("UtilityField");
  ecs.component<TickEvents>("TickEvents");
  ecs.component<KillLog>("KillLog");
  ecs.component<SeededRng>("MatchRng");

  ecs.set<Roster>({});
  ecs.set<RoundState>({});
  ecs.set<Arena>({});
  ecs.set<UtilityField>({});
  ecs.set<TickEvents>({});
  ecs.set<KillLog>({});
  ecs.set<SeededRng>(SeededRng(1));
}

void register_movement_systems(flecs::world &ecs) {

  // ═════════════════════════════════════════════════════════════
  // SYSTEM 1: Waypoint Movement
  //
  // Walk toward points[0]. Inside ARRIVAL_DIST the unit snaps onto
  // the waypoint and pops it. Speed halves while in combat.
  // ═════════════════════════════════════════════════════════════
  ecs.system<Position, Facing, Waypoints, CombatState, const Attributes,
             const Loadout>("WaypointMovement")
      .with<IsAlive>()
      .each([](flecs::entity e, Position &p, Facing &f, Waypoints &wp,
               CombatState &cs, const Attributes &attr, const Loadout &lo) {
        float dt = e.world().delta_time();
        if (dt <= 0.0f)
          return;

        constexpr float ARRIVAL_DIST = 5.0f;

        if (wp.count > 0) {
          Vec2 target = wp.points[0];
          float dx = target.x - p.x;
          float dz = target.z - p.z;
          float dist = std::sqrt(dx * dx + dz * dz);

          if (dist <= ARRIVAL_DIST) {
            p.x = target.x;
            p.z = target.z;
            waypoints_pop(wp);
          } else {
            float speed = movement_speed((float)attr.spd,
                                         weapon_stats(lo.weapon).speed_mod,
                                         armor_stats(lo.armor).speed_mod);
            if (cs.in_combat)
              speed *= 0.5f;
            float step = std::min(speed * dt, dist);
            p.x += dx / dist * step;
            p.z += dz / dist * step;
            f.angle = std::atan2(dz, dx);
          }
        }

        cs.moving = wp.count > 0;
      });
}

// Roster-walking passes run immediate so kills and blinds apply at
// once instead of at the end of the frame.
void register_detection_systems(flecs::world &ecs) {
  // ── System 2: Detection ─────────────────────────────────────
  ecs.system("DetectionPass").immediate().run([](flecs::iter &it) {
    flecs::world w = it.world();
    run_detection_pass(w);
  });
}

void register_combat_systems(flecs::world &ecs) {
  // ── System 3: Gunfights ─────────────────────────────────────
  ecs.system("CombatPass").immediate().run([](flecs::iter &it) {
    flecs::world w = it.world();
    run_combat_pass(w);
  });
}

void register_utility_systems(flecs::world &ecs) {
  // ── System 4: Grenade effects ───────────────────────────────
  ecs.system("UtilityPass").immediate().run([](flecs::iter &it) {
    flecs::world w = it.world();
    run_utility_pass(w, it.delta_time());
  });

  // ── System 5: Flash recovery ────────────────────────────────
  ecs.system<Blinded>("BlindRecovery")
      .each([](flecs::entity e, Blinded &b) {
        float dt = e.world().delta_time();
        b.remaining -= dt;
        if (b.remaining <= 0.0f) {
          b.remaining = 0.0f;
          e.remove<Blinded>();
        }
      });
}

void register_objective_systems(flecs::world &ecs) {
  // ── System 6: Plant / defuse / fuse ─────────────────────────
  ecs.system("ObjectivePass").immediate().run([](flecs::iter &it) {
    flecs::world w = it.world();
    run_objective_pass(w, it.delta_time());
  });

  // ── System 7: Win conditions ────────────────────────────────
  ecs.system("RoundEndCheck").immediate().run([](flecs::iter &it) {
    flecs::world w = it.world();
    evaluate_round_end(w);
  });
}

void register_all_systems(flecs::world &ecs) {
  register_movement_systems(ecs);
  register_detection_systems(ecs);
  register_combat_systems(ecs);
  register_utility_systems(ecs);
  register_objective_systems(ecs);
}

// ═════════════════════════════════════════════════════════════
// SHARED HELPERS
// ═════════════════════════════════════════════════════════════

flecs::entity unit_at(const flecs::world &ecs, int team, int index) {
  if (team < 0 || team >= TEAM_COUNT || index < 0 || index >= SQUAD_SIZE)
    return flecs::entity();
  flecs::entity_t id = ecs.get<Roster>().units[team][index];
  if (id == 0)
    return flecs::entity();
  return flecs::entity(ecs, id);
}

bool is_alive(flecs::entity e) { return e.is_valid() && e.has<IsAlive>(); }

int alive_count(const flecs::world &ecs, Side side) {
  int n = 0;
  for (int t = 0; t < TEAM_COUNT; t++) {
    for (int i = 0; i < SQUAD_SIZE; i++) {
      flecs::entity e = unit_at(ecs, t, i);
      if (is_alive(e) && e.get<Squad>().side == side)
        n++;
    }
  }
  return n;
}

void emit_event(flecs::world &ecs, SimEvent ev) {
  ev.tick = ecs.get<RoundState>().tick;
  ecs.ensure<TickEvents>().events.push_back(ev);
}

bool has_clear_sight(const flecs::world &ecs, const Vec2 &a, const Vec2 &b) {
  const Arena &arena = ecs.get<Arena>();
  if (arena.nav && !arena.nav->has_line_of_sight(a, b))
    return false;

  for (const ActiveEffect &fx : ecs.get<UtilityField>().effects) {
    if (fx.type != UTILITY_SMOKE || fx.remaining <= 0.0f)
      continue;
    if (point_segment_distance(fx.center, a, b) < fx.radius)
      return false;
  }
  return true;
}

// ═════════════════════════════════════════════════════════════
// DETECTION
// ═════════════════════════════════════════════════════════════

bool try_detect(flecs::world &ecs, flecs::entity observer,
                flecs::entity target) {
  if (!is_alive(observer) || !is_alive(target))
    return false;
  if (observer.has<Blinded>())
    return false;

  constexpr float MAIN_CONE = PI / 3.0f;       // ±60°
  constexpr float PERIPHERAL_CONE = PI / 2.0f; // ±90°
  constexpr float STICKY_RANGE = 1.2f;

  Vec2 from = to_vec(observer.get<Position>());
  Vec2 to = to_vec(target.get<Position>());
  float d = distance(from, to);
  float radius = detection_radius((float)observer.get<Attributes>().awr) *
                 stealth_modifier((float)target.get<Attributes>().stl);

  uint8_t bit = (uint8_t)(1u << target.get<Squad>().index);
  if (observer.get<Vision>().detected & bit) {
    // Already tracked: no cone, no roll
    return d <= radius * STICKY_RANGE && has_clear_sight(ecs, from, to);
  }

  if (d > radius)
    return false;

  float off_axis =
      std::fabs(wrap_angle(angle_to(from, to) - observer.get<Facing>().angle));
  if (off_axis > PERIPHERAL_CONE)
    return false;
  bool peripheral_only = off_axis > MAIN_CONE;

  if (!has_clear_sight(ecs, from, to))
    return false;

  SeededRng &rng = ecs.ensure<SeededRng>();
  return rng.next() < detection_probability(d, radius, peripheral_only);
}

void run_detection_pass(flecs::world &ecs) {
  for (int team = 0; team < TEAM_COUNT; team++) {
    int enemy_team = 1 - team;
    for (int i = 0; i < SQUAD_SIZE; i++) {
      flecs::entity observer = unit_at(ecs, team, i);
      if (!observer.is_valid())
        continue;
      if (!is_alive(observer) || observer.has<Blinded>()) {
        observer.ensure<Vision>().detected = 0;
        continue;
      }

      uint8_t detected = 0;
      int nearest = -1;
      float nearest_dist = 0.0f;
      Vec2 from = to_vec(observer.get<Position>());

      for (int j = 0; j < SQUAD_SIZE; j++) {
        flecs::entity target = unit_at(ecs, enemy_team, j);
        if (!try_detect(ecs, observer, target))
          continue;
        detected |= (uint8_t)(1u << j);
        float d = distance(from, to_vec(target.get<Position>()));
        if (nearest < 0 || d < nearest_dist) {
          nearest = j;
          nearest_dist = d;
        }
      }

      observer.ensure<Vision>().detected = detected;

      // Standing units square up to the closest threat
      if (nearest >= 0 && !observer.get<CombatState>().moving) {
        Vec2 to = to_vec(unit_at(ecs, enemy_team, nearest).get<Position>());
        observer.ensure<Facing>().angle = angle_to(from, to);
      }
    }
  }
}

// ═════════════════════════════════════════════════════════════
// COMBAT
// ═════════════════════════════════════════════════════════════

float shot_hit_chance(const flecs::world &ecs, flecs::entity shooter,
                      flecs::entity target) {
  const Attributes &attr = shooter.get<Attributes>();
  const CombatState &cs = shooter.get<CombatState>();
  const Squad &sq = shooter.get<Squad>();
  Vec2 from = to_vec(shooter.get<Position>());
  Vec2 to = to_vec(target.get<Position>());

  float hc =
      final_hit_chance((float)attr.acc, distance(from, to), cs.moving,
                       weapon_stats(shooter.get<Loadout>().weapon).accuracy_mod);
  if (cs.shots_fired > 1)
    hc = spray_accuracy(hc, cs.shots_fired, (float)attr.rcl);

  int allies_alive = 0;
  bool ally_nearby = false;
  for (int i = 0; i < SQUAD_SIZE; i++) {
    if (i == sq.index)
      continue;
    flecs::entity ally = unit_at(ecs, sq.team, i);
    if (!is_alive(ally))
      continue;
    allies_alive++;
    if (distance(from, to_vec(ally.get<Position>())) <= TEAMWORK_RANGE)
      ally_nearby = true;
  }

  int enemies_visible = popcount5(shooter.get<Vision>().detected);
  hc *= composure_modifier((float)attr.cmp, shooter.get<Health>().hp,
                           enemies_visible, allies_alive);
  hc *= clutch_modifier((float)attr.clt, allies_alive);
  hc *= teamwork_modifier((float)attr.twk, ally_nearby);
  return clamp_hit_chance(hc);
}

bool resolve_shot(flecs::world &ecs, flecs::entity shooter,
                  flecs::entity target) {
  if (!is_alive(shooter) || !is_alive(target))
    return false;
  if (shooter.has<Blinded>())
    return false;

  Squad ss = shooter.get<Squad>();
  Squad ts = target.get<Squad>();
  WeaponId weapon = shooter.get<Loadout>().weapon;
  Vec2 from = to_vec(shooter.get<Position>());
  Vec2 to = to_vec(target.get<Position>());

  bool spraying;
  {
    CombatState &cs = shooter.ensure<CombatState>();
    if (cs.shots_fired < UINT16_MAX)
      cs.shots_fired++;
    spraying = cs.shots_fired > 1;
  }

  float hc = shot_hit_chance(ecs, shooter, target);

  SimEvent shot{};
  shot.type = EVENT_SHOT_FIRED;
  shot.actor_team = ss.team;
  shot.actor_index = ss.index;
  shot.target_team = ts.team;
  shot.target_index = ts.index;
  shot.weapon = weapon;
  shot.pos = from;
  shot.direction = angle_to(from, to);
  emit_event(ecs, shot);

  SeededRng &rng = ecs.ensure<SeededRng>();
  if (rng.next() >= hc)
    return false;

  // Hit location
  float hs = headshot_chance((float)shooter.get<Attributes>().acc);
  if (spraying)
    hs *= 0.5f;
  double roll = rng.next();
  HitLocation location = HIT_LEGS;
  if (roll < hs)
    location = HIT_HEAD;
  else if (roll < hs + (1.0f - hs) * 0.8f)
    location = HIT_BODY;

  const WeaponStats &ws = weapon_stats(weapon);
  Loadout tl = target.get<Loadout>();
  const ArmorStats &as = armor_stats(tl.armor);
  float damage =
      calculate_damage(ws.body_damage, ws.headshot_mult, location,
                       as.body_reduction, as.leg_reduction, tl.helmet,
                       ws.ignores_helmet);

  SimEvent hit{};
  hit.type = EVENT_HIT;
  hit.actor_team = ss.team;
  hit.actor_index = ss.index;
  hit.target_team = ts.team;
  hit.target_index = ts.index;
  hit.weapon = weapon;
  hit.location = location;
  hit.headshot = location == HIT_HEAD;
  hit.damage = damage;
  hit.pos = to;
  emit_event(ecs, hit);

  // Getting shot breaks concentration
  target.ensure<ObjectiveAction>().progress = 0.0f;

  return apply_damage(ecs, target, damage, ss.team, ss.index, weapon,
                      location == HIT_HEAD);
}

void run_combat_pass(flecs::world &ecs) {
  bool resolved[SQUAD_SIZE][SQUAD_SIZE] = {};

  // Pass 1: team 0 detections, mutual pairs trade shots
  for (int i = 0; i < SQUAD_SIZE; i++) {
    flecs::entity a = unit_at(ecs, 0, i);
    if (!is_alive(a))
      continue;
    uint8_t seen = a.get<Vision>().detected;

    for (int j = 0; j < SQUAD_SIZE; j++) {
      if (!(seen & (1u << j)))
        continue;
      if (!is_alive(a))
        break;
      flecs::entity b = unit_at(ecs, 1, j);
      if (!is_alive(b))
        continue;

      resolved[i][j] = true;
      bool mutual = (b.get<Vision>().detected & (1u << i)) != 0;

      {
        CombatState &cs = a.ensure<CombatState>();
        cs.in_combat = true;
        cs.target = (int8_t)j;
      }
      if (mutual) {
        CombatState &cs = b.ensure<CombatState>();
        cs.in_combat = true;
        cs.target = (int8_t)i;
      }

      resolve_shot(ecs, a, b);
      if (mutual && is_alive(a) && is_alive(b))
        resolve_shot(ecs, b, a);
    }
  }

  // Pass 2: one-sided team 1 detections (ambushes)
  for (int j = 0; j < SQUAD_SIZE; j++) {
    flecs::entity b = unit_at(ecs, 1, j);
    if (!is_alive(b))
      continue;
    uint8_t seen = b.get<Vision>().detected;

    for (int i = 0; i < SQUAD_SIZE; i++) {
      if (!(seen & (1u << i)) || resolved[i][j])
        continue;
      if (!is_alive(b))
        break;
      flecs::entity a = unit_at(ecs, 0, i);
      if (!is_alive(a))
        continue;

      resolved[i][j] = true;
      {
        CombatState &cs = b.ensure<CombatState>();
        cs.in_combat = true;
        cs.target = (int8_t)i;
      }
      resolve_shot(ecs, b, a);
    }
  }

  // Nothing in sight: disengage
  for (int t = 0; t < TEAM_COUNT; t++) {
    for (int i = 0; i < SQUAD_SIZE; i++) {
      flecs::entity e = unit_at(ecs, t, i);
      if (!is_alive(e) || e.get<Vision>().detected != 0)
        continue;
      CombatState &cs = e.ensure<CombatState>();
      cs.in_combat = false;
      cs.target = -1;
      cs.shots_fired = 0;
    }
  }
}

bool apply_damage(flecs::world &ecs, flecs::entity victim, float amount,
                  int killer_team, int killer_index, WeaponId weapon,
                  bool headshot) {
  if (!is_alive(victim) || amount <= 0.0f)
    return false;

  float hp;
  {
    Health &h = victim.ensure<Health>();
    h.hp = std::max(0.0f, h.hp - amount);
    hp = h.hp;
  }

  if (hp > 0.0f)
    return false;
  kill_unit(ecs, victim, killer_team, killer_index, weapon, headshot);
  return true;
}

void kill_unit(flecs::world &ecs, flecs::entity victim, int killer_team,
               int killer_index, WeaponId weapon, bool headshot) {
  if (!is_alive(victim))
    return; // Already dead: bookkeeping runs once

  victim.ensure<Health>().hp = 0.0f;
  victim.ensure<Waypoints>().count = 0;
  victim.ensure<Vision>().detected = 0;
  victim.ensure<CombatState>() = CombatState{false, false, -1, 0};
  victim.ensure<ObjectiveAction>() = ObjectiveAction{ACTION_NONE, 0.0f};

  Squad vs = victim.get<Squad>();
  Vec2 pos = to_vec(victim.get<Position>());

  // Structural changes last
  victim.remove<Blinded>();
  victim.remove<IsAlive>();

  KillRecord rec;
  rec.killer_team = (uint8_t)killer_team;
  rec.killer_index = (uint8_t)killer_index;
  rec.victim_team = vs.team;
  rec.victim_index = vs.index;
  rec.weapon = weapon;
  rec.headshot = headshot;
  rec.tick = ecs.get<RoundState>().tick;
  ecs.ensure<KillLog>().kills.push_back(rec);

  SimEvent ev{};
  ev.type = EVENT_KILL;
  ev.actor_team = (uint8_t)killer_team;
  ev.actor_index = (uint8_t)killer_index;
  ev.target_team = vs.team;
  ev.target_index = vs.index;
  ev.weapon = weapon;
  ev.headshot = headshot;
  ev.pos = pos;
  emit_event(ecs, ev);
}

// ═════════════════════════════════════════════════════════════
// UTILITY
// ═════════════════════════════════════════════════════════════

uint32_t throw_utility(flecs::world &ecs, UtilityType type, const Vec2 &pos,
                       int owner_team, int owner_index) {
  const UtilityStats &us = utility_stats(type);
  const float one_tick = ecs.get<Arena>().tick_seconds;
  UtilityField &field = ecs.ensure<UtilityField>();

  ActiveEffect fx;
  fx.id = field.next_id++;
  fx.type = type;
  fx.center = pos;
  fx.radius = us.radius;
  fx.total = us.duration > 0.0f ? us.duration : one_tick;
  fx.remaining = fx.total;
  fx.owner_team = (uint8_t)owner_team;
  fx.owner_index = (uint8_t)owner_index;
  fx.instant_applied = false;
  field.effects.push_back(fx);

  SimEvent ev{};
  ev.type = EVENT_UTILITY_THROWN;
  ev.actor_team = (uint8_t)owner_team;
  ev.actor_index = (uint8_t)owner_index;
  ev.utility = type;
  ev.pos = pos;
  ev.effect_id = fx.id;
  emit_event(ecs, ev);
  return fx.id;
}

void run_utility_pass(flecs::world &ecs, float dt) {
  UtilityField &field = ecs.ensure<UtilityField>();

  for (ActiveEffect &fx : field.effects) {
    const UtilityStats &us = utility_stats(fx.type);

    for (int t = 0; t < TEAM_COUNT; t++) {
      for (int i = 0; i < SQUAD_SIZE; i++) {
        flecs::entity u = unit_at(ecs, t, i);
        if (!is_alive(u))
          continue;
        float d = distance(fx.center, to_vec(u.get<Position>()));
        if (d > fx.radius)
          continue;
        bool is_thrower = t == fx.owner_team && i == fx.owner_index;
        float falloff = 1.0f - d / fx.radius;

        switch (fx.type) {
        case UTILITY_FRAG: {
          if (fx.instant_applied)
            break;
          float dmg = us.damage * falloff;
          if (is_thrower)
            dmg *= 0.5f;
          apply_damage(ecs, u, dmg, fx.owner_team, fx.owner_index,
                       WEAPON_FRAG, false);
          break;
        }
        case UTILITY_FLASH: {
          if (fx.instant_applied || is_thrower)
            break;
          float blind = us.duration * (0.5f + 0.5f * falloff);
          if (u.has<Blinded>())
            blind = std::max(blind, u.get<Blinded>().remaining);
          u.set<Blinded>({blind});
          u.ensure<Vision>().detected = 0;
          break;
        }
        case UTILITY_MOLOTOV:
          apply_damage(ecs, u, us.damage * dt, fx.owner_team, fx.owner_index,
                       WEAPON_FRAG, false);
          break;
        default:
          break; // Smoke works through has_clear_sight, decoy does nothing
        }
      }
    }

    fx.instant_applied = true;
    fx.remaining -= dt;
  }

  for (const ActiveEffect &fx : field.effects) {
    if (fx.remaining > 0.0f)
      continue;
    SimEvent ev{};
    ev.type = EVENT_UTILITY_EXPIRED;
    ev.actor_team = fx.owner_team;
    ev.actor_index = fx.owner_index;
    ev.utility = fx.type;
    ev.pos = fx.center;
    ev.effect_id = fx.id;
    emit_event(ecs, ev);
  }
  field.effects.erase(std::remove_if(field.effects.begin(),
                                     field.effects.end(),
                                     [](const ActiveEffect &fx) {
                                       return fx.remaining <= 0.0f;
                                     }),
                      field.effects.end());
}

// ═════════════════════════════════════════════════════════════
// OBJECTIVE
// ═════════════════════════════════════════════════════════════

// 15 steps of 0.2f must count as 3 seconds.
constexpr float ACTION_EPSILON = 1e-4f;

void run_objective_pass(flecs::world &ecs, float dt) {
  RoundState &rs = ecs.ensure<RoundState>();
  const Arena &arena = ecs.get<Arena>();
  bool planted_this_tick = false;

  for (int t = 0; t < TEAM_COUNT; t++) {
    for (int i = 0; i < SQUAD_SIZE; i++) {
      flecs::entity u = unit_at(ecs, t, i);
      if (!is_alive(u))
        continue;
      ObjectiveAction action = u.get<ObjectiveAction>();
      if (action.kind == ACTION_NONE)
        continue;

      Squad sq = u.get<Squad>();
      Vec2 pos = to_vec(u.get<Position>());

      if (action.kind == ACTION_PLANT) {
        char site = arena.map ? plant_zone_at(*arena.map, pos) : NO_SITE;
        bool held = sq.side == SIDE_ATTACKER && u.has<BombCarrier>() &&
                    !rs.bomb_planted && site != NO_SITE;
        if (!held) {
          u.ensure<ObjectiveAction>() = ObjectiveAction{ACTION_NONE, 0.0f};
          continue;
        }

        float progress = advance_action(action.progress, dt, held);
        if (progress + ACTION_EPSILON < PLANT_SECONDS) {
          u.ensure<ObjectiveAction>().progress = progress;
          continue;
        }

        rs.bomb_planted = true;
        rs.bomb_pos = pos;
        rs.bomb_site = site;
        rs.bomb_timer = rs.bomb_fuse;
        planted_this_tick = true;
        u.ensure<ObjectiveAction>() = ObjectiveAction{ACTION_NONE, 0.0f};
        u.remove<BombCarrier>();

        SimEvent ev{};
        ev.type = EVENT_BOMB_PLANTED;
        ev.actor_team = sq.team;
        ev.actor_index = sq.index;
        ev.pos = pos;
        ev.site = site;
        emit_event(ecs, ev);
      } else {
        bool held = sq.side == SIDE_DEFENDER && rs.bomb_planted &&
                    !rs.bomb_defused && !rs.bomb_exploded &&
                    is_in_defuse_range(pos, rs.bomb_pos);
        if (!held) {
          u.ensure<ObjectiveAction>() = ObjectiveAction{ACTION_NONE, 0.0f};
          continue;
        }

        float progress = advance_action(action.progress, dt, held);
        if (progress + ACTION_EPSILON <
            defuse_duration(u.get<Loadout>().defuse_kit)) {
          u.ensure<ObjectiveAction>().progress = progress;
          continue;
        }

        rs.bomb_defused = true;
        u.ensure<ObjectiveAction>() = ObjectiveAction{ACTION_NONE, 0.0f};

        SimEvent ev{};
        ev.type = EVENT_BOMB_DEFUSED;
        ev.actor_team = sq.team;
        ev.actor_index = sq.index;
        ev.pos = rs.bomb_pos;
        ev.site = rs.bomb_site;
        emit_event(ecs, ev);
      }
    }
  }

  // Fuse. A defuse finished this tick wins the race.
  if (rs.bomb_planted && !rs.bomb_defused && !rs.bomb_exploded &&
      !planted_this_tick) {
    rs.bomb_timer = std::max(0.0f, rs.bomb_timer - dt);
    if (rs.bomb_timer <= ACTION_EPSILON) {
      rs.bomb_timer = 0.0f;
      rs.bomb_exploded = true;

      SimEvent ev{};
      ev.type = EVENT_BOMB_EXPLODED;
      ev.pos = rs.bomb_pos;
      ev.site = rs.bomb_site;
      emit_event(ecs, ev);
    }
  }
}

void evaluate_round_end(flecs::world &ecs) {
  RoundState &rs = ecs.ensure<RoundState>();
  if (rs.winner != SIDE_NONE)
    return;

  if (rs.bomb_defused)
    rs.winner = SIDE_DEFENDER;
  else if (rs.bomb_exploded)
    rs.winner = SIDE_ATTACKER;
  else if (alive_count(ecs, SIDE_ATTACKER) == 0 && !rs.bomb_planted)
    rs.winner = SIDE_DEFENDER;
  else if (alive_count(ecs, SIDE_DEFENDER) == 0)
    rs.winner = SIDE_ATTACKER;
}

int count_invariant_violations(const flecs::world &ecs) {
  int violations = 0;
  for (int t = 0; t < TEAM_COUNT; t++) {
    for (int i = 0; i < SQUAD_SIZE; i++) {
      flecs::entity e = unit_at(ecs, t, i);
      if (!e.is_valid())
        continue;
      float hp = e.get<Health>().hp;
      if (hp < 0.0f)
        violations++;
      if (e.has<IsAlive>()) {
        if (hp <= 0.0f)
          violations++;
        continue;
      }
      if (e.get<Waypoints>().count != 0 || e.get<Vision>().detected != 0 ||
          e.get<CombatState>().target != -1 ||
          e.get<ObjectiveAction>().kind != ACTION_NONE)
        violations++;
    }
  }
  return violations;
}

} // namespace breach
