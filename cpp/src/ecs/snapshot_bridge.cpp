#include "snapshot_bridge.h"
#include <godot_cpp/variant/string.hpp>
#include <godot_cpp/variant/vector2.hpp>

namespace breach {

// ── Helper: write one unit into dest at offset ────────────────
static void write_unit(float *dest, int offset, const Vec2 &pos, float facing,
                       float health, bool enemy, int index, bool alive,
                       uint32_t state) {
  dest[offset + 0] = pos.x;
  dest[offset + 1] = pos.z;
  dest[offset + 2] = facing;
  dest[offset + 3] = health;
  dest[offset + 4] = enemy ? 1.0f : 0.0f;
  dest[offset + 5] = (float)index;
  dest[offset + 6] = alive ? 1.0f : 0.0f;
  dest[offset + 7] = (float)state;
}

void pack_unit_buffer(const FilteredState &view,
                      godot::PackedFloat32Array &buffer_out, int &count_out) {
  count_out = (int)(view.own.size() + view.enemies.size());
  buffer_out.resize(count_out * FLOATS_PER_UNIT);
  float *dest = buffer_out.ptrw();

  int slot = 0;
  for (const UnitSnapshot &u : view.own) {
    uint32_t state = 0;
    if (u.moving)
      state |= UNIT_MOVING;
    if (u.in_combat)
      state |= UNIT_IN_COMBAT;
    if (u.action == ACTION_PLANT)
      state |= UNIT_PLANTING;
    if (u.action == ACTION_DEFUSE)
      state |= UNIT_DEFUSING;
    write_unit(dest, slot * FLOATS_PER_UNIT, u.pos, u.facing, u.health, false,
               u.index, u.alive, state);
    slot++;
  }

  for (const EnemySnapshot &e : view.enemies) {
    uint32_t state = 0;
    if (e.moving)
      state |= UNIT_MOVING;
    if (e.in_combat)
      state |= UNIT_IN_COMBAT;
    if (e.planting)
      state |= UNIT_PLANTING;
    if (e.defusing)
      state |= UNIT_DEFUSING;
    write_unit(dest, slot * FLOATS_PER_UNIT, e.pos, e.facing, e.health, true,
               e.index, e.alive, state);
    slot++;
  }
}

static godot::Vector2 to_godot(const Vec2 &v) {
  return godot::Vector2(v.x, v.z);
}

static godot::String site_string(char site) {
  if (site == NO_SITE)
    return godot::String();
  char buf[2] = {site, '\0'};
  return godot::String(buf);
}

static godot::Dictionary stats_to_dictionary(const Attributes &a) {
  godot::Dictionary d;
  d["ACC"] = (int)a.acc;
  d["REA"] = (int)a.rea;
  d["SPD"] = (int)a.spd;
  d["STL"] = (int)a.stl;
  d["AWR"] = (int)a.awr;
  d["RCL"] = (int)a.rcl;
  d["CMP"] = (int)a.cmp;
  d["CLT"] = (int)a.clt;
  d["UTL"] = (int)a.utl;
  d["TWK"] = (int)a.twk;
  return d;
}

static godot::Dictionary loadout_to_dictionary(const Loadout &lo) {
  godot::Dictionary d;
  d["weapon"] = weapon_name(lo.weapon);
  const WeaponStats &ws = weapon_stats(lo.weapon);
  d["fire_rate_ms"] = ws.fire_rate_ms;
  d["magazine"] = ws.magazine;
  d["range"] = range_name(ws.range);
  d["armor"] = armor_stats(lo.armor).name;
  d["helmet"] = lo.helmet;
  d["defuse_kit"] = lo.defuse_kit;
  godot::Array utility;
  for (int i = 0; i < lo.utility_count; i++)
    utility.push_back(utility_name(lo.utility[i]));
  d["utility"] = utility;
  return d;
}

godot::Dictionary filtered_state_to_dictionary(const FilteredState &view) {
  godot::Dictionary d;
  d["tick"] = (int64_t)view.tick;
  d["phase"] = phase_name(view.phase);
  d["team"] = view.team;
  d["side"] = side_name(view.side);

  godot::Array own;
  for (const UnitSnapshot &u : view.own) {
    godot::Dictionary s;
    s["index"] = (int)u.index;
    s["position"] = to_godot(u.pos);
    s["facing"] = u.facing;
    s["health"] = u.health;
    s["alive"] = u.alive;
    s["stats"] = stats_to_dictionary(u.stats);
    s["reaction_ms"] = u.reaction_ms;
    s["loadout"] = loadout_to_dictionary(u.loadout);
    godot::Array path;
    for (const Vec2 &p : u.waypoints)
      path.push_back(to_godot(p));
    s["waypoints"] = path;
    godot::Array seen;
    for (int j = 0; j < SQUAD_SIZE; j++)
      if (u.detected & (1u << j))
        seen.push_back(j);
    s["detected"] = seen;
    s["in_combat"] = u.in_combat;
    s["moving"] = u.moving;
    s["target"] = (int)u.target;
    s["blinded"] = u.blinded;
    s["has_bomb"] = u.has_bomb;
    s["planting"] = u.action == ACTION_PLANT;
    s["defusing"] = u.action == ACTION_DEFUSE;
    s["action_progress"] = u.action_progress;
    own.push_back(s);
  }
  d["units"] = own;

  godot::Array enemies;
  for (const EnemySnapshot &e : view.enemies) {
    godot::Dictionary s;
    s["index"] = (int)e.index;
    s["position"] = to_godot(e.pos);
    s["facing"] = e.facing;
    s["health"] = e.health;
    s["alive"] = e.alive;
    s["weapon"] = weapon_name(e.weapon);
    s["moving"] = e.moving;
    s["in_combat"] = e.in_combat;
    s["planting"] = e.planting;
    s["defusing"] = e.defusing;
    enemies.push_back(s);
  }
  d["enemies"] = enemies;

  d["bomb_planted"] = view.bomb_planted;
  if (view.bomb_planted) {
    d["bomb_position"] = to_godot(view.bomb_pos);
    d["bomb_site"] = site_string(view.bomb_site);
    d["bomb_timer"] = view.bomb_timer;
  }
  return d;
}

godot::Array events_to_array(const std::vector<SimEvent> &events) {
  godot::Array out;
  for (const SimEvent &ev : events) {
    godot::Dictionary d;
    d["type"] = event_name(ev.type);
    d["tick"] = (int64_t)ev.tick;

    switch (ev.type) {
    case EVENT_SHOT_FIRED:
      d["team"] = (int)ev.actor_team;
      d["unit"] = (int)ev.actor_index;
      d["weapon"] = weapon_name(ev.weapon);
      d["origin"] = to_godot(ev.pos);
      d["direction"] = ev.direction;
      break;
    case EVENT_HIT:
      d["team"] = (int)ev.actor_team;
      d["unit"] = (int)ev.actor_index;
      d["victim_team"] = (int)ev.target_team;
      d["victim"] = (int)ev.target_index;
      d["damage"] = ev.damage;
      d["location"] = ev.location == HIT_HEAD   ? "head"
                      : ev.location == HIT_BODY ? "body"
                                                : "legs";
      break;
    case EVENT_KILL:
      d["team"] = (int)ev.actor_team;
      d["unit"] = (int)ev.actor_index;
      d["victim_team"] = (int)ev.target_team;
      d["victim"] = (int)ev.target_index;
      d["weapon"] = weapon_name(ev.weapon);
      d["headshot"] = ev.headshot;
      break;
    case EVENT_BOMB_PLANTED:
      d["team"] = (int)ev.actor_team;
      d["unit"] = (int)ev.actor_index;
      d["position"] = to_godot(ev.pos);
      d["site"] = site_string(ev.site);
      break;
    case EVENT_BOMB_DEFUSED:
      d["team"] = (int)ev.actor_team;
      d["unit"] = (int)ev.actor_index;
      break;
    case EVENT_BOMB_EXPLODED:
      d["position"] = to_godot(ev.pos);
      break;
    case EVENT_UTILITY_THROWN:
      d["id"] = godot::String("util_") + godot::String::num_int64(ev.effect_id);
      d["utility"] = utility_name(ev.utility);
      d["position"] = to_godot(ev.pos);
      break;
    case EVENT_UTILITY_EXPIRED:
      d["id"] = godot::String("util_") + godot::String::num_int64(ev.effect_id);
      break;
    }
    out.push_back(d);
  }
  return out;
}

} // namespace breach
