#include "world_manager.h"
#include "../sim/command_queue.h"
#include "../sim/data_loader.h"
#include "../sim/equipment.h"
#include "snapshot_bridge.h"
#include <godot_cpp/classes/engine.hpp>
#include <godot_cpp/classes/file_access.hpp>
#include <godot_cpp/core/class_db.hpp>
#include <godot_cpp/variant/utility_functions.hpp>
#include <string>
#include <vector>

namespace godot {

static std::string to_std(const String &s) {
  return std::string(s.utf8().get_data());
}

BreachServer::BreachServer() {}

BreachServer::~BreachServer() {}

void BreachServer::_bind_methods() {
  // Setup
  ClassDB::bind_method(D_METHOD("load_map", "path"), &BreachServer::load_map);
  ClassDB::bind_method(D_METHOD("load_config", "path"),
                       &BreachServer::load_config);
  ClassDB::bind_method(D_METHOD("start_match", "seed"),
                       &BreachServer::start_match);

  // Orders
  ClassDB::bind_method(
      D_METHOD("issue_command", "team", "unit", "type", "x", "z", "utility"),
      &BreachServer::issue_command);
  ClassDB::bind_method(D_METHOD("buy", "team", "unit", "item"),
                       &BreachServer::buy);
  ClassDB::bind_method(D_METHOD("submit_plan", "team", "unit", "points"),
                       &BreachServer::submit_plan);
  ClassDB::bind_method(D_METHOD("set_ready", "team"), &BreachServer::set_ready);

  // Queries
  ClassDB::bind_method(D_METHOD("get_phase"), &BreachServer::get_phase);
  ClassDB::bind_method(D_METHOD("get_time_remaining"),
                       &BreachServer::get_time_remaining);
  ClassDB::bind_method(D_METHOD("get_score"), &BreachServer::get_score);
  ClassDB::bind_method(D_METHOD("get_filtered_state", "team"),
                       &BreachServer::get_filtered_state);
  ClassDB::bind_method(D_METHOD("get_tick_events"),
                       &BreachServer::get_tick_events);
  ClassDB::bind_method(D_METHOD("get_unit_buffer", "team"),
                       &BreachServer::get_unit_buffer);
  ClassDB::bind_method(D_METHOD("get_unit_count"),
                       &BreachServer::get_unit_count);
}

void BreachServer::_ready() {
  if (Engine::get_singleton()->is_editor_hint()) {
    return;
  }
  init_defaults();
}

void BreachServer::init_defaults() {
  UtilityFunctions::print("[BreachEngine] Initializing...");

  if (!map) {
    if (!load_map("res://data/maps/bazaar.json")) {
      UtilityFunctions::print(
          "[BreachEngine] Falling back to the built-in empty map");
      auto fallback = std::make_shared<breach::MapData>();
      nav = std::make_shared<const breach::Pathfinder>(
          fallback->width, fallback->height, fallback->walls);
      map = fallback;
    }
  }

  if (FileAccess::file_exists("res://data/match_config.json"))
    load_config("res://data/match_config.json");

  UtilityFunctions::print("[BreachEngine] Ready. Nav grid ", nav->cols(), "x",
                          nav->rows(), ", ", (int64_t)map->walls.size(),
                          " walls.");
}

bool BreachServer::load_map(const String &path) {
  if (!FileAccess::file_exists(path)) {
    UtilityFunctions::printerr("[BreachEngine] Map not found: ", path);
    return false;
  }

  String content = FileAccess::get_file_as_string(path);
  auto loaded = std::make_shared<breach::MapData>();
  std::string error;
  if (!breach::parse_map_json(to_std(content), *loaded, error)) {
    UtilityFunctions::printerr("[BreachEngine] Failed to load map ", path,
                               ": ", String(error.c_str()));
    return false;
  }

  // Built once, shared read-only by every match on this map
  nav = std::make_shared<const breach::Pathfinder>(
      loaded->width, loaded->height, loaded->walls);
  map = loaded;

  UtilityFunctions::print("[BreachEngine] Loaded map '",
                          String(map->name.c_str()), "' (",
                          (int64_t)map->bomb_sites.size(), " sites, ",
                          (int64_t)map->walls.size(), " walls)");
  return true;
}

bool BreachServer::load_config(const String &path) {
  if (!FileAccess::file_exists(path)) {
    UtilityFunctions::printerr("[BreachEngine] Config not found: ", path);
    return false;
  }

  String content = FileAccess::get_file_as_string(path);
  std::string error;
  if (!breach::parse_match_config_json(to_std(content), config, error)) {
    UtilityFunctions::printerr("[BreachEngine] Failed to load config ", path,
                               ": ", String(error.c_str()));
    return false;
  }

  UtilityFunctions::print("[BreachEngine] Loaded config: first to ",
                          config.rounds_to_win, ", ", config.max_rounds,
                          " rounds max, $", config.starting_money, " start");
  return true;
}

void BreachServer::start_match(int seed) {
  if (!map)
    init_defaults();

  config.seed = (uint32_t)seed;
  match = std::make_unique<breach::MatchLifecycle>(map, nav, config);
  last_phase = match->phase();
  logged_results = 0;

  UtilityFunctions::print("[BreachEngine] Match started on '",
                          String(map->name.c_str()), "' with seed ", seed,
                          ". Team 0 attacks first.");
}

void BreachServer::_process(double delta) {
  if (Engine::get_singleton()->is_editor_hint()) {
    return;
  }
  if (!match)
    return;

  match->advance((float)delta);
  log_transitions();
}

void BreachServer::log_transitions() {
  const auto &results = match->results();
  while (logged_results < results.size()) {
    const breach::RoundResult &r = results[logged_results++];
    UtilityFunctions::print(
        "[BreachEngine] Round ", r.round, " -> ",
        breach::side_name(r.winner_side), " (team ", r.winner_team, ")",
        r.bomb_detonated ? " by detonation"
        : r.bomb_defused ? " by defuse"
                         : "",
        ". Kills: ", (int64_t)r.kills.size());
    for (int t = 0; t < breach::TEAM_COUNT; t++) {
      const breach::EconomyUpdate &u = r.economy[t];
      UtilityFunctions::print("[BreachEngine]   team ", t, " earned $",
                              u.total_earned, " (round ", u.round_reward,
                              ", kills ", u.kill_reward, ", objective ",
                              u.objective_bonus, ") -> $", u.new_money,
                              ", loss streak ", u.new_loss_streak);
    }
  }

  breach::Phase phase = match->phase();
  if (phase == last_phase)
    return;

  UtilityFunctions::print("[BreachEngine] Phase ",
                          breach::phase_name(last_phase), " -> ",
                          breach::phase_name(phase), " (round ",
                          match->round(), ", score ", match->score(0), "-",
                          match->score(1), ")");

  if (phase == breach::PHASE_BUY && last_phase == breach::PHASE_ROUND_END) {
    if (match->round() == config.rounds_per_half + 1)
      UtilityFunctions::print("[BreachEngine] Half time: sides swapped, "
                              "economy and loadouts reset");
    if (match->overtime() && match->round() == config.max_rounds)
      UtilityFunctions::print("[BreachEngine] Overtime: both teams set to $",
                              config.overtime_money);
  }

  if (phase == breach::PHASE_MATCH_END) {
    if (match->winner_team() >= 0)
      UtilityFunctions::print("[BreachEngine] Match over. Team ",
                              match->winner_team(), " wins ", match->score(0),
                              "-", match->score(1));
    else
      UtilityFunctions::print("[BreachEngine] Match over. Draw ",
                              match->score(0), "-", match->score(1));
  }

  last_phase = phase;
}

// ═══════════════════════════════════════════════════════════════
// ORDERS
// ═══════════════════════════════════════════════════════════════

bool BreachServer::issue_command(int team, int unit, const String &type,
                                 float x, float z, const String &utility) {
  if (!match)
    return false;

  breach::CommandType cmd;
  if (!breach::command_from_name(to_std(type).c_str(), cmd)) {
    UtilityFunctions::printerr("[BreachEngine] Unknown command: ", type);
    return false;
  }

  breach::CommandOptions options;
  options.has_target = true;
  options.target = {x, z};
  if (!utility.is_empty() &&
      !breach::utility_from_name(to_std(utility).c_str(), options.utility)) {
    UtilityFunctions::printerr("[BreachEngine] Unknown utility: ", utility);
    return false;
  }

  return match->issue_command(team, unit, cmd, options);
}

bool BreachServer::buy(int team, int unit, const String &item) {
  if (!match)
    return false;

  std::string name = to_std(item);
  breach::WeaponId weapon;
  breach::ArmorTier armor;
  breach::UtilityType util;

  if (name == "HELMET")
    return match->buy_helmet(team, unit);
  if (name == "DEFUSE_KIT")
    return match->buy_defuse_kit(team, unit);
  if (breach::weapon_from_name(name.c_str(), weapon))
    return match->buy_weapon(team, unit, weapon);
  if (breach::armor_from_name(name.c_str(), armor))
    return match->buy_armor(team, unit, armor);
  if (breach::utility_from_name(name.c_str(), util))
    return match->buy_utility(team, unit, util);

  UtilityFunctions::printerr("[BreachEngine] Unknown item: ", item);
  return false;
}

bool BreachServer::submit_plan(int team, int unit,
                               const PackedVector2Array &points) {
  if (!match)
    return false;

  // Godot's 2D y axis is the map's z axis
  std::vector<breach::Vec2> stops;
  stops.reserve(points.size());
  for (int64_t i = 0; i < points.size(); i++)
    stops.push_back({points[i].x, points[i].y});

  if (!match->submit_plan(team, unit, stops)) {
    UtilityFunctions::printerr("[BreachEngine] Plan rejected for team ", team,
                               " unit ", unit);
    return false;
  }
  return true;
}

bool BreachServer::set_ready(int team) {
  if (!match)
    return false;
  breach::Phase phase = match->phase();
  bool accepted = match->set_ready(team);
  if (accepted)
    UtilityFunctions::print("[BreachEngine] Team ", team, " ready in ",
                            breach::phase_name(phase));
  log_transitions();
  return accepted;
}

// ═══════════════════════════════════════════════════════════════
// QUERIES
// ═══════════════════════════════════════════════════════════════

String BreachServer::get_phase() const {
  if (!match)
    return String();
  return String(breach::phase_name(match->phase()));
}

float BreachServer::get_time_remaining() const {
  return match ? match->time_remaining() : 0.0f;
}

Dictionary BreachServer::get_score() const {
  Dictionary d;
  if (!match)
    return d;
  d["round"] = match->round();
  d["team0"] = match->score(0);
  d["team1"] = match->score(1);
  d["team0_side"] = breach::side_name(match->side_of(0));
  d["team1_side"] = breach::side_name(match->side_of(1));
  d["team0_money"] = match->economy(0).money;
  d["team1_money"] = match->economy(1).money;
  d["overtime"] = match->overtime();
  return d;
}

Dictionary BreachServer::get_filtered_state(int team) const {
  if (!match || team < 0 || team >= breach::TEAM_COUNT)
    return Dictionary();
  return breach::filtered_state_to_dictionary(
      match->simulation().project_for_team(team));
}

Array BreachServer::get_tick_events() const {
  if (!match)
    return Array();
  return breach::events_to_array(match->simulation().tick_events());
}

PackedFloat32Array BreachServer::get_unit_buffer(int team) {
  if (!match || team < 0 || team >= breach::TEAM_COUNT) {
    unit_count = 0;
    unit_buffer.resize(0);
    return unit_buffer;
  }
  breach::pack_unit_buffer(match->simulation().project_for_team(team),
                           unit_buffer, unit_count);
  return unit_buffer;
}

int BreachServer::get_unit_count() const { return unit_count; }

} // namespace godot
