#include "data_loader.h"
#include <algorithm>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace breach {

static Rect read_rect(const json &j) {
  return {j.value("x", 0.0f), j.value("z", 0.0f), j.value("width", 0.0f),
          j.value("height", 0.0f)};
}

static uint8_t read_stat(const json &j, const char *key, uint8_t fallback) {
  int v = j.value(key, (int)fallback);
  return (uint8_t)std::max(1, std::min(100, v));
}

bool parse_map_json(const std::string &text, MapData &out, std::string &error) {
  try {
    json j = json::parse(text);
    MapData map;

    map.name = j.value("name", map.name);
    map.theme = j.value("theme", map.theme);

    if (!j.contains("dimensions")) {
      error = "map is missing 'dimensions'";
      return false;
    }
    map.width = j["dimensions"].value("width", 0.0f);
    map.height = j["dimensions"].value("height", 0.0f);
    if (map.width <= 0.0f || map.height <= 0.0f) {
      error = "map dimensions must be positive";
      return false;
    }

    if (j.contains("spawnZones")) {
      auto &spawns = j["spawnZones"];
      if (spawns.contains("attacker"))
        map.attacker_spawn = read_rect(spawns["attacker"]);
      if (spawns.contains("defender"))
        map.defender_spawn = read_rect(spawns["defender"]);
    }

    if (j.contains("bombSites")) {
      for (auto &site : j["bombSites"]) {
        std::string id = site.at("id").get<std::string>();
        if (id.empty()) {
          error = "bomb site with empty id";
          return false;
        }
        BombSite bs;
        bs.id = id[0];
        bs.zone = read_rect(site.at("zone"));
        bs.plant_zone = read_rect(site.at("plantZone"));
        map.bomb_sites.push_back(bs);
      }
    }

    if (j.contains("walls")) {
      for (auto &wall : j["walls"]) {
        Rect r = read_rect(wall);
        if (r.width <= 0.0f || r.height <= 0.0f) {
          error = "wall " + std::to_string(map.walls.size()) +
                  " must have a positive width and height";
          return false;
        }
        map.walls.push_back(r);
      }
    }

    out = std::move(map);
    return true;
  } catch (json::exception &e) {
    error = std::string("map JSON error: ") + e.what();
    return false;
  }
}

bool parse_match_config_json(const std::string &text, MatchConfig &out,
                             std::string &error) {
  try {
    json j = json::parse(text);
    MatchConfig cfg = out;

    cfg.seed = j.value("seed", cfg.seed);
    cfg.starting_money = j.value("startingMoney", cfg.starting_money);
    cfg.rounds_to_win = j.value("roundsToWin", cfg.rounds_to_win);
    cfg.rounds_per_half = j.value("roundsPerHalf", cfg.rounds_per_half);
    cfg.max_rounds = j.value("maxRounds", cfg.max_rounds);
    cfg.overtime_money = j.value("overtimeMoney", cfg.overtime_money);

    if (j.contains("phaseDurations")) {
      auto &pd = j["phaseDurations"];
      cfg.buy_seconds = pd.value("BUY_PHASE", cfg.buy_seconds);
      cfg.strategy_seconds = pd.value("STRATEGY_PHASE", cfg.strategy_seconds);
      cfg.live_seconds = pd.value("LIVE_PHASE", cfg.live_seconds);
      cfg.post_plant_seconds = pd.value("POST_PLANT", cfg.post_plant_seconds);
      cfg.round_end_seconds = pd.value("ROUND_END", cfg.round_end_seconds);
    }

    // "teams": [[{stats}, ... x5], [{stats}, ... x5]]
    if (j.contains("teams")) {
      auto &teams = j["teams"];
      for (size_t t = 0; t < teams.size() && t < (size_t)TEAM_COUNT; t++) {
        for (size_t i = 0; i < teams[t].size() && i < (size_t)SQUAD_SIZE;
             i++) {
          auto &s = teams[t][i];
          Attributes &a = cfg.profiles[t][i];
          a.acc = read_stat(s, "ACC", a.acc);
          a.rea = read_stat(s, "REA", a.rea);
          a.spd = read_stat(s, "SPD", a.spd);
          a.stl = read_stat(s, "STL", a.stl);
          a.awr = read_stat(s, "AWR", a.awr);
          a.rcl = read_stat(s, "RCL", a.rcl);
          a.cmp = read_stat(s, "CMP", a.cmp);
          a.clt = read_stat(s, "CLT", a.clt);
          a.utl = read_stat(s, "UTL", a.utl);
          a.twk = read_stat(s, "TWK", a.twk);
        }
      }
    }

    if (cfg.rounds_to_win <= 0 || cfg.max_rounds < cfg.rounds_to_win) {
      error = "invalid round limits";
      return false;
    }

    out = cfg;
    return true;
  } catch (json::exception &e) {
    error = std::string("config JSON error: ") + e.what();
    return false;
  }
}

} // namespace breach
