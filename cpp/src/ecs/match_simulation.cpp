#include "match_simulation.h"
#include "breach_systems.h"
#include "../sim/stat_formulas.h"
#include <utility>

namespace breach {

MatchSimulation::MatchSimulation(std::shared_ptr<const MapData> map,
                                 std::shared_ptr<const Pathfinder> nav,
                                 const MatchConfig &config)
    : config_(config), map_(std::move(map)), nav_(std::move(nav)) {
  if (!map_)
    map_ = std::make_shared<const MapData>();
  if (!nav_)
    nav_ = std::make_shared<const Pathfinder>(map_->width, map_->height,
                                              map_->walls);

  register_breach_components(ecs_);
  register_all_systems(ecs_);

  ecs_.set<Arena>({map_, nav_, config_.tick_seconds});
  ecs_.set<SeededRng>(SeededRng(config_.seed));

  spawn_units();
  start_round(true);
}

void MatchSimulation::spawn_units() {
  flecs::entity_t ids[TEAM_COUNT][SQUAD_SIZE];
  for (int t = 0; t < TEAM_COUNT; t++) {
    for (int i = 0; i < SQUAD_SIZE; i++) {
      flecs::entity e =
          ecs_.entity()
              .set<Position>({0.0f, 0.0f})
              .set<Facing>({0.0f})
              .set<Squad>({(uint8_t)t, (uint8_t)i,
                           t == 0 ? SIDE_ATTACKER : SIDE_DEFENDER})
              .set<Health>({100.0f})
              .set<Attributes>(config_.profiles[t][i])
              .set<Loadout>(default_loadout())
              .set<Waypoints>(Waypoints{})
              .set<Vision>({0})
              .set<CombatState>({false, false, -1, 0})
              .set<ObjectiveAction>({ACTION_NONE, 0.0f})
              .add<IsAlive>();
      ids[t][i] = e.id();
    }
  }

  Roster &roster = ecs_.ensure<Roster>();
  for (int t = 0; t < TEAM_COUNT; t++)
    for (int i = 0; i < SQUAD_SIZE; i++)
      roster.units[t][i] = ids[t][i];
}

Rect MatchSimulation::spawn_zone(Side side) const {
  return side == SIDE_ATTACKER ? map_->attacker_spawn : map_->defender_spawn;
}

flecs::entity MatchSimulation::unit(int team, int index) const {
  return unit_at(ecs_, team, index);
}

void MatchSimulation::start_round(bool reset_all_loadouts) {
  Side sides[TEAM_COUNT];
  {
    RoundState &rs = ecs_.ensure<RoundState>();
    rs.phase = PHASE_BUY;
    rs.tick = 0;
    rs.time = 0.0f;
    rs.bomb_planted = false;
    rs.bomb_defused = false;
    rs.bomb_exploded = false;
    rs.bomb_pos = {0.0f, 0.0f};
    rs.bomb_site = NO_SITE;
    rs.bomb_timer = 0.0f;
    rs.bomb_fuse = config_.post_plant_seconds;
    rs.winner = SIDE_NONE;
    sides[0] = rs.team_side[0];
    sides[1] = rs.team_side[1];
  }

  commands_.clear_all();
  for (auto &team_plans : plans_)
    for (std::vector<Vec2> &p : team_plans)
      p.clear();
  ecs_.ensure<UtilityField>().effects.clear();
  ecs_.ensure<KillLog>().kills.clear();
  ecs_.ensure<TickEvents>().events.clear();

  for (int t = 0; t < TEAM_COUNT; t++) {
    Side side = sides[t];
    Rect zone = spawn_zone(side);

    for (int i = 0; i < SQUAD_SIZE; i++) {
      flecs::entity e = unit(t, i);
      bool survived = e.has<IsAlive>();
      if (!survived || reset_all_loadouts)
        e.set<Loadout>(default_loadout());

      Position p;
      p.x = zone.x + zone.width * 0.2f +
            zone.width * 0.6f * ((float)i / (float)(SQUAD_SIZE - 1));
      p.z = zone.z + zone.height * 0.5f;

      e.set<Position>(p)
          .set<Facing>({side == SIDE_ATTACKER ? 0.0f : PI})
          .set<Squad>({(uint8_t)t, (uint8_t)i, side})
          .set<Health>({100.0f})
          .set<Waypoints>(Waypoints{})
          .set<Vision>({0})
          .set<CombatState>({false, false, -1, 0})
          .set<ObjectiveAction>({ACTION_NONE, 0.0f});
      e.remove<Blinded>();
      e.add<IsAlive>();

      if (side == SIDE_ATTACKER && i == 0)
        e.add<BombCarrier>();
      else
        e.remove<BombCarrier>();
    }
  }
}

void MatchSimulation::set_phase(Phase phase) {
  ecs_.ensure<RoundState>().phase = phase;
}

void MatchSimulation::swap_sides() {
  RoundState &rs = ecs_.ensure<RoundState>();
  rs.team_side[0] = opposite(rs.team_side[0]);
  rs.team_side[1] = opposite(rs.team_side[1]);
}

// ═════════════════════════════════════════════════════════════
// TICK
//
// 1. advance the clock
// 2. execute commands whose radio delay has elapsed
// 3. run the flecs pipeline (movement .. round end check)
// 4. switch to POST_PLANT at the boundary if the bomb went down
// ═════════════════════════════════════════════════════════════
void MatchSimulation::tick() {
  float now;
  {
    RoundState &rs = ecs_.ensure<RoundState>();
    if (rs.phase != PHASE_LIVE && rs.phase != PHASE_POST_PLANT)
      return;
    if (rs.winner != SIDE_NONE)
      return;
    rs.tick++;
    rs.time += config_.tick_seconds;
    now = rs.time;
  }

  ecs_.ensure<TickEvents>().events.clear();

  for (const Command &cmd : commands_.drain_ready(now))
    execute_command(cmd);

  ecs_.progress(config_.tick_seconds);

  RoundState &rs = ecs_.ensure<RoundState>();
  if (rs.bomb_planted && rs.phase == PHASE_LIVE)
    rs.phase = PHASE_POST_PLANT;
}

bool MatchSimulation::issue_command(int team, int index, CommandType type,
                                    const CommandOptions &options) {
  flecs::entity u = unit(team, index);
  if (!is_alive(u))
    return false;

  float now = ecs_.get<RoundState>().time;
  bool in_combat = u.get<CombatState>().in_combat;
  return commands_.issue(type, team, index, now, in_combat, options,
                         ecs_.ensure<SeededRng>());
}

void MatchSimulation::assign_path(flecs::entity u, const Vec2 &target) {
  Vec2 from = to_vec(u.get<Position>());
  std::vector<Vec2> path = nav_->find_path(from, target);

  Waypoints &wp = u.ensure<Waypoints>();
  if (path.size() > 1) {
    waypoints_assign(wp, path, 1);
  } else {
    // No route (blocked or off-grid end): walk straight at it
    wp.count = 1;
    wp.points[0] = target;
  }
}

// ═════════════════════════════════════════════════════════════
// STRATEGY PLANS
// ═════════════════════════════════════════════════════════════

bool MatchSimulation::set_plan(int team, int index,
                               const std::vector<Vec2> &points) {
  flecs::entity u = unit(team, index);
  if (!is_alive(u))
    return false;
  if (points.size() > (size_t)MAX_PLAN_POINTS)
    return false;
  plans_[team][index] = points;
  return true;
}

const std::vector<Vec2> &MatchSimulation::plan(int team, int index) const {
  static const std::vector<Vec2> none;
  if (team < 0 || team >= TEAM_COUNT || index < 0 || index >= SQUAD_SIZE)
    return none;
  return plans_[team][index];
}

void MatchSimulation::apply_plans() {
  for (int t = 0; t < TEAM_COUNT; t++) {
    for (int i = 0; i < SQUAD_SIZE; i++) {
      std::vector<Vec2> stops = std::move(plans_[t][i]);
      plans_[t][i].clear();

      flecs::entity u = unit(t, i);
      if (stops.empty() || !is_alive(u))
        continue;

      // Chain one routed leg per stop. Unroutable legs go straight.
      Vec2 from = to_vec(u.get<Position>());
      std::vector<Vec2> route = {from};
      for (const Vec2 &stop : stops) {
        std::vector<Vec2> leg = nav_->find_path(from, stop);
        if (leg.size() > 1)
          route.insert(route.end(), leg.begin() + 1, leg.end());
        else
          route.push_back(stop);
        from = stop;
      }
      waypoints_assign(u.ensure<Waypoints>(), route, 1);
    }
  }
}

void MatchSimulation::execute_command(const Command &cmd) {
  flecs::entity u = unit(cmd.team, cmd.unit);
  if (!is_alive(u))
    return;

  if (is_movement_command(cmd.type))
    u.ensure<ObjectiveAction>() = ObjectiveAction{ACTION_NONE, 0.0f};

  const RoundState &rs = ecs_.get<RoundState>();
  Squad sq = u.get<Squad>();

  switch (cmd.type) {
  case CMD_MOVE:
  case CMD_RUSH:
    if (cmd.has_target)
      assign_path(u, cmd.target);
    break;

  case CMD_HOLD:
    u.ensure<Waypoints>().count = 0;
    break;

  case CMD_RETREAT:
    assign_path(u, rect_center(spawn_zone(sq.side)));
    break;

  case CMD_REGROUP: {
    Vec2 from = to_vec(u.get<Position>());
    int nearest = -1;
    float best = 0.0f;
    for (int i = 0; i < SQUAD_SIZE; i++) {
      if (i == sq.index)
        continue;
      flecs::entity ally = unit(sq.team, i);
      if (!is_alive(ally))
        continue;
      float d = distance(from, to_vec(ally.get<Position>()));
      if (nearest < 0 || d < best) {
        nearest = i;
        best = d;
      }
    }
    if (nearest >= 0)
      assign_path(u, to_vec(unit(sq.team, nearest).get<Position>()));
    break;
  }

  case CMD_PLANT:
    if (u.has<BombCarrier>() && !rs.bomb_planted) {
      u.ensure<Waypoints>().count = 0;
      u.ensure<ObjectiveAction>() = ObjectiveAction{ACTION_PLANT, 0.0f};
    }
    break;

  case CMD_DEFUSE:
    if (sq.side == SIDE_DEFENDER && rs.bomb_planted && !rs.bomb_defused &&
        !rs.bomb_exploded) {
      u.ensure<Waypoints>().count = 0;
      u.ensure<ObjectiveAction>() = ObjectiveAction{ACTION_DEFUSE, 0.0f};
    }
    break;

  case CMD_USE_UTILITY: {
    if (!cmd.has_target)
      break;
    bool had_item;
    {
      Loadout &lo = u.ensure<Loadout>();
      had_item = loadout_take_utility(lo, cmd.utility);
    }
    if (had_item)
      throw_utility(ecs_, cmd.utility, cmd.target, cmd.team, cmd.unit);
    break;
  }
  }
}

// ═════════════════════════════════════════════════════════════
// FOG OF WAR
// ═════════════════════════════════════════════════════════════

FilteredState MatchSimulation::project_for_team(int team) const {
  FilteredState out;
  if (team < 0 || team >= TEAM_COUNT)
    return out;

  const RoundState &rs = ecs_.get<RoundState>();
  out.tick = rs.tick;
  out.phase = rs.phase;
  out.team = team;
  out.side = rs.team_side[team];
  out.bomb_planted = rs.bomb_planted;
  if (rs.bomb_planted) {
    out.bomb_pos = rs.bomb_pos;
    out.bomb_site = rs.bomb_site;
    out.bomb_timer = rs.bomb_timer;
  }

  uint8_t visible = 0;
  for (int i = 0; i < SQUAD_SIZE; i++) {
    flecs::entity e = unit(team, i);
    const Waypoints &wp = e.get<Waypoints>();
    const CombatState &cs = e.get<CombatState>();
    const ObjectiveAction &action = e.get<ObjectiveAction>();

    UnitSnapshot s;
    s.index = (uint8_t)i;
    s.side = e.get<Squad>().side;
    s.pos = to_vec(e.get<Position>());
    s.facing = e.get<Facing>().angle;
    s.health = e.get<Health>().hp;
    s.alive = e.has<IsAlive>();
    s.stats = e.get<Attributes>();
    s.reaction_ms = reaction_time_ms(s.stats.rea, 0.5);
    s.loadout = e.get<Loadout>();
    s.waypoints.assign(wp.points, wp.points + wp.count);
    s.detected = e.get<Vision>().detected;
    s.in_combat = cs.in_combat;
    s.moving = cs.moving;
    s.target = cs.target;
    s.blinded = e.has<Blinded>();
    s.has_bomb = e.has<BombCarrier>();
    s.action = action.kind;
    s.action_progress = action.progress;
    out.own.push_back(s);

    if (s.alive)
      visible |= s.detected;
  }

  for (int j = 0; j < SQUAD_SIZE; j++) {
    if (!(visible & (1u << j)))
      continue;
    flecs::entity e = unit(1 - team, j);
    const CombatState &cs = e.get<CombatState>();
    ActionKind kind = e.get<ObjectiveAction>().kind;

    EnemySnapshot s;
    s.index = (uint8_t)j;
    s.pos = to_vec(e.get<Position>());
    s.facing = e.get<Facing>().angle;
    s.health = e.get<Health>().hp;
    s.alive = e.has<IsAlive>();
    s.weapon = e.get<Loadout>().weapon;
    s.moving = cs.moving;
    s.in_combat = cs.in_combat;
    s.planting = kind == ACTION_PLANT;
    s.defusing = kind == ACTION_DEFUSE;
    out.enemies.push_back(s);
  }
  return out;
}

const std::vector<SimEvent> &MatchSimulation::tick_events() const {
  return ecs_.get<TickEvents>().events;
}

const std::vector<KillRecord> &MatchSimulation::kill_log() const {
  return ecs_.get<KillLog>().kills;
}

const RoundState &MatchSimulation::round_state() const {
  return ecs_.get<RoundState>();
}

} // namespace breach
