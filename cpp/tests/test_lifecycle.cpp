// ═════════════════════════════════════════════════════════════
// Category 7: MATCH LIFECYCLE, BUY SERVICE & DATA LOADING
// ═════════════════════════════════════════════════════════════

struct LifecycleHarness {
  std::shared_ptr<MapData> map;
  MatchConfig config;
  std::unique_ptr<MatchLifecycle> match;

  LifecycleHarness() {
    map = make_test_arena();
    config.seed = 2024;
    rebuild();
  }

  void rebuild() {
    auto nav = std::make_shared<const Pathfinder>(map->width, map->height,
                                                  map->walls);
    match.reset(new MatchLifecycle(map, nav, config));
  }

  MatchSimulation &sim() { return match->simulation(); }

  void to_live() {
    if (match->phase() == PHASE_BUY)
      match->advance(config.buy_seconds);
    if (match->phase() == PHASE_STRATEGY)
      match->advance(config.strategy_seconds);
  }

  // Play one round to a verdict for `team` and roll into the next BUY.
  void win_round(int team) {
    to_live();
    match->end_round(match->side_of(team));
    if (match->phase() == PHASE_ROUND_END)
      match->advance(config.round_end_seconds);
  }
};

TEST_CASE_FIXTURE(LifecycleHarness, "Cat7: Phases run BUY, STRATEGY, LIVE") {
  CHECK(match->phase() == PHASE_BUY);
  CHECK(match->round() == 1);
  CHECK(match->time_remaining() == doctest::Approx(20.0f));
  CHECK(match->economy(0).money == 800);
  CHECK(match->side_of(0) == SIDE_ATTACKER);

  match->advance(19.0f);
  CHECK(match->phase() == PHASE_BUY);
  CHECK(match->time_remaining() == doctest::Approx(1.0f));
  match->advance(1.0f);
  CHECK(match->phase() == PHASE_STRATEGY);
  CHECK(match->time_remaining() == doctest::Approx(15.0f));

  match->advance(15.0f);
  CHECK(match->phase() == PHASE_LIVE);
  CHECK(sim().round_state().tick == 0);

  // Fixed-rate ticks from a variable frame time
  match->advance(0.1f);
  CHECK(sim().round_state().tick == 0);
  match->advance(0.1f);
  CHECK(sim().round_state().tick == 1);
  match->advance(1.0f);
  CHECK(sim().round_state().tick == 6);
  CHECK(match->time_remaining() == doctest::Approx(105.0f - 1.2f));
}

TEST_CASE_FIXTURE(LifecycleHarness, "Cat7: Running out the clock goes to "
                                    "the defenders") {
  to_live();
  for (int i = 0; i < 200 && match->phase() == PHASE_LIVE; i++)
    match->advance(1.0f);

  CHECK(match->phase() == PHASE_ROUND_END);
  CHECK(sim().round_state().tick == 525);
  REQUIRE(match->results().size() == 1);
  const RoundResult &r = match->results()[0];
  CHECK(r.winner_side == SIDE_DEFENDER);
  CHECK(r.winner_team == 1);
  CHECK_FALSE(r.bomb_planted);
  CHECK(match->score(0) == 0);
  CHECK(match->score(1) == 1);
  CHECK(match->economy(0).money == 800 + 1400);
  CHECK(match->economy(1).money == 800 + 3250);
  CHECK(match->economy(0).loss_streak == 1);

  match->advance(5.0f);
  CHECK(match->phase() == PHASE_BUY);
  CHECK(match->round() == 2);
}

TEST_CASE_FIXTURE(LifecycleHarness, "Cat7: Orders only during live play") {
  CommandOptions opts;
  opts.has_target = true;
  opts.target = {600.0f, 700.0f};
  CHECK_FALSE(match->issue_command(0, 0, CMD_MOVE, opts));

  to_live();
  CHECK(match->issue_command(0, 0, CMD_MOVE, opts));

  for (int i = 0; i < 20; i++)
    match->advance(0.2f);
  Vec2 pos = to_vec(sim().unit(0, 0).get<Position>());
  CHECK(pos.x > 160.0f); // Walked off the spawn point
}

TEST_CASE_FIXTURE(LifecycleHarness, "Cat7: Both teams ready ends the phase "
                                     "early") {
  CHECK_FALSE(match->set_ready(2));

  CHECK(match->set_ready(0));
  CHECK(match->is_ready(0));
  CHECK(match->phase() == PHASE_BUY);
  CHECK(match->set_ready(0)); // Repeats are harmless
  CHECK(match->phase() == PHASE_BUY);

  CHECK(match->set_ready(1));
  CHECK(match->phase() == PHASE_STRATEGY);
  CHECK(match->time_remaining() == doctest::Approx(15.0f));
  CHECK_FALSE(match->is_ready(0));
  CHECK_FALSE(match->is_ready(1));

  CHECK(match->set_ready(1));
  CHECK(match->phase() == PHASE_STRATEGY);
  CHECK(match->set_ready(0));
  CHECK(match->phase() == PHASE_LIVE);
  CHECK(match->time_remaining() == doctest::Approx(105.0f));

  CHECK_FALSE(match->set_ready(0));
  CHECK_FALSE(match->is_ready(0));
}

TEST_CASE_FIXTURE(LifecycleHarness, "Cat7: Strategy plans start moving at "
                                     "live") {
  std::vector<Vec2> stops = {{600.0f, 300.0f}, {600.0f, 900.0f}};
  CHECK_FALSE(match->submit_plan(0, 0, stops)); // Still buying

  match->advance(config.buy_seconds);
  REQUIRE(match->phase() == PHASE_STRATEGY);
  CHECK(match->submit_plan(0, 0, stops));
  CHECK(sim().plan(0, 0).size() == 2);
  CHECK_FALSE(match->submit_plan(0, 5, stops));
  CHECK_FALSE(match->submit_plan(0, 1,
                                 std::vector<Vec2>(
                                     MatchSimulation::MAX_PLAN_POINTS + 1,
                                     Vec2{500.0f, 500.0f})));
  CHECK(sim().plan(0, 1).empty());

  // Replaced wholesale
  CHECK(match->submit_plan(1, 2, std::vector<Vec2>{Vec2{2000.0f, 700.0f}}));
  CHECK(match->submit_plan(1, 2, std::vector<Vec2>{Vec2{2200.0f, 700.0f}}));
  REQUIRE(sim().plan(1, 2).size() == 1);
  CHECK(sim().plan(1, 2)[0] == Vec2{2200.0f, 700.0f});

  // Planning does not touch the units before LIVE
  CHECK(sim().unit(0, 0).get<Waypoints>().count == 0);

  match->set_ready(0);
  match->set_ready(1);
  REQUIRE(match->phase() == PHASE_LIVE);

  // Routed at once: no radio delay, nothing queued
  CHECK(sim().commands().pending_total() == 0);
  CHECK(sim().plan(0, 0).empty());
  const Waypoints &wp = sim().unit(0, 0).get<Waypoints>();
  REQUIRE(wp.count >= 2);
  CHECK(wp.points[wp.count - 1] == Vec2{600.0f, 900.0f});
  bool passes_first_stop = false;
  for (int k = 0; k < wp.count; k++)
    if (wp.points[k] == Vec2{600.0f, 300.0f})
      passes_first_stop = true;
  CHECK(passes_first_stop);
  CHECK(sim().unit(0, 1).get<Waypoints>().count == 0);
  CHECK(sim().unit(1, 2).get<Waypoints>().points[0] ==
        Vec2{2200.0f, 700.0f});

  Vec2 before = to_vec(sim().unit(0, 0).get<Position>());
  match->advance(1.0f);
  Vec2 after = to_vec(sim().unit(0, 0).get<Position>());
  CHECK(distance(before, after) > 50.0f);
}

TEST_CASE_FIXTURE(LifecycleHarness, "Cat7: Plans are used once") {
  match->advance(config.buy_seconds);
  REQUIRE(match->submit_plan(0, 3, std::vector<Vec2>{Vec2{900.0f, 900.0f}}));
  match->advance(config.strategy_seconds);
  REQUIRE(match->phase() == PHASE_LIVE);
  CHECK(sim().plan(0, 3).empty());

  match->end_round(SIDE_ATTACKER);
  match->advance(config.round_end_seconds);
  match->advance(config.buy_seconds);
  REQUIRE(match->phase() == PHASE_STRATEGY);
  CHECK(sim().plan(0, 3).empty());
  CHECK(sim().unit(0, 3).get<Waypoints>().count == 0);
}

TEST_CASE_FIXTURE(LifecycleHarness, "Cat7: Sides swap at half time") {
  // 2-2 after the first half
  win_round(0);
  win_round(1);
  win_round(0);
  {
    // Team 0 buys into round 4, then loses it
    REQUIRE(match->buy_armor(0, 2, ARMOR_LIGHT));
    win_round(1);
  }

  CHECK(match->round() == 5);
  CHECK(match->score(0) == 2);
  CHECK(match->score(1) == 2);
  CHECK(match->side_of(0) == SIDE_DEFENDER);
  CHECK(match->side_of(1) == SIDE_ATTACKER);
  CHECK(match->economy(0).money == 800);
  CHECK(match->economy(1).money == 800);
  CHECK(match->economy(0).loss_streak == 0);
  CHECK(match->economy(1).loss_streak == 0);

  // Fresh pistols, bomb moves to the new attackers
  CHECK(sim().unit(0, 2).get<Loadout>().armor == ARMOR_NONE);
  CHECK(sim().unit(1, 0).has<BombCarrier>());
  CHECK_FALSE(sim().unit(0, 0).has<BombCarrier>());
  CHECK(sim().unit(0, 0).get<Squad>().side == SIDE_DEFENDER);
  CHECK(sim().unit(0, 0).get<Position>().x > 2500.0f);
  CHECK(sim().round_state().team_of(SIDE_ATTACKER) == 1);

  for (int t = 0; t < TEAM_COUNT; t++)
    CHECK(match->economy(t).applied_updates == 4);
}

TEST_CASE_FIXTURE(LifecycleHarness, "Cat7: Overtime money at four all") {
  for (int i = 0; i < 4; i++)
    win_round(0);
  for (int i = 0; i < 4; i++)
    win_round(1);

  CHECK(match->round() == 9);
  CHECK(match->overtime());
  CHECK(match->economy(0).money == 10000);
  CHECK(match->economy(1).money == 10000);
  CHECK(match->phase() == PHASE_BUY);

  win_round(0);
  CHECK(match->phase() == PHASE_MATCH_END);
  CHECK(match->winner_team() == 0);
  CHECK(match->score(0) == 5);
  CHECK(match->score(1) == 4);
}

TEST_CASE_FIXTURE(LifecycleHarness, "Cat7: First to five ends the match") {
  for (int i = 0; i < 5; i++)
    win_round(0);

  CHECK(match->phase() == PHASE_MATCH_END);
  CHECK(match->winner_team() == 0);
  CHECK(match->round() == 5);
  CHECK_FALSE(match->overtime());
  CHECK(match->results().size() == 5);
  CHECK(match->economy(0).applied_updates == 5);
  CHECK(match->economy(1).applied_updates == 5);

  // Terminal
  match->advance(100.0f);
  match->end_round(SIDE_ATTACKER);
  match->start_next_round();
  CHECK(match->phase() == PHASE_MATCH_END);
  CHECK(match->results().size() == 5);
  CHECK(match->round() == 5);
}

TEST_CASE_FIXTURE(LifecycleHarness, "Cat7: Settlement happens once per "
                                    "round") {
  to_live();
  match->end_round(SIDE_ATTACKER);
  match->end_round(SIDE_ATTACKER); // Already in ROUND_END
  CHECK(match->results().size() == 1);
  CHECK(match->economy(0).applied_updates == 1);
  CHECK(match->score(0) == 1);

  match->end_round(SIDE_NONE);
  CHECK(match->results().size() == 1);
}

TEST_CASE_FIXTURE(LifecycleHarness, "Cat7: Kills and plants pay out") {
  to_live();
  flecs::world &w = sim().world();
  kill_unit(w, sim().unit(1, 3), 0, 1, WEAPON_SMG, false);
  kill_unit(w, sim().unit(0, 4), 1, 0, WEAPON_RIFLE, true);
  w.ensure<RoundState>().bomb_planted = true;

  match->end_round(SIDE_ATTACKER);
  REQUIRE(match->results().size() == 1);
  const RoundResult &r = match->results()[0];
  CHECK(r.kills.size() == 2);
  CHECK(r.economy[0].kill_reward == 600);
  CHECK(r.economy[0].objective_bonus == PLANT_BONUS);
  CHECK(r.economy[1].kill_reward == 300);
  CHECK(r.economy[1].round_reward == 1400);
  CHECK(match->economy(0).money == 800 + 3250 + 600 + 300);
  CHECK(match->economy(0).total_kills == 1);
}

// ─── Buy service ────────────────────────────────────────────

TEST_CASE_FIXTURE(LifecycleHarness, "Cat7: Buying rules") {
  config.starting_money = 16000;
  rebuild();
  REQUIRE(match->economy(0).money == 16000);

  SUBCASE("Weapons") {
    CHECK(match->buy_weapon(0, 0, WEAPON_RIFLE));
    CHECK(match->economy(0).money == 16000 - 2700);
    CHECK(sim().unit(0, 0).get<Loadout>().weapon == WEAPON_RIFLE);
    CHECK_FALSE(match->buy_weapon(0, 0, WEAPON_RIFLE));
    CHECK(match->buy_weapon(0, 0, WEAPON_PISTOL)); // Free swap back
    CHECK(match->economy(0).money == 16000 - 2700);
    CHECK_FALSE(match->buy_weapon(0, 0, WEAPON_PISTOL));
    CHECK_FALSE(match->buy_weapon(0, 0, WEAPON_FRAG));
  }
  SUBCASE("Armor and helmet") {
    CHECK_FALSE(match->buy_armor(0, 1, ARMOR_NONE));
    CHECK(match->buy_armor(0, 1, ARMOR_HEAVY));
    CHECK_FALSE(match->buy_armor(0, 1, ARMOR_HEAVY));
    CHECK(match->buy_helmet(0, 1));
    CHECK_FALSE(match->buy_helmet(0, 1));
    CHECK(match->economy(0).money == 16000 - 1000 - HELMET_COST);
  }
  SUBCASE("Defuse kits are defender gear") {
    CHECK_FALSE(match->buy_defuse_kit(0, 2));
    CHECK(match->buy_defuse_kit(1, 2));
    CHECK_FALSE(match->buy_defuse_kit(1, 2));
    CHECK(match->economy(1).money == 16000 - DEFUSE_KIT_COST);
  }
  SUBCASE("Four grenades at most") {
    CHECK(match->buy_utility(1, 3, UTILITY_SMOKE));
    CHECK(match->buy_utility(1, 3, UTILITY_FLASH));
    CHECK(match->buy_utility(1, 3, UTILITY_FLASH));
    CHECK(match->buy_utility(1, 3, UTILITY_MOLOTOV));
    CHECK_FALSE(match->buy_utility(1, 3, UTILITY_FRAG));
    CHECK_FALSE(match->buy_utility(1, 4, UTILITY_NONE));
    const Loadout &lo = sim().unit(1, 3).get<Loadout>();
    CHECK(lo.utility_count == 4);
    CHECK(lo.utility[3] == UTILITY_MOLOTOV);
  }
  SUBCASE("Nothing outside BUY or for the dead") {
    kill_unit(sim().world(), sim().unit(0, 4), 1, 0, WEAPON_PISTOL, false);
    CHECK_FALSE(match->buy_helmet(0, 4));
    to_live();
    CHECK_FALSE(match->buy_helmet(0, 3));
    CHECK(match->economy(0).money == 16000);
  }
}

TEST_CASE_FIXTURE(LifecycleHarness, "Cat7: No credit") {
  CHECK_FALSE(match->buy_weapon(0, 0, WEAPON_AWP));
  CHECK(match->economy(0).money == 800);
  CHECK(match->buy_weapon(0, 0, WEAPON_PISTOL) == false); // Already held
  CHECK(match->buy_armor(0, 0, ARMOR_LIGHT));
  CHECK(match->buy_armor(0, 1, ARMOR_LIGHT));
  CHECK_FALSE(match->buy_helmet(0, 2));
  CHECK(match->economy(0).money == 0);
}

TEST_CASE_FIXTURE(LifecycleHarness, "Cat7: Survivors keep their gear") {
  REQUIRE(match->buy_armor(0, 1, ARMOR_LIGHT));
  REQUIRE(match->buy_armor(0, 2, ARMOR_LIGHT));
  win_round(0);

  CHECK(sim().unit(0, 1).get<Loadout>().armor == ARMOR_LIGHT);
  CHECK(sim().unit(0, 2).get<Loadout>().armor == ARMOR_LIGHT);

  // Die with it, lose it
  to_live();
  kill_unit(sim().world(), sim().unit(0, 2), 1, 0, WEAPON_RIFLE, false);
  match->end_round(SIDE_ATTACKER);
  match->advance(config.round_end_seconds);

  CHECK(match->round() == 3);
  CHECK(sim().unit(0, 1).get<Loadout>().armor == ARMOR_LIGHT);
  CHECK(sim().unit(0, 2).get<Loadout>().armor == ARMOR_NONE);
  CHECK(sim().unit(0, 2).has<IsAlive>());
  CHECK(sim().unit(0, 2).get<Health>().hp == doctest::Approx(100.0f));
}

// ─── Determinism ────────────────────────────────────────────

static void check_same_kills(const std::vector<KillRecord> &a,
                             const std::vector<KillRecord> &b) {
  REQUIRE(a.size() == b.size());
  for (size_t k = 0; k < a.size(); k++) {
    CHECK(a[k].killer_team == b[k].killer_team);
    CHECK(a[k].killer_index == b[k].killer_index);
    CHECK(a[k].victim_team == b[k].victim_team);
    CHECK(a[k].victim_index == b[k].victim_index);
    CHECK(a[k].weapon == b[k].weapon);
    CHECK(a[k].headshot == b[k].headshot);
    CHECK(a[k].tick == b[k].tick);
  }
}

static void check_same_events(const std::vector<SimEvent> &a,
                              const std::vector<SimEvent> &b) {
  REQUIRE(a.size() == b.size());
  for (size_t k = 0; k < a.size(); k++) {
    CHECK(a[k].type == b[k].type);
    CHECK(a[k].tick == b[k].tick);
    CHECK(a[k].actor_team == b[k].actor_team);
    CHECK(a[k].actor_index == b[k].actor_index);
    CHECK(a[k].target_team == b[k].target_team);
    CHECK(a[k].target_index == b[k].target_index);
    CHECK(a[k].weapon == b[k].weapon);
    CHECK(a[k].location == b[k].location);
    CHECK(a[k].headshot == b[k].headshot);
    CHECK(a[k].damage == b[k].damage);
    CHECK(a[k].pos == b[k].pos);
    CHECK(a[k].direction == b[k].direction);
    CHECK(a[k].site == b[k].site);
    CHECK(a[k].utility == b[k].utility);
    CHECK(a[k].effect_id == b[k].effect_id);
  }
}

static void check_same_unit(flecs::entity a, flecs::entity b) {
  CHECK(a.get<Position>().x == b.get<Position>().x);
  CHECK(a.get<Position>().z == b.get<Position>().z);
  CHECK(a.get<Facing>().angle == b.get<Facing>().angle);
  CHECK(a.get<Health>().hp == b.get<Health>().hp);
  CHECK(a.has<IsAlive>() == b.has<IsAlive>());
  CHECK(a.has<BombCarrier>() == b.has<BombCarrier>());
  CHECK(a.get<Vision>().detected == b.get<Vision>().detected);

  const CombatState &ca = a.get<CombatState>();
  const CombatState &cb = b.get<CombatState>();
  CHECK(ca.in_combat == cb.in_combat);
  CHECK(ca.moving == cb.moving);
  CHECK(ca.target == cb.target);
  CHECK(ca.shots_fired == cb.shots_fired);

  const Loadout &la = a.get<Loadout>();
  const Loadout &lb = b.get<Loadout>();
  CHECK(la.weapon == lb.weapon);
  CHECK(la.armor == lb.armor);
  CHECK(la.helmet == lb.helmet);
  CHECK(la.defuse_kit == lb.defuse_kit);
  REQUIRE(la.utility_count == lb.utility_count);
  for (int k = 0; k < la.utility_count; k++)
    CHECK(la.utility[k] == lb.utility[k]);

  const Waypoints &wa = a.get<Waypoints>();
  const Waypoints &wb = b.get<Waypoints>();
  REQUIRE(wa.count == wb.count);
  for (int k = 0; k < wa.count; k++)
    CHECK(wa.points[k] == wb.points[k]);

  CHECK(a.get<ObjectiveAction>().kind == b.get<ObjectiveAction>().kind);
  CHECK(a.get<ObjectiveAction>().progress ==
        b.get<ObjectiveAction>().progress);
  REQUIRE(a.has<Blinded>() == b.has<Blinded>());
  if (a.has<Blinded>())
    CHECK(a.get<Blinded>().remaining == b.get<Blinded>().remaining);
}

TEST_CASE("Cat7: Same seed and orders replay identically") {
  LifecycleHarness a;
  LifecycleHarness b;

  for (LifecycleHarness *h : {&a, &b}) {
    h->to_live();
    CommandOptions opts;
    opts.has_target = true;
    for (int i = 0; i < SQUAD_SIZE; i++) {
      opts.target = {1450.0f, 300.0f + 200.0f * (float)i};
      REQUIRE(h->match->issue_command(0, i, CMD_RUSH, opts));
      REQUIRE(h->match->issue_command(1, i, CMD_MOVE, opts));
    }
  }

  size_t events_seen = 0;
  for (int frame = 0; frame < 400; frame++) {
    a.match->advance(0.05f);
    b.match->advance(0.05f);
    REQUIRE(a.sim().round_state().tick == b.sim().round_state().tick);
    check_same_events(a.sim().tick_events(), b.sim().tick_events());
    check_same_kills(a.sim().kill_log(), b.sim().kill_log());
    events_seen += a.sim().tick_events().size();
  }
  CHECK(events_seen > 0);

  CHECK(a.match->phase() == b.match->phase());
  REQUIRE(a.match->results().size() == b.match->results().size());
  for (size_t r = 0; r < a.match->results().size(); r++) {
    const RoundResult &ra = a.match->results()[r];
    const RoundResult &rb = b.match->results()[r];
    CHECK(ra.winner_side == rb.winner_side);
    check_same_kills(ra.kills, rb.kills);
    for (int t = 0; t < TEAM_COUNT; t++)
      CHECK(ra.economy[t].new_money == rb.economy[t].new_money);
  }

  for (int t = 0; t < TEAM_COUNT; t++)
    for (int i = 0; i < SQUAD_SIZE; i++)
      check_same_unit(a.sim().unit(t, i), b.sim().unit(t, i));
  CHECK(count_invariant_violations(a.sim().world()) == 0);
}

// ─── Data loading ───────────────────────────────────────────

TEST_CASE("Cat7: Map JSON parsing") {
  const char *good = R"({
    "name": "Yard",
    "dimensions": {"width": 1200, "height": 800},
    "spawnZones": {"attacker": {"x": 10, "z": 10, "width": 100, "height": 100}},
    "bombSites": [{"id": "B",
                   "zone": {"x": 500, "z": 300, "width": 200, "height": 200},
                   "plantZone": {"x": 550, "z": 350, "width": 100, "height": 100}}],
    "walls": [{"x": 300, "z": 0, "width": 20, "height": 500}]
  })";

  MapData map;
  std::string error;
  REQUIRE(parse_map_json(good, map, error));
  CHECK(map.name == "Yard");
  CHECK(map.theme == "desert");
  CHECK(map.width == doctest::Approx(1200.0f));
  CHECK(map.attacker_spawn.width == doctest::Approx(100.0f));
  CHECK(map.defender_spawn.x == doctest::Approx(2550.0f)); // Default kept
  REQUIRE(map.bomb_sites.size() == 1);
  CHECK(map.bomb_sites[0].id == 'B');
  CHECK(plant_zone_at(map, {600.0f, 400.0f}) == 'B');
  CHECK(plant_zone_at(map, {520.0f, 320.0f}) == NO_SITE);
  CHECK(is_on_bomb_site(map, {520.0f, 320.0f}));
  REQUIRE(map.walls.size() == 1);

  SUBCASE("Missing dimensions") {
    MapData untouched;
    untouched.name = "keep";
    CHECK_FALSE(parse_map_json(R"({"name": "x"})", untouched, error));
    CHECK_FALSE(error.empty());
    CHECK(untouched.name == "keep");
  }
  SUBCASE("Malformed text") {
    error.clear();
    CHECK_FALSE(parse_map_json("{ not json", map, error));
    CHECK_FALSE(error.empty());
    CHECK(map.name == "Yard");
  }
  SUBCASE("Empty site id") {
    CHECK_FALSE(parse_map_json(
        R"({"dimensions": {"width": 10, "height": 10},
            "bombSites": [{"id": "", "zone": {}, "plantZone": {}}]})",
        map, error));
  }
  SUBCASE("Walls without area") {
    error.clear();
    CHECK_FALSE(parse_map_json(
        R"({"dimensions": {"width": 1000, "height": 1000},
            "walls": [{"x": 500, "z": 0, "height": 1000}]})",
        map, error));
    CHECK(error.find("wall 0") != std::string::npos);
    CHECK(map.walls.size() == 1);
  }
}

TEST_CASE("Cat7: Match config overlay") {
  MatchConfig cfg;
  std::string error;
  const char *text = R"({
    "seed": 77,
    "roundsToWin": 3,
    "maxRounds": 5,
    "phaseDurations": {"BUY_PHASE": 10},
    "teams": [[{"ACC": 150, "AWR": 0}]]
  })";

  REQUIRE(parse_match_config_json(text, cfg, error));
  CHECK(cfg.seed == 77);
  CHECK(cfg.rounds_to_win == 3);
  CHECK(cfg.max_rounds == 5);
  CHECK(cfg.buy_seconds == doctest::Approx(10.0f));
  CHECK(cfg.strategy_seconds == doctest::Approx(15.0f));
  CHECK(cfg.profiles[0][0].acc == 100);
  CHECK(cfg.profiles[0][0].awr == 1);
  CHECK(cfg.profiles[0][0].rea == default_profile(0).rea);
  CHECK(cfg.profiles[0][1].acc == default_profile(1).acc);

  MatchConfig before = cfg;
  CHECK_FALSE(parse_match_config_json(R"({"roundsToWin": 6, "maxRounds": 5})",
                                      cfg, error));
  CHECK(cfg.rounds_to_win == before.rounds_to_win);
  CHECK_FALSE(parse_match_config_json("[1, 2", cfg, error));
}

TEST_CASE("Cat7: Shipped config matches the defaults") {
  std::string text = read_data_file("match_config.json");
  REQUIRE_FALSE(text.empty());

  MatchConfig cfg;
  std::string error;
  REQUIRE(parse_match_config_json(text, cfg, error));
  MatchConfig stock;
  CHECK(cfg.rounds_to_win == stock.rounds_to_win);
  CHECK(cfg.rounds_per_half == stock.rounds_per_half);
  CHECK(cfg.max_rounds == stock.max_rounds);
  CHECK(cfg.starting_money == stock.starting_money);
  CHECK(cfg.live_seconds == doctest::Approx(stock.live_seconds));
  CHECK(cfg.post_plant_seconds == doctest::Approx(stock.post_plant_seconds));
  CHECK(cfg.profiles[1][3].stl == default_profile(3).stl);
}
