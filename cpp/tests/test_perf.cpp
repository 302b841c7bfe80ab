// ═════════════════════════════════════════════════════════════
// Category 6: PERFORMANCE: Regression Bounds
// ═════════════════════════════════════════════════════════════
#include <chrono>

TEST_CASE_FIXTURE(MatchTestHarness, "Cat6: 100 brawl ticks under 100ms") {
  go_live();
  for (int i = 0; i < SQUAD_SIZE; i++) {
    place(0, i, 1100.0f, 300.0f + 150.0f * (float)i, 0.0f);
    place(1, i, 1400.0f, 300.0f + 150.0f * (float)i, PI);
  }
  throw_utility(ecs(), UTILITY_SMOKE, {1250.0f, 1200.0f}, 0, 4);
  throw_utility(ecs(), UTILITY_MOLOTOV, {1250.0f, 100.0f}, 1, 4);

  // Warmup: build flecs tables and caches
  step(1);

  auto start = std::chrono::high_resolution_clock::now();
  step(100);
  auto end = std::chrono::high_resolution_clock::now();

  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start)
                .count();

  MESSAGE("100 ticks: ", ms, "ms");
  CHECK(ms < 100);
}

TEST_CASE_FIXTURE(MatchTestHarness, "Cat6: 2K fog projections under 100ms") {
  go_live();
  set_vision(0, 0, 0x1F);
  set_vision(1, 0, 0x1F);

  size_t seen = 0;
  auto start = std::chrono::high_resolution_clock::now();
  for (int i = 0; i < 1000; i++) {
    seen += sim->project_for_team(0).enemies.size();
    seen += sim->project_for_team(1).enemies.size();
  }
  auto end = std::chrono::high_resolution_clock::now();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start)
                .count();

  MESSAGE("2K projections: ", ms, "ms");
  CHECK(seen == 10000);
  CHECK(ms < 100);
}

TEST_CASE("Cat6: Cross-map paths on Bazaar under 20ms each") {
  auto map = load_bazaar();
  REQUIRE(map);
  Pathfinder nav(map->width, map->height, map->walls);

  Vec2 spawns[2] = {rect_center(map->attacker_spawn),
                    rect_center(map->defender_spawn)};

  auto start = std::chrono::high_resolution_clock::now();
  int found = 0;
  for (int i = 0; i < 10; i++) {
    for (const BombSite &site : map->bomb_sites) {
      if (!nav.find_path(spawns[i % 2], rect_center(site.plant_zone)).empty())
        found++;
    }
  }
  auto end = std::chrono::high_resolution_clock::now();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start)
                .count();

  MESSAGE("20 Bazaar paths: ", ms, "ms");
  CHECK(found == 20);
  CHECK(ms < 400);
}
