#ifndef BREACH_WORLD_MANAGER_H
#define BREACH_WORLD_MANAGER_H

#include "../sim/map_data.h"
#include "../sim/match_config.h"
#include "../sim/pathfinder.h"
#include "match_lifecycle.h"
#include <godot_cpp/classes/node.hpp>
#include <godot_cpp/variant/array.hpp>
#include <godot_cpp/variant/dictionary.hpp>
#include <godot_cpp/variant/packed_float32_array.hpp>
#include <godot_cpp/variant/packed_vector2_array.hpp>
#include <godot_cpp/variant/string.hpp>
#include <memory>

namespace godot {

class BreachServer : public Node {
  GDCLASS(BreachServer, Node)

private:
  breach::MatchConfig config;
  std::shared_ptr<const breach::MapData> map;
  std::shared_ptr<const breach::Pathfinder> nav;
  std::unique_ptr<breach::MatchLifecycle> match;

  // Transition logging
  breach::Phase last_phase = breach::PHASE_BUY;
  size_t logged_results = 0;

  PackedFloat32Array unit_buffer;
  int unit_count = 0;

protected:
  static void _bind_methods();

public:
  BreachServer();
  ~BreachServer();

  void _ready() override;
  void _process(double delta) override;

  void init_defaults();

  // --- GDScript API ---
  bool load_map(const String &path);
  bool load_config(const String &path);
  void start_match(int seed);

  bool issue_command(int team, int unit, const String &type, float x, float z,
                     const String &utility);
  bool buy(int team, int unit, const String &item);
  bool submit_plan(int team, int unit, const PackedVector2Array &points);
  bool set_ready(int team);

  String get_phase() const;
  float get_time_remaining() const;
  Dictionary get_score() const;
  Dictionary get_filtered_state(int team) const;
  Array get_tick_events() const;
  PackedFloat32Array get_unit_buffer(int team);
  int get_unit_count() const;

private:
  void log_transitions();
};

} // namespace godot

#endif // BREACH_WORLD_MANAGER_H
