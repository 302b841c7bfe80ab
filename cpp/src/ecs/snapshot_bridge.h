#ifndef BREACH_SNAPSHOT_BRIDGE_H
#define BREACH_SNAPSHOT_BRIDGE_H

#include "breach_components.h"
#include "match_simulation.h"
#include <godot_cpp/variant/array.hpp>
#include <godot_cpp/variant/dictionary.hpp>
#include <godot_cpp/variant/packed_float32_array.hpp>
#include <vector>

namespace breach {

// ═══════════════════════════════════════════════════════════════
// UNIT BUFFER (one team's fog-of-war view, flat for MultiMesh)
//
// 8 floats per visible unit, own squad first, then seen enemies:
//
//   [0] x  [1] z  [2] facing  [3] health
//   [4] enemy (0/1)  [5] squad index  [6] alive (0/1)
//   [7] state bits: 1 moving, 2 in_combat, 4 planting, 8 defusing
// ═══════════════════════════════════════════════════════════════
constexpr int FLOATS_PER_UNIT = 8;

enum UnitStateBits : uint32_t {
  UNIT_MOVING = 1u << 0,
  UNIT_IN_COMBAT = 1u << 1,
  UNIT_PLANTING = 1u << 2,
  UNIT_DEFUSING = 1u << 3,
};

void pack_unit_buffer(const FilteredState &view,
                      godot::PackedFloat32Array &buffer_out,
                      int &count_out);

godot::Dictionary filtered_state_to_dictionary(const FilteredState &view);

godot::Array events_to_array(const std::vector<SimEvent> &events);

} // namespace breach

#endif // BREACH_SNAPSHOT_BRIDGE_H
