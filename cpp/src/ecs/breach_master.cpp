// ═════════════════════════════════════════════════════════════════════════════
// THE BREACH ENGINE: GDEXTENSION UNITY BUILD
// ═════════════════════════════════════════════════════════════════════════════
// The Godot-facing ECS code compiles as this one translation unit, so every
// flecs::type_id<T> the node touches is instantiated once. The headless core
// (sim/, breach_systems, match_simulation, match_lifecycle) comes in through
// the breach_core library, which the test binary links as well.
//
// ORDER MATTERS: the bridge first, then the node that uses it.
// ═════════════════════════════════════════════════════════════════════════════

// 1. Bridge (fog-of-war view -> Dictionary / PackedFloat32Array)
#include "snapshot_bridge.cpp"

// 2. Node (map/config load, lifecycle driver, GDScript API)
#include "world_manager.cpp"
