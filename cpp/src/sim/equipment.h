#ifndef BREACH_EQUIPMENT_H
#define BREACH_EQUIPMENT_H

#include <cstdint>

namespace breach {

// ─── Weapons ──────────────────────────────────────────────
enum WeaponId : uint8_t {
  WEAPON_PISTOL = 0, // Default, free
  WEAPON_SMG,
  WEAPON_RIFLE,
  WEAPON_AWP,
  WEAPON_SHOTGUN,
  WEAPON_LMG,
  WEAPON_COUNT,
  WEAPON_FRAG = 0xFE, // Kill credit for grenade kills, not buyable
};

enum RangeClass : uint8_t {
  RANGE_VERY_SHORT = 0,
  RANGE_SHORT,
  RANGE_MEDIUM,
  RANGE_LONG,
  RANGE_VERY_LONG
};

struct WeaponStats {
  const char *name;
  int cost;
  float body_damage;
  float headshot_mult;
  float accuracy_mod;
  float speed_mod;
  int kill_reward;
  int fire_rate_ms; // Between shots (UI pacing only)
  int magazine;
  RangeClass range;
  bool ignores_helmet; // Sniper class
};

// ─── Armor ────────────────────────────────────────────────
enum ArmorTier : uint8_t { ARMOR_NONE = 0, ARMOR_LIGHT, ARMOR_HEAVY };

struct ArmorStats {
  const char *name;
  int cost;
  float body_reduction;
  float leg_reduction;
  float speed_mod;
};

// ─── Utility (grenades) ───────────────────────────────────
enum UtilityType : uint8_t {
  UTILITY_SMOKE = 0,
  UTILITY_FLASH,
  UTILITY_FRAG,
  UTILITY_MOLOTOV,
  UTILITY_DECOY,
  UTILITY_COUNT,
  UTILITY_NONE = 0xFF
};

struct UtilityStats {
  const char *name;
  int cost;
  float radius;
  float duration; // Seconds, 0 = instant
  float damage;   // FRAG: max at center. MOLOTOV: per second.
};

constexpr int HELMET_COST = 350;
constexpr int DEFUSE_KIT_COST = 400;
constexpr int MAX_UTILITY = 4;

// Unknown ids fall back to pistol-grade numbers.
const WeaponStats &weapon_stats(WeaponId id);
const ArmorStats &armor_stats(ArmorTier tier);
const UtilityStats &utility_stats(UtilityType type);

// Kill bounty for the weapon that scored the kill. Default 300.
int kill_reward_for(WeaponId id);

const char *weapon_name(WeaponId id);
const char *range_name(RangeClass range);
const char *utility_name(UtilityType type);

// Reverse lookups for JSON / GDScript strings. False if unknown.
bool weapon_from_name(const char *name, WeaponId &out);
bool armor_from_name(const char *name, ArmorTier &out);
bool utility_from_name(const char *name, UtilityType &out);

} // namespace breach

#endif // BREACH_EQUIPMENT_H
