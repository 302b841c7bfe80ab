#include "equipment.h"
#include <cstring>

namespace breach {

// name, cost, body, head x, acc, speed, kill $, rate, mag, range, no-helmet
static const WeaponStats WEAPONS[WEAPON_COUNT] = {
    {"PISTOL", 200, 25.0f, 2.5f, 0.85f, 0.95f, 300, 400, 12, RANGE_MEDIUM,
     false},
    {"SMG", 1200, 22.0f, 2.0f, 0.80f, 0.90f, 600, 100, 30, RANGE_SHORT, false},
    {"RIFLE", 2700, 30.0f, 4.0f, 1.00f, 0.85f, 300, 120, 30, RANGE_LONG,
     false},
    {"AWP", 4750, 85.0f, 1.2f, 1.15f, 0.78f, 100, 1500, 5, RANGE_VERY_LONG,
     true},
    {"SHOTGUN", 1800, 18.0f, 1.0f, 0.70f, 0.90f, 900, 900, 7,
     RANGE_VERY_SHORT, false},
    {"LMG", 5200, 28.0f, 3.0f, 0.90f, 0.80f, 300, 80, 100, RANGE_LONG, false},
};

static const ArmorStats ARMOR[3] = {
    {"NONE", 0, 0.0f, 0.0f, 1.0f},
    {"LIGHT_VEST", 400, 0.30f, 0.0f, 0.97f},
    {"HEAVY_ARMOR", 1000, 0.50f, 0.15f, 0.92f},
};

static const UtilityStats UTILITY[UTILITY_COUNT] = {
    {"SMOKE", 300, 150.0f, 18.0f, 0.0f},
    {"FLASH", 200, 400.0f, 2.0f, 0.0f},
    {"FRAG", 300, 200.0f, 0.0f, 100.0f},
    {"MOLOTOV", 400, 120.0f, 7.0f, 25.0f},
    {"DECOY", 50, 300.0f, 10.0f, 0.0f},
};

const WeaponStats &weapon_stats(WeaponId id) {
  if (id >= WEAPON_COUNT)
    return WEAPONS[WEAPON_PISTOL];
  return WEAPONS[id];
}

const ArmorStats &armor_stats(ArmorTier tier) {
  if (tier > ARMOR_HEAVY)
    return ARMOR[ARMOR_NONE];
  return ARMOR[tier];
}

const UtilityStats &utility_stats(UtilityType type) {
  if (type >= UTILITY_COUNT)
    return UTILITY[UTILITY_DECOY];
  return UTILITY[type];
}

int kill_reward_for(WeaponId id) {
  if (id >= WEAPON_COUNT)
    return 300;
  return WEAPONS[id].kill_reward;
}

const char *weapon_name(WeaponId id) {
  if (id == WEAPON_FRAG)
    return "FRAG";
  if (id >= WEAPON_COUNT)
    return "UNKNOWN";
  return WEAPONS[id].name;
}

const char *range_name(RangeClass range) {
  switch (range) {
  case RANGE_VERY_SHORT:
    return "VERY_SHORT";
  case RANGE_SHORT:
    return "SHORT";
  case RANGE_MEDIUM:
    return "MEDIUM";
  case RANGE_LONG:
    return "LONG";
  case RANGE_VERY_LONG:
    return "VERY_LONG";
  }
  return "UNKNOWN";
}

const char *utility_name(UtilityType type) {
  if (type >= UTILITY_COUNT)
    return "NONE";
  return UTILITY[type].name;
}

bool weapon_from_name(const char *name, WeaponId &out) {
  for (int i = 0; i < WEAPON_COUNT; i++) {
    if (std::strcmp(name, WEAPONS[i].name) == 0) {
      out = (WeaponId)i;
      return true;
    }
  }
  return false;
}

bool armor_from_name(const char *name, ArmorTier &out) {
  for (int i = 0; i < 3; i++) {
    if (std::strcmp(name, ARMOR[i].name) == 0) {
      out = (ArmorTier)i;
      return true;
    }
  }
  return false;
}

bool utility_from_name(const char *name, UtilityType &out) {
  for (int i = 0; i < UTILITY_COUNT; i++) {
    if (std::strcmp(name, UTILITY[i].name) == 0) {
      out = (UtilityType)i;
      return true;
    }
  }
  return false;
}

} // namespace breach
