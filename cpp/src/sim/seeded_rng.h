#ifndef BREACH_SEEDED_RNG_H
#define BREACH_SEEDED_RNG_H

#include <cstdint>

namespace breach {

// ═════════════════════════════════════════════════════════════
// Mulberry32 stream. One per match, drawn strictly in tick order:
// detection rolls, then per shot hit roll -> location roll.
// Command radio jitter is drawn at issue time.
// Plain POD so it can live as a flecs singleton and be copied
// along with a world snapshot.
// ═════════════════════════════════════════════════════════════
struct SeededRng {
  uint32_t state = 0;

  SeededRng() = default;
  explicit SeededRng(uint32_t seed) : state(seed) {}

  // Uniform [0, 1)
  double next();

  // Uniform [lo, hi)
  double range(double lo, double hi) { return lo + next() * (hi - lo); }

  // Uniform integer in [lo, hi]
  int next_int(int lo, int hi);
}; // 4 bytes

} // namespace breach

#endif // BREACH_SEEDED_RNG_H
