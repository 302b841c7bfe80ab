#include "seeded_rng.h"

namespace breach {

double SeededRng::next() {
  state += 0x6D2B79F5u;
  uint32_t t = state;
  t = (t ^ (t >> 15)) * (t | 1u);
  t ^= t + (t ^ (t >> 7)) * (t | 61u);
  return (double)(t ^ (t >> 14)) / 4294967296.0;
}

int SeededRng::next_int(int lo, int hi) {
  if (hi <= lo)
    return lo;
  int span = hi - lo + 1;
  int v = lo + (int)(next() * span);
  return v > hi ? hi : v;
}

} // namespace breach
