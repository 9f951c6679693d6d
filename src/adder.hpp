#pragma once

#include "vertical.hpp"

namespace supersimd {

// Ripple-carry long addition run on all 512 lanes at once.
//   r[p]  = a[p] ^ b[p] ^ c
//   c'    = (a[p] & b[p]) | (a[p] & c) | (b[p] & c)
// Planes go from least to most significant. The carry out of plane 7 is
// dropped, which gives per-lane addition mod 256.
// Plane 0 has no incoming carry and plane 7 has no outgoing one, so the
// chain costs 2 + 6*7 + 2 = 46 word operations.
// r may alias a or b.
SUPERSIMD_FORCE_INLINE void add_planes(Planes &r, const Planes &a,
                                       const Planes &b) {
  u64x8 carry = a[0] & b[0];
  r[0] = a[0] ^ b[0];

  for (size_t p = 1; p < NUM_PLANES - 1; ++p) {
    u64x8 sum = a[p] ^ b[p] ^ carry;
    carry = (a[p] & b[p]) | (a[p] & carry) | (b[p] & carry);
    r[p] = sum;
  }

  r[NUM_PLANES - 1] = a[NUM_PLANES - 1] ^ b[NUM_PLANES - 1] ^ carry;
}

inline Planes add_planes(const Planes &a, const Planes &b) {
  Planes r;
  add_planes(r, a, b);
  return r;
}

// acc += b. The carry for plane p is computed from the old acc[p] before
// acc[p] is overwritten, so `b` may alias `acc`.
SUPERSIMD_FORCE_INLINE void add_planes_into(Planes &acc, const Planes &b) {
  u64x8 carry = acc[0] & b[0];
  acc[0] = acc[0] ^ b[0];

  for (size_t p = 1; p < NUM_PLANES - 1; ++p) {
    u64x8 sum = acc[p] ^ b[p] ^ carry;
    carry = (acc[p] & b[p]) | (acc[p] & carry) | (b[p] & carry);
    acc[p] = sum;
  }

  acc[NUM_PLANES - 1] = acc[NUM_PLANES - 1] ^ b[NUM_PLANES - 1] ^ carry;
}

} // namespace supersimd
