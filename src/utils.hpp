#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>

namespace supersimd {

// Force inline for the plane kernels
#ifdef _MSC_VER
#define SUPERSIMD_FORCE_INLINE __forceinline
#else
#define SUPERSIMD_FORCE_INLINE __attribute__((always_inline)) inline
#endif

using Word = uint64_t;
constexpr size_t WORD_BITS = 64;
constexpr size_t WORD_BYTES = 8;

// Layout of a vertical vector: 8 planes of 512 lanes, each plane made of
// 8 words of 64 lanes.
constexpr size_t NUM_LANES = 512;
constexpr size_t NUM_PLANES = 8;
constexpr size_t WORDS_PER_PLANE = NUM_LANES / WORD_BITS;

static_assert(WORDS_PER_PLANE * WORD_BITS == NUM_LANES,
              "lanes must fill whole words");
static_assert(NUM_PLANES == 8, "one plane per bit of a uint8_t");

// Horizontal form: one byte per lane
using Bytes512 = std::array<uint8_t, NUM_LANES>;

// xorshift32 generator used to fill test and benchmark inputs
class XorShift32 {
public:
  explicit XorShift32(uint32_t seed = 123) : state(seed) {}

  uint32_t next() {
    uint32_t x = state;
    x ^= x << 13;
    x ^= x >> 17;
    x ^= x << 5;
    state = x;
    return x;
  }

  void fill(Bytes512 &out) {
    for (size_t i = 0; i < NUM_LANES; ++i)
      out[i] = static_cast<uint8_t>(next() & 0xFF);
  }

  Bytes512 array() {
    Bytes512 out;
    fill(out);
    return out;
  }

private:
  uint32_t state;
};

} // namespace supersimd
