#pragma once

#include "wide_word.hpp"

namespace supersimd {

// Vertical (bit-plane) form of 512 bytes: plane b, bit i == bit b of byte i.
struct Planes {
  std::array<u64x8, NUM_PLANES> rows;

  constexpr Planes() : rows{} {}

  SUPERSIMD_FORCE_INLINE u64x8 &operator[](size_t b) { return rows[b]; }
  SUPERSIMD_FORCE_INLINE const u64x8 &operator[](size_t b) const {
    return rows[b];
  }

  bool operator==(const Planes &other) const { return rows == other.rows; }
  bool operator!=(const Planes &other) const { return rows != other.rows; }

  void print(std::ostream &os = std::cout) const {
    for (size_t b = 0; b < NUM_PLANES; ++b) {
      os << "plane[" << b << "] = ";
      rows[b].print(os);
    }
  }
};

// Horizontal -> vertical. Each byte contributes one masked bit to every
// plane; there is no branch on the byte value.
inline Planes verticalize(const Bytes512 &cols) {
  Planes p;
  for (size_t w = 0; w < WORDS_PER_PLANE; ++w) {
    const uint8_t *src = cols.data() + w * WORD_BITS;
    for (size_t b = 0; b < NUM_PLANES; ++b) {
      Word acc = 0;
      for (size_t i = 0; i < WORD_BITS; ++i)
        acc |= Word((src[i] >> b) & 1) << i;
      p.rows[b].words[w] = acc;
    }
  }
  return p;
}

// Vertical -> horizontal. Accepts any bit pattern, so it also decodes sums.
inline Bytes512 horizontalize(const Planes &p) {
  Bytes512 cols;
  for (size_t w = 0; w < WORDS_PER_PLANE; ++w) {
    uint8_t *dst = cols.data() + w * WORD_BITS;
    for (size_t i = 0; i < WORD_BITS; ++i) {
      uint8_t v = 0;
      for (size_t b = 0; b < NUM_PLANES; ++b)
        v |= static_cast<uint8_t>(((p.rows[b].words[w] >> i) & 1) << b);
      dst[i] = v;
    }
  }
  return cols;
}

// Decode a single lane
inline uint8_t lane(const Planes &p, size_t i) {
  uint8_t v = 0;
  for (size_t b = 0; b < NUM_PLANES; ++b)
    v |= static_cast<uint8_t>(p.rows[b].get_bit(i) << b);
  return v;
}

} // namespace supersimd
