#pragma once

#include "adder.hpp"
#include <ostream>

namespace supersimd {

// =============================================================================
// u8x512: 512 wrapping uint8_t lanes, stored bit-sliced
// =============================================================================
// The value is kept in vertical form, so chains of additions never pay for
// the transposition. Convert back with to_array() once the chain is done.
//
// - a + b, a += b: per-lane addition mod 256, no overflow signalling
// - plain value type: copies are independent, no heap storage
// =============================================================================

class u8x512 {
public:
  constexpr u8x512() : rows() {}
  explicit u8x512(const Bytes512 &cols) : rows(verticalize(cols)) {}

  static u8x512 from(const Bytes512 &cols) { return u8x512(cols); }

  static u8x512 from_planes(const Planes &p) {
    u8x512 v;
    v.rows = p;
    return v;
  }

  static constexpr u8x512 zero() { return u8x512(); }

  // Every lane set to `value`
  static u8x512 splat(uint8_t value) {
    u8x512 v;
    for (size_t b = 0; b < NUM_PLANES; ++b) {
      // all-ones when bit b of value is set, all-zeros otherwise
      const Word mask = Word(0) - Word((value >> b) & 1);
      v.rows[b].words.fill(mask);
    }
    return v;
  }

  Bytes512 to_array() const { return horizontalize(rows); }

  // Raw access to the bit planes
  const Planes &planes() const { return rows; }
  Planes &planes() { return rows; }

  uint8_t operator[](size_t i) const { return lane(rows, i); }

  u8x512 &operator+=(const u8x512 &rhs) {
    add_planes_into(rows, rhs.rows);
    return *this;
  }

  bool operator==(const u8x512 &other) const { return rows == other.rows; }
  bool operator!=(const u8x512 &other) const { return rows != other.rows; }

  void print() const;

private:
  Planes rows;
};

inline u8x512 operator+(const u8x512 &lhs, const u8x512 &rhs) {
  Planes r;
  add_planes(r, lhs.planes(), rhs.planes());
  return u8x512::from_planes(r);
}

// Formats like a list: [a, b, c, ...]
inline std::ostream &operator<<(std::ostream &os, const u8x512 &v) {
  const Bytes512 cols = v.to_array();
  os << '[';
  for (size_t i = 0; i < NUM_LANES; ++i) {
    if (i != 0)
      os << ", ";
    os << static_cast<unsigned>(cols[i]);
  }
  return os << ']';
}

inline void u8x512::print() const { std::cout << *this << std::endl; }

// =============================================================================
// Horizontal entry points: transpose, add, transpose back
// =============================================================================

inline Bytes512 add(const Bytes512 &lhs, const Bytes512 &rhs) {
  Planes r;
  add_planes(r, verticalize(lhs), verticalize(rhs));
  return horizontalize(r);
}

inline void add_assign(Bytes512 &lhs, const Bytes512 &rhs) {
  Planes acc = verticalize(lhs);
  add_planes_into(acc, verticalize(rhs));
  lhs = horizontalize(acc);
}

} // namespace supersimd
