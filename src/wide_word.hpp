#pragma once

#include "utils.hpp"

namespace supersimd {

// 512-bit word held as 8 lanes of 64 bits. Lane k holds bits 64k..64k+63.
// The lane loops are fixed-trip and branch free so the compiler can keep
// the whole word in vector registers where the target has them.
struct u64x8 {
  static constexpr size_t NUM_WORDS = WORDS_PER_PLANE;
  std::array<Word, NUM_WORDS> words;

  constexpr u64x8() : words{0} {}

  static constexpr u64x8 zero() { return u64x8(); }

  static u64x8 ones() {
    u64x8 r;
    r.words.fill(~Word(0));
    return r;
  }

  SUPERSIMD_FORCE_INLINE Word &operator[](size_t i) { return words[i]; }
  SUPERSIMD_FORCE_INLINE const Word &operator[](size_t i) const {
    return words[i];
  }

  SUPERSIMD_FORCE_INLINE static u64x8 xor_(const u64x8 &a, const u64x8 &b) {
    u64x8 r;
    for (size_t i = 0; i < NUM_WORDS; ++i)
      r.words[i] = a.words[i] ^ b.words[i];
    return r;
  }

  SUPERSIMD_FORCE_INLINE static u64x8 and_(const u64x8 &a, const u64x8 &b) {
    u64x8 r;
    for (size_t i = 0; i < NUM_WORDS; ++i)
      r.words[i] = a.words[i] & b.words[i];
    return r;
  }

  SUPERSIMD_FORCE_INLINE static u64x8 or_(const u64x8 &a, const u64x8 &b) {
    u64x8 r;
    for (size_t i = 0; i < NUM_WORDS; ++i)
      r.words[i] = a.words[i] | b.words[i];
    return r;
  }

  // Bit i of the 512-bit word (0 or 1)
  Word get_bit(size_t bit) const {
    return (words[bit / WORD_BITS] >> (bit % WORD_BITS)) & 1;
  }

  // Overwrite bit i with the low bit of `value`, without branching on it
  void set_bit(size_t bit, Word value) {
    Word &w = words[bit / WORD_BITS];
    const Word shift = bit % WORD_BITS;
    w = (w & ~(Word(1) << shift)) | ((value & 1) << shift);
  }

  bool is_zero() const {
    Word acc = 0;
    for (size_t i = 0; i < NUM_WORDS; ++i)
      acc |= words[i];
    return acc == 0;
  }

  bool operator==(const u64x8 &other) const { return words == other.words; }
  bool operator!=(const u64x8 &other) const { return words != other.words; }

  // Print for debugging
  void print(std::ostream &os = std::cout) const {
    os << "0x";
    for (int i = NUM_WORDS - 1; i >= 0; --i) {
      os << std::hex << std::setw(16) << std::setfill('0') << words[i];
    }
    os << std::dec << std::setfill(' ') << std::endl;
  }
};

SUPERSIMD_FORCE_INLINE u64x8 operator^(const u64x8 &a, const u64x8 &b) {
  return u64x8::xor_(a, b);
}
SUPERSIMD_FORCE_INLINE u64x8 operator&(const u64x8 &a, const u64x8 &b) {
  return u64x8::and_(a, b);
}
SUPERSIMD_FORCE_INLINE u64x8 operator|(const u64x8 &a, const u64x8 &b) {
  return u64x8::or_(a, b);
}

} // namespace supersimd
