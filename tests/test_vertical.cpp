/**
 * @file test_vertical.cpp
 * @brief Tests for the horizontal <-> bit-plane transposition
 */

#include <gtest/gtest.h>
#include "vertical.hpp"

using namespace supersimd;

class VerticalTest : public ::testing::Test {
protected:
  void SetUp() override { rng = XorShift32(123); }

  XorShift32 rng;
};

TEST_F(VerticalTest, RoundTripRandom) {
  for (int round = 0; round < 32; ++round) {
    Bytes512 h = rng.array();
    EXPECT_EQ(horizontalize(verticalize(h)), h) << "round " << round;
  }
}

TEST_F(VerticalTest, RoundTripEveryByteValue) {
  Bytes512 h;
  for (size_t i = 0; i < NUM_LANES; ++i)
    h[i] = static_cast<uint8_t>(i * 7 + (i >> 8));
  EXPECT_EQ(horizontalize(verticalize(h)), h);
}

TEST_F(VerticalTest, PlaneBitMatchesByteBit) {
  Bytes512 h = rng.array();
  Planes p = verticalize(h);
  for (size_t b = 0; b < NUM_PLANES; ++b) {
    for (size_t i = 0; i < NUM_LANES; ++i) {
      ASSERT_EQ(p[b].get_bit(i), Word((h[i] >> b) & 1))
          << "plane " << b << " lane " << i;
    }
  }
}

TEST_F(VerticalTest, SingleLaneLayout) {
  Bytes512 h{};
  h[65] = 0x81; // bits 0 and 7
  Planes p = verticalize(h);
  for (size_t b = 0; b < NUM_PLANES; ++b) {
    u64x8 expected;
    if (b == 0 || b == 7)
      expected[1] = Word(1) << 1;
    EXPECT_EQ(p[b], expected) << "plane " << b;
  }
}

TEST_F(VerticalTest, HorizontalizeArbitraryPlanes) {
  Planes p;
  p[3] = u64x8::ones();
  Bytes512 h = horizontalize(p);
  for (size_t i = 0; i < NUM_LANES; ++i)
    EXPECT_EQ(h[i], 8u);
}

TEST_F(VerticalTest, LaneDecodesOneElement) {
  Bytes512 h = rng.array();
  Planes p = verticalize(h);
  for (size_t i = 0; i < NUM_LANES; ++i)
    EXPECT_EQ(lane(p, i), h[i]);
}

// Flipping one plane flips exactly that bit of every element
TEST_F(VerticalTest, PlaneIsolation) {
  Bytes512 h = rng.array();
  for (size_t b = 0; b < NUM_PLANES; ++b) {
    Planes p = verticalize(h);
    p[b] = p[b] ^ u64x8::ones();
    Bytes512 out = horizontalize(p);
    for (size_t i = 0; i < NUM_LANES; ++i) {
      ASSERT_EQ(out[i], static_cast<uint8_t>(h[i] ^ (1u << b)))
          << "plane " << b << " lane " << i;
    }
  }
}
