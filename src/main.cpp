#include <iostream>

#include "u8x512.hpp"

using namespace supersimd;

static void print_head(const char *label, const Bytes512 &v) {
  std::cout << label << " = [" << static_cast<unsigned>(v[0]);
  for (size_t i = 1; i < 8; ++i)
    std::cout << ", " << static_cast<unsigned>(v[i]);
  std::cout << ", ...]" << std::endl;
}

int main() {
  std::cout << "--- u8x512: bit-sliced wrapping addition ---" << std::endl;

  Bytes512 a{};
  Bytes512 b{};
  a[0] = 0;   b[0] = 1;
  a[1] = 255; b[1] = 1;
  a[2] = 128; b[2] = 128;
  a[3] = 1;   b[3] = 255;

  u8x512 va(a);
  u8x512 vb(b);
  u8x512 sum = va + vb;
  Bytes512 out = sum.to_array();

  print_head("a    ", a);
  print_head("b    ", b);
  print_head("a + b", out);

  std::cout << "\nBit planes of a + b:" << std::endl;
  sum.planes().print();

  bool ok = true;
  for (size_t i = 0; i < NUM_LANES; ++i) {
    if (out[i] != static_cast<uint8_t>(a[i] + b[i])) {
      std::cerr << "[supersimd] lane " << i << ": got "
                << static_cast<unsigned>(out[i]) << ", expected "
                << static_cast<unsigned>(static_cast<uint8_t>(a[i] + b[i]))
                << std::endl;
      ok = false;
    }
  }

  if (ok) {
    std::cout << "\nPASS: all 512 lanes match scalar wrapping addition"
              << std::endl;
    return 0;
  }
  std::cout << "\nFAIL" << std::endl;
  return 1;
}
