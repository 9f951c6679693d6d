#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

#include "benchmark.hpp"
#include "u8x512.hpp"

using namespace supersimd;

// Optional first argument: iteration count
static bool parse_iterations(int argc, char **argv, int &iterations) {
  if (argc < 2)
    return true;
  char *end = nullptr;
  long n = std::strtol(argv[1], &end, 10);
  if (end == argv[1] || *end != '\0' || n <= 0 || n > 100000000) {
    std::cerr << "[supersimd] invalid iteration count '" << argv[1]
              << "', expected a positive integer" << std::endl;
    return false;
  }
  iterations = static_cast<int>(n);
  return true;
}

int main(int argc, char **argv) {
  int iterations = 1000;
  if (!parse_iterations(argc, argv, iterations))
    return 1;

  XorShift32 rng(123);
  const Bytes512 a1 = rng.array();
  const Bytes512 a2 = rng.array();
  const u8x512 v1(a1);
  const u8x512 v2(a2);

  std::vector<BenchmarkResult> results;

  std::cout << "\n[supersimd] Running u8x512 benchmarks (" << iterations
            << " iterations)...\n"
            << std::endl;

  // 1. 512 independent wrapping byte additions
  results.push_back(benchmark(
      "Scalar add (512 x u8)",
      [&]() {
        Bytes512 r;
        for (size_t i = 0; i < NUM_LANES; ++i)
          r[i] = static_cast<uint8_t>(a1[i] + a2[i]);
        volatile uint8_t sink = r[NUM_LANES - 1];
        (void)sink;
      },
      iterations));

  // 2. Bit-sliced add on pre-verticalized operands
  results.push_back(benchmark(
      "Bit-sliced add",
      [&]() {
        u8x512 r = v1 + v2;
        volatile Word sink = r.planes()[NUM_PLANES - 1][0];
        (void)sink;
      },
      iterations));

  // 3. In-place accumulate
  u8x512 acc = v1;
  results.push_back(benchmark(
      "Bit-sliced add (+=)",
      [&]() {
        acc += v2;
        volatile Word sink = acc.planes()[0][0];
        (void)sink;
      },
      iterations));

  // 4. Transpose in, add, transpose out
  results.push_back(benchmark(
      "Round trip (vert + add + horiz)",
      [&]() {
        Bytes512 r = add(a1, a2);
        volatile uint8_t sink = r[0];
        (void)sink;
      },
      iterations));

  // 5. Conversions alone
  results.push_back(benchmark(
      "Verticalize",
      [&]() {
        Planes p = verticalize(a1);
        volatile Word sink = p[0][0];
        (void)sink;
      },
      iterations));

  results.push_back(benchmark(
      "Horizontalize",
      [&]() {
        Bytes512 r = horizontalize(v1.planes());
        volatile uint8_t sink = r[0];
        (void)sink;
      },
      iterations));

  print_benchmark_table(results);

  const double scalar = static_cast<double>(results[0].median_cycles);
  const double sliced = static_cast<double>(results[1].median_cycles);
  if (sliced > 0) {
    std::cout << "Speedup (scalar / bit-sliced, median): " << std::fixed
              << std::setprecision(2) << scalar / sliced << "x\n";
  }
  std::cout << "(Bit-sliced add is 46 word operations on 512-bit planes)\n";

  return 0;
}
