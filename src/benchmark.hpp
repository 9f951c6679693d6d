#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <vector>

#if defined(_MSC_VER)
#include <intrin.h>
#elif defined(__x86_64__) || defined(__i386__)
#include <x86intrin.h>
#endif

namespace supersimd {

// RDTSC-based cycle counter, serialized with cpuid on both ends.
// Hosts without a TSC report steady_clock nanoseconds instead.
class CycleCounter {
public:
  static inline uint64_t rdtsc() {
#if defined(_MSC_VER)
    return __rdtsc();
#elif defined(__x86_64__) || defined(__i386__)
    unsigned int lo, hi;
    __asm__ __volatile__("rdtsc" : "=a"(lo), "=d"(hi));
    return ((uint64_t)hi << 32) | lo;
#else
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now().time_since_epoch())
            .count());
#endif
  }

  static inline void cpuid_fence() {
#if defined(_MSC_VER)
    int cpuInfo[4];
    __cpuid(cpuInfo, 0);
#elif defined(__x86_64__) || defined(__i386__)
    unsigned int a = 0, b, c = 0, d;
    __asm__ __volatile__("cpuid" : "+a"(a), "=b"(b), "+c"(c), "=d"(d));
#endif
  }

  // Start measurement with serialization
  static inline uint64_t start() {
    cpuid_fence();
    return rdtsc();
  }

  // End measurement with serialization
  static inline uint64_t stop() {
    uint64_t cycles = rdtsc();
    cpuid_fence();
    return cycles;
  }
};

struct BenchmarkResult {
  std::string name;
  uint64_t min_cycles;
  uint64_t max_cycles;
  uint64_t median_cycles;
  double avg_cycles;
};

// Run a benchmark N times and compute statistics
template <typename Func>
BenchmarkResult benchmark(const std::string &name, Func func,
                          int iterations = 1000) {
  std::vector<uint64_t> samples;
  samples.reserve(iterations);

  // Warmup
  for (int i = 0; i < 10; ++i) {
    func();
  }

  for (int i = 0; i < iterations; ++i) {
    uint64_t start = CycleCounter::start();
    func();
    uint64_t end = CycleCounter::stop();
    samples.push_back(end - start);
  }

  std::sort(samples.begin(), samples.end());

  BenchmarkResult result;
  result.name = name;
  result.min_cycles = samples.front();
  result.max_cycles = samples.back();
  result.median_cycles = samples[iterations / 2];
  result.avg_cycles =
      std::accumulate(samples.begin(), samples.end(), 0.0) / iterations;

  return result;
}

inline void print_benchmark_table(const std::vector<BenchmarkResult> &results) {
  std::cout << "\n" << std::string(80, '=') << "\n";
  std::cout << "                    BENCHMARK RESULTS (RDTSC Cycles)\n";
  std::cout << std::string(80, '=') << "\n";
  std::cout << std::left << std::setw(32) << "Operation" << std::right
            << std::setw(12) << "Median" << std::setw(12) << "Min"
            << std::setw(12) << "Max" << std::setw(12) << "Avg"
            << "\n";
  std::cout << std::string(80, '-') << "\n";

  for (const auto &r : results) {
    std::cout << std::left << std::setw(32) << r.name << std::right
              << std::setw(12) << r.median_cycles << std::setw(12)
              << r.min_cycles << std::setw(12) << r.max_cycles
              << std::setw(12) << std::fixed << std::setprecision(1)
              << r.avg_cycles << "\n";
  }
  std::cout << std::string(80, '=') << "\n";
}

} // namespace supersimd
