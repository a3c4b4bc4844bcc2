#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

namespace llmgate::bench {

/// Times each iteration separately so the tail shows up next to the mean.
inline void run_bench(const std::string &name, int iterations,
                      const std::function<void()> &fn) {
  if (iterations <= 0) {
    return;
  }
  std::vector<std::int64_t> samples;
  samples.reserve(static_cast<std::size_t>(iterations));
  std::int64_t total = 0;
  for (int i = 0; i < iterations; ++i) {
    const auto start = std::chrono::steady_clock::now();
    fn();
    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
                             std::chrono::steady_clock::now() - start)
                             .count();
    samples.push_back(elapsed);
    total += elapsed;
  }
  std::sort(samples.begin(), samples.end());
  const auto p95 = samples[(samples.size() - 1) * 95 / 100];
  const double avg = static_cast<double>(total) / static_cast<double>(iterations);
  std::cout << name << ": iterations=" << iterations << " total_us=" << total
            << " avg_us=" << avg << " p95_us=" << p95 << "\n";
}

} // namespace llmgate::bench
