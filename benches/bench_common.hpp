#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

namespace nexarag::bench {

/// Times each iteration separately and prints min, median and max alongside the mean.
inline void run_bench(const std::string &name, int iterations, const std::function<void()> &fn) {
  if (iterations <= 0) {
    return;
  }
  std::vector<double> samples;
  samples.reserve(static_cast<std::size_t>(iterations));
  for (int i = 0; i < iterations; ++i) {
    const auto start = std::chrono::steady_clock::now();
    fn();
    samples.push_back(
        std::chrono::duration<double, std::micro>(std::chrono::steady_clock::now() - start).count());
  }

  double total = 0.0;
  for (const double sample : samples) {
    total += sample;
  }
  std::sort(samples.begin(), samples.end());
  std::cout << name << ": iterations=" << iterations << " avg_us=" << total / samples.size()
            << " min_us=" << samples.front() << " p50_us=" << samples[samples.size() / 2]
            << " max_us=" << samples.back() << "\n";
}

} // namespace nexarag::bench
