// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * sampler.hpp
 *
 * Reproducible minimal-subset sampling for RANSAC trials.
 */

#ifndef FASTREG_ESTIMATION_SAMPLER_HPP
#define FASTREG_ESTIMATION_SAMPLER_HPP

#include <cstdint>
#include <random>
#include <vector>

namespace fastreg {

/// SplitMix64 finalizer (Steele et al. 2014), used to derive stream seeds
inline uint64_t splitMix64(uint64_t x) noexcept {
  x += 0x9E3779B97F4A7C15ULL;
  x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
  x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
  return x ^ (x >> 31);
}

/**
 * @brief Random index sampler owning one independent stream per trial.
 *
 * Trial t of a run with seed s draws from mt19937_64 seeded with
 * splitMix64(s ^ splitMix64(t)), so trials can be evaluated in any order or
 * on any thread and still see the same samples. Indices are produced by
 * rejection on raw engine output; the result does not depend on the
 * standard library's distribution implementation.
 */
class SampleGenerator {
 public:
  SampleGenerator(uint64_t seed, uint64_t trial)
      : engine_(splitMix64(seed ^ splitMix64(trial))) {}

  /// Uniform index in [0, n), n > 0
  size_t uniformIndex(size_t n) {
    const uint64_t bound = static_cast<uint64_t>(n);
    // 2⁶⁴ mod n: values below this would bias the modulo
    const uint64_t threshold = (0 - bound) % bound;
    uint64_t r;
    do {
      r = engine_();
    } while (r < threshold);
    return static_cast<size_t>(r % bound);
  }

  /**
   * @brief Draw k distinct indices from [0, n) without replacement.
   *
   * Duplicates are rejected and redrawn; k is a model's minimal sample size,
   * so k << n in practice. Requires k <= n.
   */
  void drawSample(size_t n, size_t k, std::vector<size_t>& sample) {
    sample.clear();
    while (sample.size() < k) {
      const size_t idx = uniformIndex(n);
      bool duplicate = false;
      for (size_t s : sample) {
        if (s == idx) {
          duplicate = true;
          break;
        }
      }
      if (!duplicate) sample.push_back(idx);
    }
  }

 private:
  std::mt19937_64 engine_;
};

}  // namespace fastreg

#endif  // FASTREG_ESTIMATION_SAMPLER_HPP
