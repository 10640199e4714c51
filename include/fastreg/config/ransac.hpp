// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * ransac.hpp
 *
 * Robust estimation configuration: consensus thresholds, iteration bounds,
 * sampling seed and parallelism.
 */

#ifndef FASTREG_CONFIG_RANSAC_HPP
#define FASTREG_CONFIG_RANSAC_HPP

#include <cstddef>
#include <cstdint>

namespace fastreg {
namespace config {

/**
 * @brief RANSAC parameters.
 *
 * The loop runs max(min_iterations, min(max_iterations, required)) trials,
 * where required = ⌈log(1 - confidence) / log(1 - wᵐ)⌉ for the current best
 * inlier ratio w and sample size m.
 */
struct Ransac {
  double max_epsilon = 2.0;       ///< Inlier residual threshold τ [px]
  size_t min_inliers = 7;         ///< Consensus size required for success
  double min_inlier_ratio = 0.0;  ///< Consensus / total required for success
  double confidence = 0.99;       ///< Target probability of an all-inlier sample
  size_t max_iterations = 1000;   ///< Hard cap on trials
  size_t min_iterations = 0;      ///< Floor on trials
  size_t max_resample_attempts = 16;  ///< Retries per trial on ill-conditioned samples
  uint64_t seed = 42;                 ///< Sampling seed

  /// Trust filter after refit: drop residuals > max_trust × median
  /// (0 = disabled)
  double max_trust = 0.0;

  int num_threads = 1;     ///< OpenMP threads for trials (0 = all cores)
  size_t batch_size = 64;  ///< Trials evaluated per parallel batch
};

}  // namespace config
}  // namespace fastreg

#endif  // FASTREG_CONFIG_RANSAC_HPP
