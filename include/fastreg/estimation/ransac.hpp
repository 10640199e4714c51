// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * ransac.hpp
 *
 * Outlier-robust model estimation by random sample consensus.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef FASTREG_ESTIMATION_RANSAC_HPP
#define FASTREG_ESTIMATION_RANSAC_HPP

#include <Eigen/Core>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

#include "fastreg/config/ransac.hpp"
#include "fastreg/correspondence.hpp"
#include "fastreg/models/model.hpp"

namespace fastreg {

/// Outcome of a robust estimation run. Owned by the caller.
struct FitResult {
  std::unique_ptr<Model> model;  ///< Least-squares refit on the consensus set
  Eigen::VectorXd parameters;    ///< model->parameters()
  std::vector<size_t> inliers;   ///< Consensus set, ascending input indices
  double cost = 0.0;             ///< Weighted mean inlier residual
  size_t iterations = 0;         ///< Trials evaluated
  bool stopped_early = false;    ///< Budget ended the search before convergence
};

/**
 * @brief Cooperative limits on a run.
 *
 * Checked between trial batches. When a limit ends the search, the best
 * candidate so far is returned with FitResult::stopped_early set, even if
 * it misses the inlier minimum. Only max_trials keeps results reproducible.
 */
struct Budget {
  size_t max_trials = 0;                      ///< 0 = unlimited
  std::chrono::milliseconds max_duration{0};  ///< 0 = unlimited
  const std::atomic<bool>* cancel = nullptr;  ///< Set to true to stop
};

/**
 * @brief RANSAC estimator.
 *
 * INIT → SAMPLE → FIT-CANDIDATE → SCORE → UPDATE-BEST → LOOP → REFIT →
 * TERMINATE. A candidate replaces the best only if it has more inliers, or
 * as many inliers with a lower residual sum; on a full tie the earlier
 * trial wins.
 *
 * Trials within a batch are evaluated in parallel (OpenMP) and reduced in
 * trial order, re-checking the stop condition after each one, so the result
 * is bit-identical for any thread count or batch size given the same seed
 * and input order.
 *
 * Holds only its parameters; run() is const and may be called concurrently.
 */
class RobustEstimator {
 public:
  using Params = config::Ransac;

  RobustEstimator() = default;
  explicit RobustEstimator(const Params& params) : params_(params) {}

  /**
   * @brief Estimate a model of the given type.
   *
   * @throws InsufficientDataError if fewer matches than the model minimum
   * @throws NotEnoughInliersError if the consensus is below min_inliers or
   *         min_inlier_ratio, or no sample could be fitted
   * @throws std::invalid_argument on invalid parameters
   */
  FitResult run(const Correspondences& matches, ModelType type,
                const Budget& budget = {}) const;

  /// Estimate with a configured prototype (e.g. moving least squares settings)
  FitResult run(const Correspondences& matches, const Model& prototype,
                const Budget& budget = {}) const;

  const Params& params() const { return params_; }

 private:
  Params params_;
};

/**
 * @brief Trials needed to draw one all-inlier sample with given confidence.
 *
 * ⌈log(1 - confidence) / log(1 - wᵐ)⌉ for inlier ratio w and sample size m.
 * Returns 0 for w >= 1 and SIZE_MAX for w <= 0 or when wᵐ underflows.
 */
size_t requiredIterations(double inlier_ratio, size_t sample_size,
                          double confidence);

/// One-call estimation with default values for the remaining parameters
FitResult estimate(const Correspondences& matches, ModelType type,
                   double max_epsilon, size_t min_inliers, double confidence,
                   size_t max_iterations, uint64_t seed);

}  // namespace fastreg

#endif  // FASTREG_ESTIMATION_RANSAC_HPP
