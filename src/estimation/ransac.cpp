// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * ransac.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "fastreg/estimation/ransac.hpp"

#include <omp.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <limits>
#include <stdexcept>
#include <string>

#include "fastreg/errors.hpp"
#include "fastreg/estimation/least_squares.hpp"
#include "fastreg/estimation/outlier_filter.hpp"
#include "fastreg/estimation/sampler.hpp"

namespace fastreg {

namespace detail {

/// Scored hypothesis of a single trial
struct Candidate {
  bool valid = false;
  size_t num_inliers = 0;
  double residual_sum = 0.0;
  std::unique_ptr<Model> model;
};

/// Strict ordering: more inliers, then lower residual sum
bool isBetter(const Candidate& a, const Candidate& b) {
  if (!a.valid) return false;
  if (!b.valid) return true;
  if (a.num_inliers != b.num_inliers) return a.num_inliers > b.num_inliers;
  return a.residual_sum < b.residual_sum;
}

void checkParams(const config::Ransac& p) {
  if (!(p.max_epsilon > 0.0)) {
    throw std::invalid_argument("RANSAC max_epsilon must be > 0, got " +
                                std::to_string(p.max_epsilon));
  }
  if (!(p.confidence > 0.0 && p.confidence < 1.0)) {
    throw std::invalid_argument("RANSAC confidence must be in (0, 1), got " +
                                std::to_string(p.confidence));
  }
  if (p.max_iterations == 0) {
    throw std::invalid_argument("RANSAC max_iterations must be > 0");
  }
  if (p.min_iterations > p.max_iterations) {
    throw std::invalid_argument("RANSAC min_iterations exceeds max_iterations");
  }
}

/// SAMPLE → FIT-CANDIDATE → SCORE for trial `trial`
Candidate evaluateTrial(const Model& prototype, const Correspondences& matches,
                        const config::Ransac& params, size_t trial) {
  Candidate cand;
  SampleGenerator rng(params.seed, trial);
  std::vector<size_t> sample;
  auto model = prototype.clone();

  bool fitted = false;
  const size_t attempts = std::max<size_t>(1, params.max_resample_attempts);
  for (size_t attempt = 0; attempt < attempts && !fitted; ++attempt) {
    rng.drawSample(matches.size(), prototype.minNumMatches(), sample);
    try {
      model->fit(lsq::select(matches, sample));
      fitted = true;
    } catch (const IllConditionedError&) {
      // Degenerate sample: draw another one from the same stream
    }
  }
  if (!fitted) return cand;

  for (const auto& m : matches) {
    const double r = m.residual(*model);
    if (r <= params.max_epsilon) {
      ++cand.num_inliers;
      cand.residual_sum += r;
    }
  }
  cand.valid = true;
  cand.model = std::move(model);
  return cand;
}

std::vector<size_t> collectInliers(const Model& model,
                                   const Correspondences& matches,
                                   double max_epsilon) {
  std::vector<size_t> inliers;
  for (size_t i = 0; i < matches.size(); ++i) {
    if (matches[i].residual(model) <= max_epsilon) inliers.push_back(i);
  }
  return inliers;
}

bool budgetExhausted(const Budget& budget, size_t trials,
                     std::chrono::steady_clock::time_point start) {
  if (budget.max_trials > 0 && trials >= budget.max_trials) return true;
  if (budget.cancel && budget.cancel->load()) return true;
  if (budget.max_duration.count() > 0 &&
      std::chrono::steady_clock::now() - start >= budget.max_duration) {
    return true;
  }
  return false;
}

}  // namespace detail

size_t requiredIterations(double inlier_ratio, size_t sample_size,
                          double confidence) {
  if (inlier_ratio >= 1.0) return 0;
  if (!(inlier_ratio > 0.0)) return std::numeric_limits<size_t>::max();

  const double p_good = std::pow(inlier_ratio, static_cast<double>(sample_size));
  const double log_fail = std::log1p(-p_good);
  if (!(log_fail < 0.0)) return std::numeric_limits<size_t>::max();

  const double n = std::ceil(std::log1p(-confidence) / log_fail);
  if (!(n < static_cast<double>(std::numeric_limits<size_t>::max()))) {
    return std::numeric_limits<size_t>::max();
  }
  return static_cast<size_t>(std::max(n, 0.0));
}

FitResult RobustEstimator::run(const Correspondences& matches, ModelType type,
                               const Budget& budget) const {
  const auto prototype = createModel(type);
  return run(matches, *prototype, budget);
}

FitResult RobustEstimator::run(const Correspondences& matches,
                               const Model& prototype,
                               const Budget& budget) const {
  // INIT
  const size_t n = matches.size();
  const size_t sample_size = prototype.minNumMatches();
  if (n < sample_size) {
    throw InsufficientDataError(sample_size, n);
  }
  detail::checkParams(params_);

  size_t min_inliers = params_.min_inliers;
  if (min_inliers < sample_size) {
    spdlog::warn("[Ransac] min_inliers ({}) below {} minimum, raising to {}",
                 min_inliers, prototype.name(), sample_size);
    min_inliers = sample_size;
  }

  const int num_threads =
      (params_.num_threads > 0) ? params_.num_threads : omp_get_max_threads();
  const size_t batch_size = std::max<size_t>(1, params_.batch_size);
  const auto start = std::chrono::steady_clock::now();

  detail::Candidate best;
  size_t trials = 0;
  size_t required = std::numeric_limits<size_t>::max();
  bool stopped_early = false;

  auto target = [&]() {
    return std::max(params_.min_iterations,
                    std::min(params_.max_iterations, required));
  };

  // LOOP
  while (trials < target()) {
    if (detail::budgetExhausted(budget, trials, start)) {
      stopped_early = true;
      break;
    }

    size_t batch = std::min(batch_size, target() - trials);
    if (budget.max_trials > 0) {
      batch = std::min(batch, budget.max_trials - trials);
    }

    std::vector<detail::Candidate> candidates(batch);
    std::vector<std::exception_ptr> errors(batch);
    const long long batch_ll = static_cast<long long>(batch);
    const size_t first_trial = trials;

#pragma omp parallel for num_threads(num_threads) schedule(dynamic, 1)
    for (long long k = 0; k < batch_ll; ++k) {
      const size_t slot = static_cast<size_t>(k);
      try {
        candidates[slot] = detail::evaluateTrial(prototype, matches, params_,
                                                 first_trial + slot);
      } catch (...) {
        // Exceptions must not cross the parallel region; rethrown below
        errors[slot] = std::current_exception();
      }
    }

    // UPDATE-BEST, in trial order
    for (size_t k = 0; k < batch; ++k) {
      if (errors[k]) std::rethrow_exception(errors[k]);
      ++trials;
      if (detail::isBetter(candidates[k], best)) {
        best = std::move(candidates[k]);
        required = requiredIterations(
            static_cast<double>(best.num_inliers) / static_cast<double>(n),
            sample_size, params_.confidence);
      }
      if (trials >= target()) break;
    }
  }

  if (!best.valid) {
    spdlog::warn("[Ransac] No fittable sample in {} trials ({} matches, {})",
                 trials, n, prototype.name());
    throw NotEnoughInliersError(min_inliers, 0);
  }

  // REFIT
  FitResult result;
  result.iterations = trials;
  result.stopped_early = stopped_early;
  result.inliers = detail::collectInliers(*best.model, matches,
                                          params_.max_epsilon);
  bool refitted = false;
  if (result.inliers.size() < sample_size) {
    // Too few inliers to refit: the minimal fit was inexact or the budget
    // ended the search before a good sample was drawn
    result.model = std::move(best.model);
  } else {
    try {
      result.model = lsq::refit(prototype, matches, result.inliers);
      refitted = true;
    } catch (const IllConditionedError& e) {
      spdlog::warn("[Ransac] Refit on {} inliers failed ({}), keeping sample fit",
                   result.inliers.size(), e.what());
      result.model = std::move(best.model);
    }
  }

  if (params_.max_trust > 0.0 && refitted) {
    try {
      const auto consensus = lsq::select(matches, result.inliers);
      auto filtered =
          filterOutliers(prototype, consensus, params_.max_trust, sample_size);
      std::vector<size_t> kept;
      kept.reserve(filtered.inliers.size());
      for (size_t idx : filtered.inliers) kept.push_back(result.inliers[idx]);
      spdlog::debug("[Ransac] Trust filter kept {} of {} inliers", kept.size(),
                    result.inliers.size());
      result.inliers = std::move(kept);
      result.model = std::move(filtered.model);
    } catch (const IllConditionedError& e) {
      spdlog::warn("[Ransac] Trust filter failed ({}), keeping refit consensus",
                   e.what());
    } catch (const NotEnoughInliersError& e) {
      if (!stopped_early) throw;
      spdlog::warn("[Ransac] Trust filter failed after early stop ({}), "
                   "keeping refit consensus",
                   e.what());
    }
  }

  // TERMINATE
  const size_t ratio_inliers = static_cast<size_t>(
      std::ceil(params_.min_inlier_ratio * static_cast<double>(n)));
  const size_t needed = std::max(min_inliers, ratio_inliers);
  if (result.inliers.size() < needed) {
    if (!stopped_early) {
      spdlog::debug("[Ransac] Best consensus {} of {} below required {}",
                    result.inliers.size(), n, needed);
      throw NotEnoughInliersError(needed, result.inliers.size());
    }
    spdlog::warn("[Ransac] Stopped early with {} inliers (required {})",
                 result.inliers.size(), needed);
  }

  result.cost = meanResidual(*result.model, lsq::select(matches, result.inliers));
  result.parameters = result.model->parameters();

  spdlog::debug("[Ransac] {}: {} / {} inliers after {} trials, cost {:.4f}{}",
                result.model->name(), result.inliers.size(), n, trials,
                result.cost, stopped_early ? " (stopped early)" : "");
  return result;
}

FitResult estimate(const Correspondences& matches, ModelType type,
                   double max_epsilon, size_t min_inliers, double confidence,
                   size_t max_iterations, uint64_t seed) {
  config::Ransac params;
  params.max_epsilon = max_epsilon;
  params.min_inliers = min_inliers;
  params.confidence = confidence;
  params.max_iterations = max_iterations;
  params.seed = seed;
  return RobustEstimator(params).run(matches, type);
}

}  // namespace fastreg
