// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "fastreg/estimation/outlier_filter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>

#include "fastreg/errors.hpp"
#include "fastreg/estimation/least_squares.hpp"

namespace fastreg {

namespace {

double median(std::vector<double> values) {
  const size_t mid = values.size() / 2;
  std::nth_element(values.begin(), values.begin() + mid, values.end());
  if (values.size() % 2 == 1) return values[mid];
  const double upper = values[mid];
  const double lower = *std::max_element(values.begin(), values.begin() + mid);
  return 0.5 * (lower + upper);
}

}  // namespace

FilterResult filterOutliers(const Model& prototype,
                            const Correspondences& matches, double max_trust,
                            size_t min_num_inliers) {
  if (!(max_trust > 0.0)) {
    throw std::invalid_argument("filterOutliers: max_trust must be > 0, got " +
                                std::to_string(max_trust));
  }
  if (matches.size() < min_num_inliers) {
    throw NotEnoughInliersError(min_num_inliers, matches.size());
  }

  std::vector<size_t> indices(matches.size());
  std::iota(indices.begin(), indices.end(), 0);

  FilterResult result;
  std::vector<double> residuals;
  size_t round = 0;
  while (true) {
    result.model = lsq::refit(prototype, matches, indices);

    residuals.clear();
    for (size_t idx : indices) {
      residuals.push_back(matches[idx].residual(*result.model));
    }
    const double threshold =
        std::max(max_trust * median(residuals), kMinTrustResidual);

    std::vector<size_t> kept;
    kept.reserve(indices.size());
    for (size_t k = 0; k < indices.size(); ++k) {
      if (residuals[k] <= threshold) kept.push_back(indices[k]);
    }

    ++round;
    if (kept.size() == indices.size()) break;

    spdlog::debug("[Filter] Round {}: removed {} of {} matches (threshold {:.4f})",
                  round, indices.size() - kept.size(), indices.size(),
                  threshold);
    if (kept.size() < min_num_inliers) {
      throw NotEnoughInliersError(min_num_inliers, kept.size());
    }
    indices = std::move(kept);
  }

  result.inliers = std::move(indices);
  return result;
}

}  // namespace fastreg
