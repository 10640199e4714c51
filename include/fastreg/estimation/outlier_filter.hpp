// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef FASTREG_ESTIMATION_OUTLIER_FILTER_HPP
#define FASTREG_ESTIMATION_OUTLIER_FILTER_HPP

#include <memory>
#include <vector>

#include "fastreg/correspondence.hpp"
#include "fastreg/models/model.hpp"

namespace fastreg {

/// Residual floor for the trust threshold, so exact fits keep their matches
constexpr double kMinTrustResidual = 1e-9;

struct FilterResult {
  std::unique_ptr<Model> model;  ///< Fit on the retained matches
  std::vector<size_t> inliers;   ///< Retained indices into the input, ascending
};

/**
 * @brief Iterative trust-based outlier rejection.
 *
 * Repeatedly fits a copy of the prototype, then drops every match whose
 * residual exceeds max_trust × median residual, until no match is dropped.
 *
 * @param prototype Model variant to fit (its parameters are not used)
 * @param matches Candidate correspondences
 * @param max_trust Multiple of the median residual to keep (> 0)
 * @param min_num_inliers Smallest acceptable retained set
 * @throws std::invalid_argument if max_trust <= 0
 * @throws NotEnoughInliersError if fewer than min_num_inliers remain
 * @throws InsufficientDataError, IllConditionedError from fitting
 */
FilterResult filterOutliers(const Model& prototype,
                            const Correspondences& matches, double max_trust,
                            size_t min_num_inliers);

}  // namespace fastreg

#endif  // FASTREG_ESTIMATION_OUTLIER_FILTER_HPP
