// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * correspondence.hpp
 *
 * Weighted point correspondence between source and target image space.
 */

#ifndef FASTREG_CORRESPONDENCE_HPP
#define FASTREG_CORRESPONDENCE_HPP

#include <Eigen/Core>
#include <vector>

namespace fastreg {

using Point = Eigen::Vector2d;

class Model;

/**
 * @brief Immutable matched pair of 2D coordinates with a weight.
 *
 * Collections of correspondences are the sole input to model fitting.
 * The weight scales the squared residual in the least-squares cost and
 * defaults to 1.
 */
class Correspondence {
 public:
  /// @throws std::invalid_argument if weight is negative or not finite
  Correspondence(const Point& source, const Point& target, double weight = 1.0);

  const Point& source() const { return source_; }
  const Point& target() const { return target_; }
  double weight() const { return weight_; }

  /// ||model.apply(source) - target||
  double residual(const Model& model) const;

  /// ||model.apply(source) - target||²
  double squaredResidual(const Model& model) const;

 private:
  Point source_;
  Point target_;
  double weight_;
};

using Correspondences = std::vector<Correspondence>;

/// Σ wᵢ·||apply(srcᵢ) - tgtᵢ||², the quantity minimized by fitting.
double weightedSquaredError(const Model& model, const Correspondences& matches);

/// Weighted mean residual Σ wᵢ·rᵢ / Σ wᵢ (0 for an empty or zero-weight set).
double meanResidual(const Model& model, const Correspondences& matches);

/// Largest residual over the set (0 for an empty set).
double maxResidual(const Model& model, const Correspondences& matches);

}  // namespace fastreg

#endif  // FASTREG_CORRESPONDENCE_HPP
