// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * moving_least_squares.hpp
 *
 * Smooth deformation by moving least squares (Schaefer et al. 2006).
 */

#ifndef FASTREG_MODELS_MOVING_LEAST_SQUARES_HPP
#define FASTREG_MODELS_MOVING_LEAST_SQUARES_HPP

#include <memory>

#include "fastreg/models/model.hpp"

namespace fastreg {

/**
 * @brief Moving least squares transform.
 *
 * Instead of one global parameter set, apply(p) fits a local model to the
 * control points reweighted by
 *
 *   wᵢ(p) = weightᵢ / |p - srcᵢ|^(2α)
 *
 * and evaluates it at p. The map interpolates the control points exactly.
 * fit() only stores the control points and a global fit of the local model
 * type, which serves as fallback where a local fit is ill-conditioned.
 *
 * Not invertible: applyInverse() throws NonInvertibleError.
 */
class MovingLeastSquaresTransform : public Model {
 public:
  /// @throws std::invalid_argument if local_type is MovingLeastSquares or
  ///         alpha is negative
  explicit MovingLeastSquaresTransform(ModelType local_type = ModelType::Affine,
                                       double alpha = 1.0);

  MovingLeastSquaresTransform(const MovingLeastSquaresTransform& other);
  MovingLeastSquaresTransform& operator=(const MovingLeastSquaresTransform&) = delete;

  ModelType type() const override { return ModelType::MovingLeastSquares; }
  std::string name() const override { return "MovingLeastSquaresTransform"; }
  size_t minNumMatches() const override;

  void fit(const Correspondences& matches) override;

  Point apply(const Point& p) const override;

  /// Flattened control points: [alpha, (sx, sy, tx, ty, w) per point]
  Eigen::VectorXd parameters() const override;
  std::unique_ptr<Model> clone() const override;

  ModelType localType() const { return local_type_; }
  double alpha() const { return alpha_; }
  const Correspondences& controlPoints() const { return matches_; }

 private:
  ModelType local_type_;
  double alpha_;
  Correspondences matches_;
  std::unique_ptr<Model> global_;  ///< Fallback fit over all control points
};

}  // namespace fastreg

#endif  // FASTREG_MODELS_MOVING_LEAST_SQUARES_HPP
