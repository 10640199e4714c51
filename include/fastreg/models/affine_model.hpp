// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef FASTREG_MODELS_AFFINE_MODEL_HPP
#define FASTREG_MODELS_AFFINE_MODEL_HPP

#include <Eigen/Core>

#include "fastreg/models/model.hpp"

namespace fastreg {

/**
 * @brief General 2D affine transform: p' = M·p + t.
 *
 * Fitting solves the 2x2 weighted normal equations of the centered
 * coordinates, (Σ wᵢ p̃ᵢ p̃ᵢᵀ)·Mᵀ = Σ wᵢ p̃ᵢ q̃ᵢᵀ, through lsq::solveSymmetric.
 * Collinear sources make the system singular and are rejected.
 *
 * Parameters: [m00, m01, m10, m11, tx, ty]
 */
class AffineModel : public Model {
 public:
  AffineModel() = default;

  ModelType type() const override { return ModelType::Affine; }
  std::string name() const override { return "AffineModel"; }
  size_t minNumMatches() const override { return 3; }

  /// @throws IllConditionedError on collinear or coincident sources
  void fit(const Correspondences& matches) override;

  Point apply(const Point& p) const override { return linear_ * p + translation_; }
  bool isInvertible() const override { return true; }

  /// @throws NonInvertibleError if det(M) is (numerically) zero
  Point applyInverse(const Point& p) const override;

  Eigen::VectorXd parameters() const override;
  std::unique_ptr<Model> clone() const override;

  const Eigen::Matrix2d& linear() const { return linear_; }
  const Point& translation() const { return translation_; }

 private:
  Eigen::Matrix2d linear_ = Eigen::Matrix2d::Identity();
  Point translation_ = Point::Zero();
};

}  // namespace fastreg

#endif  // FASTREG_MODELS_AFFINE_MODEL_HPP
