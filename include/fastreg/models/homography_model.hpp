// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef FASTREG_MODELS_HOMOGRAPHY_MODEL_HPP
#define FASTREG_MODELS_HOMOGRAPHY_MODEL_HPP

#include <Eigen/Core>

#include "fastreg/models/model.hpp"

namespace fastreg {

/**
 * @brief Projective transform (8 DoF).
 *
 *   [x']   [h00 h01 h02] [x]
 *   [y'] ~ [h10 h11 h12] [y]
 *   [w']   [h20 h21 h22] [1]
 *
 * Fitted with the Hartley-normalized direct linear transform, rows scaled
 * by √wᵢ. This minimizes the weighted algebraic error, which equals the
 * geometric error only for affine data.
 *
 * Parameters: [h00 .. h22] row-major. After fit() H has unit Frobenius
 * norm and h22 >= 0.
 * apply() returns non-finite coordinates for points on the line at infinity.
 */
class HomographyModel : public Model {
 public:
  HomographyModel() = default;

  ModelType type() const override { return ModelType::Homography; }
  std::string name() const override { return "HomographyModel"; }
  size_t minNumMatches() const override { return 4; }

  /// @throws IllConditionedError on rank-deficient or singular solutions
  void fit(const Correspondences& matches) override;

  Point apply(const Point& p) const override;
  bool isInvertible() const override { return true; }

  /// @throws NonInvertibleError if H is (numerically) singular
  Point applyInverse(const Point& p) const override;

  Eigen::VectorXd parameters() const override;
  std::unique_ptr<Model> clone() const override;

  const Eigen::Matrix3d& matrix() const { return h_; }

 private:
  Eigen::Matrix3d h_ = Eigen::Matrix3d::Identity();
};

}  // namespace fastreg

#endif  // FASTREG_MODELS_HOMOGRAPHY_MODEL_HPP
