// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "fastreg/models/affine_model.hpp"

#include <Eigen/LU>
#include <cmath>

#include "fastreg/errors.hpp"
#include "fastreg/estimation/least_squares.hpp"

namespace fastreg {

namespace {
constexpr double kSingularDeterminant = 1e-12;
}  // namespace

void AffineModel::fit(const Correspondences& matches) {
  checkMatchCount(matches);
  const auto m = lsq::computeMoments(matches);
  if (m.sourceCollapsed()) {
    throw IllConditionedError("affine fit: source points coincide");
  }

  // (Σ p̃ p̃ᵀ)·X = Σ p̃ q̃ᵀ  →  M = Xᵀ
  const Eigen::Matrix2d x = lsq::solveSymmetric(m.source_cov, m.cross_cov);

  linear_ = x.transpose();
  translation_ = m.target_centroid - linear_ * m.source_centroid;
}

Point AffineModel::applyInverse(const Point& p) const {
  const double det = linear_.determinant();
  if (!(std::abs(det) > kSingularDeterminant * linear_.squaredNorm())) {
    throw NonInvertibleError("affine linear part is singular (det = " +
                             std::to_string(det) + ")");
  }
  return linear_.inverse() * (p - translation_);
}

Eigen::VectorXd AffineModel::parameters() const {
  Eigen::VectorXd params(6);
  params << linear_(0, 0), linear_(0, 1), linear_(1, 0), linear_(1, 1),
      translation_.x(), translation_.y();
  return params;
}

std::unique_ptr<Model> AffineModel::clone() const {
  return std::make_unique<AffineModel>(*this);
}

}  // namespace fastreg
