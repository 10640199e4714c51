// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "fastreg/models/rigid_model.hpp"

#include <cmath>

#include "fastreg/errors.hpp"
#include "fastreg/estimation/least_squares.hpp"

namespace fastreg {

void RigidModel::fit(const Correspondences& matches) {
  checkMatchCount(matches);
  const auto m = lsq::computeMoments(matches);
  if (m.sourceCollapsed()) {
    throw IllConditionedError("rigid fit: source points coincide");
  }
  if (m.targetCollapsed()) {
    throw IllConditionedError("rigid fit: target points coincide");
  }

  const double cos_sum = m.cross_cov(0, 0) + m.cross_cov(1, 1);
  const double sin_sum = m.cross_cov(0, 1) - m.cross_cov(1, 0);
  const double norm = std::hypot(cos_sum, sin_sum);
  if (!(norm > lsq::kMinRelativeSpread *
                   std::sqrt(m.source_spread * m.target_spread))) {
    throw IllConditionedError("rigid fit: rotation is undefined");
  }

  cos_ = cos_sum / norm;
  sin_ = sin_sum / norm;
  translation_ = m.target_centroid - Point(cos_ * m.source_centroid.x() -
                                               sin_ * m.source_centroid.y(),
                                           sin_ * m.source_centroid.x() +
                                               cos_ * m.source_centroid.y());
}

Point RigidModel::apply(const Point& p) const {
  return Point(cos_ * p.x() - sin_ * p.y() + translation_.x(),
               sin_ * p.x() + cos_ * p.y() + translation_.y());
}

Point RigidModel::applyInverse(const Point& p) const {
  const Point d = p - translation_;
  return Point(cos_ * d.x() + sin_ * d.y(), -sin_ * d.x() + cos_ * d.y());
}

Eigen::VectorXd RigidModel::parameters() const {
  Eigen::VectorXd params(4);
  params << cos_, sin_, translation_.x(), translation_.y();
  return params;
}

std::unique_ptr<Model> RigidModel::clone() const {
  return std::make_unique<RigidModel>(*this);
}

double RigidModel::angle() const { return std::atan2(sin_, cos_); }

}  // namespace fastreg
