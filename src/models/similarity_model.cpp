// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "fastreg/models/similarity_model.hpp"

#include <cmath>

#include "fastreg/errors.hpp"
#include "fastreg/estimation/least_squares.hpp"

namespace fastreg {

void SimilarityModel::fit(const Correspondences& matches) {
  checkMatchCount(matches);
  const auto m = lsq::computeMoments(matches);
  if (m.sourceCollapsed()) {
    throw IllConditionedError("similarity fit: source points coincide");
  }
  if (m.targetCollapsed()) {
    throw IllConditionedError("similarity fit: zero scale (target points coincide)");
  }

  const double a = (m.cross_cov(0, 0) + m.cross_cov(1, 1)) / m.source_spread;
  const double b = (m.cross_cov(0, 1) - m.cross_cov(1, 0)) / m.source_spread;
  if (!(std::hypot(a, b) > 0.0) || !std::isfinite(a) || !std::isfinite(b)) {
    throw IllConditionedError("similarity fit: zero scale");
  }

  a_ = a;
  b_ = b;
  const Point& c = m.source_centroid;
  translation_ = m.target_centroid -
                 Point(a_ * c.x() - b_ * c.y(), b_ * c.x() + a_ * c.y());
}

Point SimilarityModel::apply(const Point& p) const {
  return Point(a_ * p.x() - b_ * p.y() + translation_.x(),
               b_ * p.x() + a_ * p.y() + translation_.y());
}

Point SimilarityModel::applyInverse(const Point& p) const {
  const double det = a_ * a_ + b_ * b_;
  if (!(det > 0.0)) {
    throw NonInvertibleError("similarity has zero scale");
  }
  const Point d = p - translation_;
  return Point((a_ * d.x() + b_ * d.y()) / det, (-b_ * d.x() + a_ * d.y()) / det);
}

Eigen::VectorXd SimilarityModel::parameters() const {
  Eigen::VectorXd params(4);
  params << a_, b_, translation_.x(), translation_.y();
  return params;
}

std::unique_ptr<Model> SimilarityModel::clone() const {
  return std::make_unique<SimilarityModel>(*this);
}

double SimilarityModel::scale() const { return std::hypot(a_, b_); }

double SimilarityModel::angle() const { return std::atan2(b_, a_); }

}  // namespace fastreg
