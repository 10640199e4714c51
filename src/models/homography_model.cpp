// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "fastreg/models/homography_model.hpp"

#include <Eigen/Geometry>
#include <Eigen/LU>
#include <Eigen/SVD>
#include <cmath>
#include <string>

#include "fastreg/errors.hpp"
#include "fastreg/estimation/least_squares.hpp"

namespace fastreg {

namespace {

constexpr double kMinSingularRatio = 1e-10;
constexpr double kSingularDeterminant = 1e-12;

/// Similarity that moves the weighted centroid to the origin and scales the
/// weighted mean distance to √2 (Hartley normalization).
Eigen::Matrix3d normalization(const Correspondences& matches, bool use_target,
                              const Point& centroid, double weight_sum) {
  double mean_dist = 0.0;
  for (const auto& c : matches) {
    const Point& p = use_target ? c.target() : c.source();
    mean_dist += c.weight() * (p - centroid).norm();
  }
  mean_dist /= weight_sum;
  if (!(mean_dist > lsq::kMinRelativeSpread * (1.0 + centroid.norm()))) {
    throw IllConditionedError(std::string("homography fit: ") +
                              (use_target ? "target" : "source") +
                              " points coincide");
  }

  const double s = std::sqrt(2.0) / mean_dist;
  Eigen::Matrix3d t = Eigen::Matrix3d::Identity();
  t(0, 0) = s;
  t(1, 1) = s;
  t(0, 2) = -s * centroid.x();
  t(1, 2) = -s * centroid.y();
  return t;
}

Eigen::Matrix3d normalizeSign(const Eigen::Matrix3d& h) {
  Eigen::Matrix3d out = h / h.norm();
  if (out(2, 2) < 0.0) out = -out;
  return out;
}

}  // namespace

void HomographyModel::fit(const Correspondences& matches) {
  checkMatchCount(matches);
  const auto m = lsq::computeMoments(matches);

  const Eigen::Matrix3d t_src =
      normalization(matches, false, m.source_centroid, m.weight_sum);
  const Eigen::Matrix3d t_dst =
      normalization(matches, true, m.target_centroid, m.weight_sum);

  // Direct linear transform, two rows per correspondence
  const Eigen::Index n = static_cast<Eigen::Index>(matches.size());
  Eigen::MatrixXd a = Eigen::MatrixXd::Zero(2 * n, 9);
  for (Eigen::Index i = 0; i < n; ++i) {
    const auto& c = matches[static_cast<size_t>(i)];
    const Eigen::Vector3d p = t_src * c.source().homogeneous();
    const Eigen::Vector3d q = t_dst * c.target().homogeneous();
    const double sw = std::sqrt(c.weight());
    const double x = p.x(), y = p.y();
    const double u = q.x(), v = q.y();

    a.row(2 * i) << 0.0, 0.0, 0.0, -x, -y, -1.0, v * x, v * y, v;
    a.row(2 * i + 1) << x, y, 1.0, 0.0, 0.0, 0.0, -u * x, -u * y, -u;
    a.row(2 * i) *= sw;
    a.row(2 * i + 1) *= sw;
  }

  Eigen::JacobiSVD<Eigen::MatrixXd> svd(a, Eigen::ComputeFullV);
  const Eigen::VectorXd& sv = svd.singularValues();
  // The solution space must be one-dimensional: σ₈ (the 8th largest) > 0
  if (sv.size() < 8 || !(sv(7) > kMinSingularRatio * sv(0))) {
    throw IllConditionedError("homography fit: rank-deficient DLT system");
  }

  const Eigen::VectorXd hv = svd.matrixV().col(8);
  Eigen::Matrix3d hn;
  hn << hv(0), hv(1), hv(2), hv(3), hv(4), hv(5), hv(6), hv(7), hv(8);
  if (!(std::abs(hn.determinant()) > kSingularDeterminant)) {
    throw IllConditionedError("homography fit: singular solution");
  }

  const Eigen::Matrix3d h = t_dst.inverse() * hn * t_src;
  if (!h.allFinite()) {
    throw IllConditionedError("homography fit: non-finite solution");
  }
  h_ = normalizeSign(h);
}

Point HomographyModel::apply(const Point& p) const {
  const Eigen::Vector3d q = h_ * p.homogeneous();
  return q.hnormalized();
}

Point HomographyModel::applyInverse(const Point& p) const {
  const double det = h_.determinant();
  if (!(std::abs(det) > kSingularDeterminant * std::pow(h_.norm(), 3))) {
    throw NonInvertibleError("homography matrix is singular (det = " +
                             std::to_string(det) + ")");
  }
  const Eigen::Vector3d q = h_.inverse() * p.homogeneous();
  return q.hnormalized();
}

Eigen::VectorXd HomographyModel::parameters() const {
  Eigen::VectorXd params(9);
  params << h_(0, 0), h_(0, 1), h_(0, 2), h_(1, 0), h_(1, 1), h_(1, 2),
      h_(2, 0), h_(2, 1), h_(2, 2);
  return params;
}

std::unique_ptr<Model> HomographyModel::clone() const {
  return std::make_unique<HomographyModel>(*this);
}

}  // namespace fastreg
