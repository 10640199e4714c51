// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "fastreg/estimation/least_squares.hpp"

#include <Eigen/Cholesky>
#include <Eigen/Eigenvalues>
#include <cmath>
#include <stdexcept>
#include <string>

#include "fastreg/errors.hpp"

namespace fastreg {
namespace lsq {

namespace {

bool collapsed(double spread, double weight_sum, const Point& centroid) {
  // Spread is compared against the squared magnitude of the coordinates so
  // that round-off from centering far-away points is not mistaken for
  // geometry.
  const double scale = weight_sum * (1.0 + centroid.squaredNorm());
  return !(spread > kMinRelativeSpread * scale);
}

}  // namespace

bool Moments::sourceCollapsed() const {
  return collapsed(source_spread, weight_sum, source_centroid);
}

bool Moments::targetCollapsed() const {
  return collapsed(target_spread, weight_sum, target_centroid);
}

Moments computeMoments(const Correspondences& matches) {
  Moments m;
  for (const auto& c : matches) {
    m.weight_sum += c.weight();
    m.source_centroid += c.weight() * c.source();
    m.target_centroid += c.weight() * c.target();
  }
  if (!(m.weight_sum > 0.0)) {
    throw IllConditionedError("total correspondence weight is zero");
  }
  m.source_centroid /= m.weight_sum;
  m.target_centroid /= m.weight_sum;

  for (const auto& c : matches) {
    const Point p = c.source() - m.source_centroid;
    const Point q = c.target() - m.target_centroid;
    m.source_cov += c.weight() * p * p.transpose();
    m.cross_cov += c.weight() * p * q.transpose();
    m.target_spread += c.weight() * q.squaredNorm();
  }
  m.source_spread = m.source_cov.trace();
  return m;
}

double reciprocalCondition(const Eigen::MatrixXd& normal) {
  if (normal.size() == 0 || !normal.allFinite()) return 0.0;

  const Eigen::VectorXd diag = normal.diagonal();
  if ((diag.array() <= 0.0).any()) return 0.0;

  const Eigen::VectorXd s = diag.cwiseSqrt().cwiseInverse();
  const Eigen::MatrixXd scaled = s.asDiagonal() * normal * s.asDiagonal();

  Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> eig(scaled,
                                                     Eigen::EigenvaluesOnly);
  if (eig.info() != Eigen::Success) return 0.0;

  // Eigenvalues are sorted ascending
  const Eigen::VectorXd& ev = eig.eigenvalues();
  const double largest = ev(ev.size() - 1);
  if (!(largest > 0.0) || ev(0) <= 0.0) return 0.0;
  return ev(0) / largest;
}

Eigen::MatrixXd solveSymmetric(const Eigen::MatrixXd& normal,
                               const Eigen::MatrixXd& rhs) {
  if (normal.rows() != normal.cols() || rhs.rows() != normal.rows()) {
    throw std::invalid_argument("solveSymmetric: dimension mismatch (" +
                                std::to_string(normal.rows()) + "x" +
                                std::to_string(normal.cols()) + " vs " +
                                std::to_string(rhs.rows()) + " rows)");
  }
  if (!normal.allFinite() || !rhs.allFinite()) {
    throw IllConditionedError("normal equations contain non-finite values");
  }

  const double rcond = reciprocalCondition(normal);
  if (!(rcond > kMinReciprocalCondition)) {
    throw IllConditionedError("normal matrix is singular (reciprocal condition " +
                              std::to_string(rcond) + ")");
  }

  // N = D⁻¹·S·D⁻¹ with S unit-diagonal; solve S·Y = D·B, then X = D·Y
  const Eigen::VectorXd s = normal.diagonal().cwiseSqrt().cwiseInverse();
  const Eigen::MatrixXd scaled = s.asDiagonal() * normal * s.asDiagonal();

  Eigen::LDLT<Eigen::MatrixXd> ldlt(scaled);
  if (ldlt.info() != Eigen::Success || !ldlt.isPositive()) {
    throw IllConditionedError("LDLT factorization failed");
  }
  const Eigen::MatrixXd y = ldlt.solve(s.asDiagonal() * rhs);
  Eigen::MatrixXd x = s.asDiagonal() * y;

  if (!x.allFinite()) {
    throw IllConditionedError("solution contains non-finite values");
  }
  return x;
}

std::unique_ptr<Model> fitModel(ModelType type, const Correspondences& matches) {
  auto model = createModel(type);
  model->fit(matches);
  return model;
}

std::unique_ptr<Model> refit(const Model& prototype,
                             const Correspondences& matches,
                             const std::vector<size_t>& indices) {
  auto model = prototype.clone();
  model->fit(select(matches, indices));
  return model;
}

Correspondences select(const Correspondences& matches,
                       const std::vector<size_t>& indices) {
  Correspondences subset;
  subset.reserve(indices.size());
  for (size_t idx : indices) {
    subset.push_back(matches.at(idx));
  }
  return subset;
}

}  // namespace lsq
}  // namespace fastreg
