// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "fastreg/models/moving_least_squares.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <stdexcept>
#include <string>

#include "fastreg/errors.hpp"

namespace fastreg {

namespace {
// Queries closer than this to a control point return its target directly
constexpr double kCoincidentSquaredDistance = 1e-24;
}  // namespace

MovingLeastSquaresTransform::MovingLeastSquaresTransform(ModelType local_type,
                                                         double alpha)
    : local_type_(local_type), alpha_(alpha) {
  if (local_type == ModelType::MovingLeastSquares) {
    throw std::invalid_argument(
        "MovingLeastSquaresTransform: local model cannot itself be moving "
        "least squares");
  }
  if (!std::isfinite(alpha) || alpha < 0.0) {
    throw std::invalid_argument("MovingLeastSquaresTransform: alpha must be >= 0, got " +
                                std::to_string(alpha));
  }
}

MovingLeastSquaresTransform::MovingLeastSquaresTransform(
    const MovingLeastSquaresTransform& other)
    : local_type_(other.local_type_),
      alpha_(other.alpha_),
      matches_(other.matches_),
      global_(other.global_ ? other.global_->clone() : nullptr) {}

size_t MovingLeastSquaresTransform::minNumMatches() const {
  return fastreg::minNumMatches(local_type_);
}

void MovingLeastSquaresTransform::fit(const Correspondences& matches) {
  checkMatchCount(matches);

  // The global fit rejects degenerate control point sets up front
  auto global = createModel(local_type_);
  global->fit(matches);

  matches_ = matches;
  global_ = std::move(global);
}

Point MovingLeastSquaresTransform::apply(const Point& p) const {
  if (!global_) return p;

  Correspondences weighted;
  weighted.reserve(matches_.size());
  for (const auto& c : matches_) {
    const double d2 = (p - c.source()).squaredNorm();
    if (d2 < kCoincidentSquaredDistance) return c.target();

    const double w = c.weight() / std::pow(d2, alpha_);
    if (!std::isfinite(w)) return c.target();
    weighted.emplace_back(c.source(), c.target(), w);
  }

  auto local = createModel(local_type_);
  try {
    local->fit(weighted);
  } catch (const IllConditionedError& e) {
    spdlog::debug("[MLS] Local fit at ({}, {}) failed ({}), using global fit",
                  p.x(), p.y(), e.what());
    return global_->apply(p);
  }
  return local->apply(p);
}

Eigen::VectorXd MovingLeastSquaresTransform::parameters() const {
  Eigen::VectorXd params(1 + 5 * static_cast<Eigen::Index>(matches_.size()));
  params(0) = alpha_;
  Eigen::Index k = 1;
  for (const auto& c : matches_) {
    params(k++) = c.source().x();
    params(k++) = c.source().y();
    params(k++) = c.target().x();
    params(k++) = c.target().y();
    params(k++) = c.weight();
  }
  return params;
}

std::unique_ptr<Model> MovingLeastSquaresTransform::clone() const {
  return std::make_unique<MovingLeastSquaresTransform>(*this);
}

}  // namespace fastreg
