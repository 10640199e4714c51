// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "fastreg/correspondence.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "fastreg/models/model.hpp"

namespace fastreg {

Correspondence::Correspondence(const Point& source, const Point& target,
                               double weight)
    : source_(source), target_(target), weight_(weight) {
  if (!std::isfinite(weight) || weight < 0.0) {
    throw std::invalid_argument("Correspondence weight must be finite and >= 0, got " +
                                std::to_string(weight));
  }
}

double Correspondence::residual(const Model& model) const {
  return (model.apply(source_) - target_).norm();
}

double Correspondence::squaredResidual(const Model& model) const {
  return (model.apply(source_) - target_).squaredNorm();
}

double weightedSquaredError(const Model& model, const Correspondences& matches) {
  double sum = 0.0;
  for (const auto& m : matches) {
    sum += m.weight() * m.squaredResidual(model);
  }
  return sum;
}

double meanResidual(const Model& model, const Correspondences& matches) {
  double sum = 0.0;
  double weight_sum = 0.0;
  for (const auto& m : matches) {
    sum += m.weight() * m.residual(model);
    weight_sum += m.weight();
  }
  return (weight_sum > 0.0) ? sum / weight_sum : 0.0;
}

double maxResidual(const Model& model, const Correspondences& matches) {
  double max_r = 0.0;
  for (const auto& m : matches) {
    max_r = std::max(max_r, m.residual(model));
  }
  return max_r;
}

}  // namespace fastreg
