// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "fastreg/models/translation_model.hpp"

#include "fastreg/estimation/least_squares.hpp"

namespace fastreg {

void TranslationModel::fit(const Correspondences& matches) {
  checkMatchCount(matches);
  const auto m = lsq::computeMoments(matches);
  translation_ = m.target_centroid - m.source_centroid;
}

Eigen::VectorXd TranslationModel::parameters() const {
  Eigen::VectorXd params(2);
  params << translation_.x(), translation_.y();
  return params;
}

std::unique_ptr<Model> TranslationModel::clone() const {
  return std::make_unique<TranslationModel>(*this);
}

}  // namespace fastreg
