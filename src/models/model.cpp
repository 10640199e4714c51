// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * model.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "fastreg/models/model.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

#include "fastreg/errors.hpp"
#include "fastreg/models/affine_model.hpp"
#include "fastreg/models/homography_model.hpp"
#include "fastreg/models/moving_least_squares.hpp"
#include "fastreg/models/rigid_model.hpp"
#include "fastreg/models/similarity_model.hpp"
#include "fastreg/models/translation_model.hpp"

namespace fastreg {

Point Model::applyInverse(const Point& /*p*/) const {
  throw NonInvertibleError(name() + " has no inverse");
}

void Model::checkMatchCount(const Correspondences& matches) const {
  if (matches.size() < minNumMatches()) {
    throw InsufficientDataError(minNumMatches(), matches.size());
  }
}

std::unique_ptr<Model> createModel(ModelType type) {
  switch (type) {
    case ModelType::Translation:
      return std::make_unique<TranslationModel>();
    case ModelType::Rigid:
      return std::make_unique<RigidModel>();
    case ModelType::Similarity:
      return std::make_unique<SimilarityModel>();
    case ModelType::Affine:
      return std::make_unique<AffineModel>();
    case ModelType::Homography:
      return std::make_unique<HomographyModel>();
    case ModelType::MovingLeastSquares:
      return std::make_unique<MovingLeastSquaresTransform>();
    default:
      spdlog::warn("[Model] Unknown type ({}), falling back to affine",
                   static_cast<int>(type));
      return std::make_unique<AffineModel>();
  }
}

std::unique_ptr<Model> createModel(const config::Model& cfg) {
  if (cfg.type == ModelType::MovingLeastSquares) {
    return std::make_unique<MovingLeastSquaresTransform>(cfg.mls.local_type,
                                                         cfg.mls.alpha);
  }
  return createModel(cfg.type);
}

size_t minNumMatches(ModelType type) {
  switch (type) {
    case ModelType::Translation:
      return 1;
    case ModelType::Rigid:
    case ModelType::Similarity:
      return 2;
    case ModelType::Affine:
      return 3;
    case ModelType::Homography:
      return 4;
    case ModelType::MovingLeastSquares:
      return minNumMatches(ModelType::Affine);
  }
  return createModel(type)->minNumMatches();
}

std::string toString(ModelType type) {
  switch (type) {
    case ModelType::Translation:
      return "translation";
    case ModelType::Rigid:
      return "rigid";
    case ModelType::Similarity:
      return "similarity";
    case ModelType::Affine:
      return "affine";
    case ModelType::Homography:
      return "homography";
    case ModelType::MovingLeastSquares:
      return "moving_least_squares";
  }
  return "unknown";
}

ModelType parseModelType(const std::string& name) {
  if (name == "translation") return ModelType::Translation;
  if (name == "rigid") return ModelType::Rigid;
  if (name == "similarity") return ModelType::Similarity;
  if (name == "affine") return ModelType::Affine;
  if (name == "homography" || name == "projective") return ModelType::Homography;
  if (name == "moving_least_squares" || name == "mls")
    return ModelType::MovingLeastSquares;
  throw std::invalid_argument("Unknown model type '" + name + "'");
}

}  // namespace fastreg
