// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef FASTREG_MODELS_TRANSLATION_MODEL_HPP
#define FASTREG_MODELS_TRANSLATION_MODEL_HPP

#include "fastreg/models/model.hpp"

namespace fastreg {

/**
 * @brief Pure translation: p' = p + t.
 *
 * Least-squares solution is the difference of the weighted centroids.
 * Parameters: [tx, ty]
 */
class TranslationModel : public Model {
 public:
  TranslationModel() = default;

  ModelType type() const override { return ModelType::Translation; }
  std::string name() const override { return "TranslationModel"; }
  size_t minNumMatches() const override { return 1; }

  void fit(const Correspondences& matches) override;

  Point apply(const Point& p) const override { return p + translation_; }
  bool isInvertible() const override { return true; }
  Point applyInverse(const Point& p) const override { return p - translation_; }

  Eigen::VectorXd parameters() const override;
  std::unique_ptr<Model> clone() const override;

  const Point& translation() const { return translation_; }

 private:
  Point translation_ = Point::Zero();
};

}  // namespace fastreg

#endif  // FASTREG_MODELS_TRANSLATION_MODEL_HPP
