// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef FASTREG_MODELS_SIMILARITY_MODEL_HPP
#define FASTREG_MODELS_SIMILARITY_MODEL_HPP

#include "fastreg/models/model.hpp"

namespace fastreg {

/**
 * @brief Isotropic scale, rotation and translation.
 *
 *   [x']   [a  -b] [x]   [tx]
 *   [y'] = [b   a] [y] + [ty],   a = s·cos θ,  b = s·sin θ
 *
 * Parameters: [a, b, tx, ty]
 */
class SimilarityModel : public Model {
 public:
  SimilarityModel() = default;

  ModelType type() const override { return ModelType::Similarity; }
  std::string name() const override { return "SimilarityModel"; }
  size_t minNumMatches() const override { return 2; }

  /// @throws IllConditionedError on coincident points or zero scale
  void fit(const Correspondences& matches) override;

  Point apply(const Point& p) const override;
  bool isInvertible() const override { return true; }

  /// @throws NonInvertibleError if the scale is zero
  Point applyInverse(const Point& p) const override;

  Eigen::VectorXd parameters() const override;
  std::unique_ptr<Model> clone() const override;

  double scale() const;
  double angle() const;
  const Point& translation() const { return translation_; }

 private:
  double a_ = 1.0;
  double b_ = 0.0;
  Point translation_ = Point::Zero();
};

}  // namespace fastreg

#endif  // FASTREG_MODELS_SIMILARITY_MODEL_HPP
