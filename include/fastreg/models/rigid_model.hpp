// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef FASTREG_MODELS_RIGID_MODEL_HPP
#define FASTREG_MODELS_RIGID_MODEL_HPP

#include "fastreg/models/model.hpp"

namespace fastreg {

/**
 * @brief Rotation plus translation: p' = R(θ)·p + t.
 *
 * Closed-form weighted Procrustes on centered coordinates:
 *   θ = atan2(Σ wᵢ (p̃ᵢ × q̃ᵢ), Σ wᵢ (p̃ᵢ · q̃ᵢ)),  t = q̄ - R·p̄
 *
 * Parameters: [cos θ, sin θ, tx, ty]
 */
class RigidModel : public Model {
 public:
  RigidModel() = default;

  ModelType type() const override { return ModelType::Rigid; }
  std::string name() const override { return "RigidModel"; }
  size_t minNumMatches() const override { return 2; }

  /// @throws IllConditionedError if source or target points coincide
  void fit(const Correspondences& matches) override;

  Point apply(const Point& p) const override;
  bool isInvertible() const override { return true; }
  Point applyInverse(const Point& p) const override;

  Eigen::VectorXd parameters() const override;
  std::unique_ptr<Model> clone() const override;

  double angle() const;
  const Point& translation() const { return translation_; }

 private:
  double cos_ = 1.0;
  double sin_ = 0.0;
  Point translation_ = Point::Zero();
};

}  // namespace fastreg

#endif  // FASTREG_MODELS_RIGID_MODEL_HPP
