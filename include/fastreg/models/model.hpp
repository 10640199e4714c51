// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * model.hpp
 *
 * Interface of the coordinate transform model family.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef FASTREG_MODELS_MODEL_HPP
#define FASTREG_MODELS_MODEL_HPP

#include <Eigen/Core>
#include <memory>
#include <string>

#include "fastreg/config/model.hpp"
#include "fastreg/correspondence.hpp"

namespace fastreg {

/**
 * @brief Abstract 2D coordinate transform fitted from correspondences.
 *
 * The capability set is {fit, apply, applyInverse}. Every variant derives
 * directly from this class; the ModelType tag selects the variant through
 * createModel() and fixes the minimum number of correspondences.
 *
 * Parameters are only ever set by fit(). A failed fit throws and leaves the
 * previous parameters untouched. A default-constructed model is the
 * identity transform.
 */
class Model {
 public:
  virtual ~Model() = default;

  virtual ModelType type() const = 0;
  virtual std::string name() const = 0;

  /// Minimum number of correspondences for fit() (degrees of freedom / 2)
  virtual size_t minNumMatches() const = 0;

  /**
   * @brief Weighted least-squares fit to the correspondences.
   *
   * @throws InsufficientDataError if matches.size() < minNumMatches()
   * @throws IllConditionedError on degenerate geometry
   */
  virtual void fit(const Correspondences& matches) = 0;

  /// Map a source point into target space.
  virtual Point apply(const Point& p) const = 0;

  /// Whether applyInverse() is supported by this variant.
  virtual bool isInvertible() const { return false; }

  /**
   * @brief Map a target point back into source space.
   *
   * @throws NonInvertibleError if the variant is not invertible or the
   *         current parameters do not describe a bijection
   */
  virtual Point applyInverse(const Point& p) const;

  /// Current parameter vector (layout is variant specific)
  virtual Eigen::VectorXd parameters() const = 0;

  virtual std::unique_ptr<Model> clone() const = 0;

 protected:
  /// @throws InsufficientDataError if too few matches for this model
  void checkMatchCount(const Correspondences& matches) const;
};

/// Factory: create an identity model of the given type
std::unique_ptr<Model> createModel(ModelType type);

/// Factory: create model from config (applies moving least squares settings)
std::unique_ptr<Model> createModel(const config::Model& cfg);

/// Minimum number of correspondences needed to fit a model of this type
size_t minNumMatches(ModelType type);

std::string toString(ModelType type);

/// @throws std::invalid_argument on unknown name
ModelType parseModelType(const std::string& name);

}  // namespace fastreg

#endif  // FASTREG_MODELS_MODEL_HPP
