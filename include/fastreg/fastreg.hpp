// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * fastreg.hpp
 *
 * FastReg: robust transform fitting from point correspondences.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef FASTREG_FASTREG_HPP
#define FASTREG_FASTREG_HPP

#include <memory>
#include <string>

// Configs
#include "fastreg/config/fastreg.hpp"

// Data types
#include "fastreg/correspondence.hpp"
#include "fastreg/errors.hpp"

// Core objects
#include "fastreg/estimation/least_squares.hpp"
#include "fastreg/estimation/outlier_filter.hpp"
#include "fastreg/estimation/ransac.hpp"
#include "fastreg/models/model.hpp"

namespace fastreg {

/**
 * @brief Configured registration entry point.
 *
 * Bundles a model prototype built from Config::model with a RobustEstimator
 * built from Config::ransac. fit() is const and holds no per-call state, so
 * one instance may serve several threads.
 */
class FastReg {
 public:
  /// Construct with default config (affine model)
  FastReg();

  /// Construct with explicit config
  explicit FastReg(const Config& cfg);

  /// Load config from a YAML file
  static FastReg fromFile(const std::string& path);

  /// Estimate the configured model from the given matches
  FitResult fit(const Correspondences& matches,
                const Budget& budget = {}) const;

  const Config& config() const noexcept { return cfg_; }
  const Model& prototype() const noexcept { return *prototype_; }

 private:
  Config cfg_;
  std::shared_ptr<const Model> prototype_;
  RobustEstimator estimator_;
};

}  // namespace fastreg

#endif  // FASTREG_FASTREG_HPP
