// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * config_fastreg.cpp
 *
 * YAML configuration loading.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "fastreg/config/fastreg.hpp"
#include "fastreg/models/model.hpp"

namespace fastreg {
namespace detail {

template <typename T>
void load(const YAML::Node& node, const std::string& key, T& value) {
  if (node[key]) {
    value = node[key].as<T>();
  }
}

ModelType parseModelTypeOr(const std::string& name, ModelType fallback) {
  try {
    return parseModelType(name);
  } catch (const std::invalid_argument&) {
    spdlog::warn("[Config] Unknown model type '{}', defaulting to {}", name,
                 toString(fallback));
    return fallback;
  }
}

Config parse(const YAML::Node& root) {
  Config cfg;

  // Model selection
  if (auto n = root["model"]) {
    std::string type_str;
    load(n, "type", type_str);
    if (!type_str.empty()) cfg.model.type = parseModelTypeOr(type_str, cfg.model.type);
    if (auto mls = n["mls"]) {
      std::string local_str;
      load(mls, "local_type", local_str);
      if (!local_str.empty())
        cfg.model.mls.local_type =
            parseModelTypeOr(local_str, cfg.model.mls.local_type);
      load(mls, "alpha", cfg.model.mls.alpha);
    }
  }

  // Robust estimation
  if (auto n = root["ransac"]) {
    auto& r = cfg.ransac;
    load(n, "max_epsilon", r.max_epsilon);
    load(n, "min_inliers", r.min_inliers);
    load(n, "min_inlier_ratio", r.min_inlier_ratio);
    load(n, "confidence", r.confidence);
    load(n, "max_iterations", r.max_iterations);
    load(n, "min_iterations", r.min_iterations);
    load(n, "max_resample_attempts", r.max_resample_attempts);
    load(n, "seed", r.seed);
    load(n, "max_trust", r.max_trust);
    load(n, "num_threads", r.num_threads);
    load(n, "batch_size", r.batch_size);
  }

  return cfg;
}

void validate(Config& cfg) {
  auto& r = cfg.ransac;

  // --- Fatal: parameters the estimator cannot run with ---
  if (!(r.max_epsilon > 0.0)) {
    throw std::invalid_argument("ransac.max_epsilon must be > 0, got " +
                                std::to_string(r.max_epsilon));
  }
  if (!(r.confidence > 0.0 && r.confidence < 1.0)) {
    throw std::invalid_argument("ransac.confidence must be in (0, 1), got " +
                                std::to_string(r.confidence));
  }
  if (r.max_iterations == 0) {
    throw std::invalid_argument("ransac.max_iterations must be > 0");
  }
  if (r.min_iterations > r.max_iterations) {
    throw std::invalid_argument(
        "ransac: min_iterations (" + std::to_string(r.min_iterations) +
        ") > max_iterations (" + std::to_string(r.max_iterations) + ")");
  }
  if (cfg.model.mls.local_type == ModelType::MovingLeastSquares) {
    throw std::invalid_argument(
        "model.mls.local_type cannot be moving_least_squares");
  }

  // --- Non-fatal: warn and clamp ---
  if (r.min_inlier_ratio < 0.0 || r.min_inlier_ratio > 1.0) {
    spdlog::warn("[Config] ransac.min_inlier_ratio ({}) out of range [0, 1], "
                 "clamping",
                 r.min_inlier_ratio);
    r.min_inlier_ratio = std::clamp(r.min_inlier_ratio, 0.0, 1.0);
  }
  if (r.max_trust < 0.0) {
    spdlog::warn("[Config] ransac.max_trust ({}) must be >= 0, clamping to 0 "
                 "(disabled)",
                 r.max_trust);
    r.max_trust = 0.0;
  }
  if (r.max_resample_attempts == 0) {
    spdlog::warn("[Config] ransac.max_resample_attempts must be > 0, "
                 "clamping to 1");
    r.max_resample_attempts = 1;
  }
  if (r.batch_size == 0) {
    spdlog::warn("[Config] ransac.batch_size must be > 0, clamping to 1");
    r.batch_size = 1;
  }
  if (r.num_threads < 0) {
    spdlog::warn("[Config] ransac.num_threads ({}) must be >= 0, clamping to 1",
                 r.num_threads);
    r.num_threads = 1;
  }

  const size_t min_matches = minNumMatches(cfg.model.type);
  if (r.min_inliers < min_matches) {
    spdlog::warn("[Config] ransac.min_inliers ({}) below {} minimum ({}), "
                 "clamping",
                 r.min_inliers, toString(cfg.model.type), min_matches);
    r.min_inliers = min_matches;
  }

  if (!std::isfinite(cfg.model.mls.alpha) || cfg.model.mls.alpha < 0.0) {
    spdlog::warn("[Config] model.mls.alpha ({}) must be >= 0, clamping to 1.0",
                 cfg.model.mls.alpha);
    cfg.model.mls.alpha = 1.0;
  }
}

}  // namespace detail

Config parseConfig(const YAML::Node& root) {
  auto cfg = detail::parse(root);
  detail::validate(cfg);
  return cfg;
}

Config loadConfig(const std::string& path) {
  try {
    return parseConfig(YAML::LoadFile(path));
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load config: " + path + " - " +
                             e.what());
  }
}

}  // namespace fastreg
