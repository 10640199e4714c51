// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_config.cpp
 *
 * Tests for YAML configuration loading and validation.
 */

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <fstream>

#include "fastreg/config/fastreg.hpp"

using namespace fastreg;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

/// Write a temporary YAML file and return its path.
std::string writeTempYaml(const std::string& content,
                          const std::string& name = "test_config.yaml") {
  std::string path = "/tmp/" + name;
  std::ofstream fs(path);
  fs << content;
  return path;
}

}  // namespace

// ─── Loading Tests ───────────────────────────────────────────────────────────

TEST(ConfigLoadTest, LoadDefaultYaml) {
  auto cfg = loadConfig(FASTREG_CONFIG_DIR "/default.yaml");

  EXPECT_EQ(cfg.model.type, ModelType::Affine);
  EXPECT_EQ(cfg.model.mls.local_type, ModelType::Affine);
  EXPECT_DOUBLE_EQ(cfg.ransac.max_epsilon, 2.0);
  EXPECT_EQ(cfg.ransac.min_inliers, 7u);
  EXPECT_DOUBLE_EQ(cfg.ransac.confidence, 0.99);
  EXPECT_EQ(cfg.ransac.max_iterations, 1000u);
  EXPECT_EQ(cfg.ransac.seed, 42u);
}

TEST(ConfigLoadTest, NonexistentFileThrows) {
  EXPECT_THROW(loadConfig("/nonexistent/path.yaml"), std::runtime_error);
}

TEST(ConfigLoadTest, MalformedYamlThrows) {
  auto path = writeTempYaml("ransac: [unterminated\n", "test_malformed.yaml");
  EXPECT_THROW(loadConfig(path), std::runtime_error);
}

TEST(ConfigLoadTest, EmptyYamlUsesDefaults) {
  auto path = writeTempYaml("# empty config\n", "test_empty.yaml");
  auto cfg = loadConfig(path);

  Config defaults;
  EXPECT_EQ(cfg.model.type, defaults.model.type);
  EXPECT_EQ(cfg.ransac.max_iterations, defaults.ransac.max_iterations);
  EXPECT_DOUBLE_EQ(cfg.ransac.max_epsilon, defaults.ransac.max_epsilon);
}

TEST(ConfigLoadTest, PartialYamlPreservesDefaults) {
  auto path = writeTempYaml(
      "ransac:\n"
      "  max_epsilon: 0.5\n"
      "  seed: 1234\n",
      "test_partial.yaml");
  auto cfg = loadConfig(path);

  EXPECT_DOUBLE_EQ(cfg.ransac.max_epsilon, 0.5);
  EXPECT_EQ(cfg.ransac.seed, 1234u);

  Config defaults;
  EXPECT_EQ(cfg.model.type, defaults.model.type);
  EXPECT_DOUBLE_EQ(cfg.ransac.confidence, defaults.ransac.confidence);
}

TEST(ConfigLoadTest, AllModelTypes) {
  const std::pair<const char*, ModelType> cases[] = {
      {"translation", ModelType::Translation},
      {"rigid", ModelType::Rigid},
      {"similarity", ModelType::Similarity},
      {"affine", ModelType::Affine},
      {"homography", ModelType::Homography},
      {"mls", ModelType::MovingLeastSquares},
  };
  for (const auto& c : cases) {
    auto cfg = parseConfig(YAML::Load(std::string("model:\n  type: ") + c.first));
    EXPECT_EQ(cfg.model.type, c.second) << c.first;
  }
}

TEST(ConfigLoadTest, MlsSettings) {
  auto cfg = parseConfig(YAML::Load(
      "model:\n"
      "  type: moving_least_squares\n"
      "  mls:\n"
      "    local_type: similarity\n"
      "    alpha: 2.0\n"));
  EXPECT_EQ(cfg.model.type, ModelType::MovingLeastSquares);
  EXPECT_EQ(cfg.model.mls.local_type, ModelType::Similarity);
  EXPECT_DOUBLE_EQ(cfg.model.mls.alpha, 2.0);
}

TEST(ConfigLoadTest, UnknownModelFallsBack) {
  auto cfg = parseConfig(YAML::Load("model:\n  type: thin_plate_spline\n"));
  EXPECT_EQ(cfg.model.type, ModelType::Affine);
}

// ─── Validation Tests ────────────────────────────────────────────────────────

TEST(ConfigValidateTest, NonPositiveEpsilonThrows) {
  EXPECT_THROW(parseConfig(YAML::Load("ransac:\n  max_epsilon: 0.0\n")),
               std::invalid_argument);
}

TEST(ConfigValidateTest, ConfidenceOutOfRangeThrows) {
  EXPECT_THROW(parseConfig(YAML::Load("ransac:\n  confidence: 1.0\n")),
               std::invalid_argument);
  EXPECT_THROW(parseConfig(YAML::Load("ransac:\n  confidence: 0.0\n")),
               std::invalid_argument);
}

TEST(ConfigValidateTest, IterationBoundsThrow) {
  EXPECT_THROW(parseConfig(YAML::Load("ransac:\n  max_iterations: 0\n")),
               std::invalid_argument);
  EXPECT_THROW(parseConfig(YAML::Load("ransac:\n"
                                      "  min_iterations: 50\n"
                                      "  max_iterations: 10\n")),
               std::invalid_argument);
}

TEST(ConfigValidateTest, RecursiveMlsThrows) {
  EXPECT_THROW(parseConfig(YAML::Load("model:\n"
                                      "  mls:\n"
                                      "    local_type: mls\n")),
               std::invalid_argument);
}

TEST(ConfigValidateTest, RecoverableValuesAreClamped) {
  auto cfg = parseConfig(YAML::Load(
      "model:\n"
      "  type: homography\n"
      "  mls:\n"
      "    alpha: -1.0\n"
      "ransac:\n"
      "  min_inliers: 2\n"
      "  min_inlier_ratio: 1.5\n"
      "  max_trust: -3.0\n"
      "  max_resample_attempts: 0\n"
      "  num_threads: -2\n"
      "  batch_size: 0\n"));

  EXPECT_EQ(cfg.ransac.min_inliers, 4u);  // homography minimum
  EXPECT_DOUBLE_EQ(cfg.ransac.min_inlier_ratio, 1.0);
  EXPECT_DOUBLE_EQ(cfg.ransac.max_trust, 0.0);
  EXPECT_EQ(cfg.ransac.max_resample_attempts, 1u);
  EXPECT_EQ(cfg.ransac.num_threads, 1);
  EXPECT_EQ(cfg.ransac.batch_size, 1u);
  EXPECT_DOUBLE_EQ(cfg.model.mls.alpha, 1.0);
}
