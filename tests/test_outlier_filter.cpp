// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_outlier_filter.cpp
 *
 * Tests for iterative trust-based outlier rejection.
 */

#include <gtest/gtest.h>

#include "fastreg/errors.hpp"
#include "fastreg/estimation/outlier_filter.hpp"
#include "fastreg/models/affine_model.hpp"
#include "fastreg/models/translation_model.hpp"

using namespace fastreg;

namespace {

/// 20 matches shifted by (3, -1) with small alternating noise
Correspondences makeShiftedGrid() {
  Correspondences matches;
  for (int i = 0; i < 20; ++i) {
    const Point p(i % 5, i / 5);
    const double noise = (i % 2 == 0) ? 0.01 : -0.01;
    matches.emplace_back(p, Point(p + Point(3.0 + noise, -1.0 - noise)));
  }
  return matches;
}

}  // namespace

TEST(OutlierFilterTest, RemovesGrossOutliers) {
  auto matches = makeShiftedGrid();
  matches.emplace_back(Point(1, 1), Point(50, 50));    // index 20
  matches.emplace_back(Point(2, 2), Point(-40, 10));   // index 21

  TranslationModel prototype;
  auto result = filterOutliers(prototype, matches, 4.0, 1);

  ASSERT_EQ(result.inliers.size(), 20u);
  for (size_t i = 0; i < result.inliers.size(); ++i) {
    EXPECT_EQ(result.inliers[i], i);
  }
  const Point t = result.model->apply(Point(0, 0));
  EXPECT_NEAR(t.x(), 3.0, 1e-6);
  EXPECT_NEAR(t.y(), -1.0, 1e-6);
}

TEST(OutlierFilterTest, ExactFitKeepsEverything) {
  Correspondences matches;
  for (int i = 0; i < 6; ++i) {
    const Point p(i, i * i % 4);
    matches.emplace_back(p, Point(2.0 * p + Point(1, 1)));
  }
  AffineModel prototype;
  auto result = filterOutliers(prototype, matches, 3.0, 3);
  EXPECT_EQ(result.inliers.size(), matches.size());
}

TEST(OutlierFilterTest, TooFewRemainingThrows) {
  auto matches = makeShiftedGrid();
  matches.emplace_back(Point(1, 1), Point(50, 50));

  TranslationModel prototype;
  EXPECT_THROW(filterOutliers(prototype, matches, 4.0, 21),
               NotEnoughInliersError);
}

TEST(OutlierFilterTest, NonPositiveTrustThrows) {
  auto matches = makeShiftedGrid();
  TranslationModel prototype;
  EXPECT_THROW(filterOutliers(prototype, matches, 0.0, 1),
               std::invalid_argument);
}
