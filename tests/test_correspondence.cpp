// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_correspondence.cpp
 *
 * Tests for correspondence construction and residual helpers.
 */

#include <gtest/gtest.h>

#include <limits>

#include "fastreg/correspondence.hpp"
#include "fastreg/models/translation_model.hpp"

using namespace fastreg;

namespace {

TranslationModel shiftBy(double dx, double dy) {
  TranslationModel model;
  model.fit({Correspondence(Point(0, 0), Point(dx, dy))});
  return model;
}

}  // namespace

TEST(CorrespondenceTest, DefaultWeightIsOne) {
  Correspondence c(Point(1, 2), Point(3, 4));
  EXPECT_DOUBLE_EQ(c.weight(), 1.0);
  EXPECT_EQ(c.source(), Point(1, 2));
  EXPECT_EQ(c.target(), Point(3, 4));
}

TEST(CorrespondenceTest, ZeroWeightAllowed) {
  Correspondence c(Point(0, 0), Point(1, 1), 0.0);
  EXPECT_DOUBLE_EQ(c.weight(), 0.0);
}

TEST(CorrespondenceTest, InvalidWeightThrows) {
  EXPECT_THROW(Correspondence(Point(0, 0), Point(0, 0), -1.0),
               std::invalid_argument);
  EXPECT_THROW(Correspondence(Point(0, 0), Point(0, 0),
                              std::numeric_limits<double>::quiet_NaN()),
               std::invalid_argument);
  EXPECT_THROW(Correspondence(Point(0, 0), Point(0, 0),
                              std::numeric_limits<double>::infinity()),
               std::invalid_argument);
}

TEST(CorrespondenceTest, Residual) {
  auto model = shiftBy(1.0, 0.0);
  Correspondence c(Point(0, 0), Point(4, 4));
  // apply(0,0) = (1,0), target (4,4) → distance 5
  EXPECT_DOUBLE_EQ(c.residual(model), 5.0);
  EXPECT_DOUBLE_EQ(c.squaredResidual(model), 25.0);
}

TEST(CorrespondenceTest, WeightedAggregates) {
  auto model = shiftBy(0.0, 0.0);
  Correspondences matches = {
      Correspondence(Point(0, 0), Point(1, 0), 1.0),  // r = 1
      Correspondence(Point(0, 0), Point(3, 0), 3.0),  // r = 3
  };

  EXPECT_DOUBLE_EQ(weightedSquaredError(model, matches), 1.0 + 3.0 * 9.0);
  EXPECT_DOUBLE_EQ(meanResidual(model, matches), (1.0 + 9.0) / 4.0);
  EXPECT_DOUBLE_EQ(maxResidual(model, matches), 3.0);
}

TEST(CorrespondenceTest, EmptySetAggregatesAreZero) {
  auto model = shiftBy(1.0, 1.0);
  Correspondences empty;
  EXPECT_DOUBLE_EQ(weightedSquaredError(model, empty), 0.0);
  EXPECT_DOUBLE_EQ(meanResidual(model, empty), 0.0);
  EXPECT_DOUBLE_EQ(maxResidual(model, empty), 0.0);
}
