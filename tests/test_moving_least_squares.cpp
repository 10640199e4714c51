// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_moving_least_squares.cpp
 *
 * Tests for the moving least squares transform.
 */

#include <gtest/gtest.h>

#include <cmath>

#include "fastreg/errors.hpp"
#include "fastreg/models/moving_least_squares.hpp"

using namespace fastreg;

namespace {

/// Control points on a 4x4 grid displaced by a smooth non-affine field
Correspondences makeWarpedGrid() {
  Correspondences matches;
  for (int i = 0; i < 4; ++i) {
    for (int j = 0; j < 4; ++j) {
      const Point p(10.0 * i, 10.0 * j);
      const Point q(p.x() + 2.0 * std::sin(0.1 * p.y()),
                    p.y() + 1.5 * std::cos(0.1 * p.x()));
      matches.emplace_back(p, q);
    }
  }
  return matches;
}

}  // namespace

TEST(MovingLeastSquaresTest, InterpolatesControlPoints) {
  auto matches = makeWarpedGrid();
  MovingLeastSquaresTransform mls;
  mls.fit(matches);

  for (const auto& m : matches) {
    const Point q = mls.apply(m.source());
    EXPECT_NEAR(q.x(), m.target().x(), 1e-9);
    EXPECT_NEAR(q.y(), m.target().y(), 1e-9);
  }
}

TEST(MovingLeastSquaresTest, ReproducesAffineField) {
  Eigen::Matrix2d a;
  a << 0.9, -0.2, 0.15, 1.1;
  const Point t(-3.0, 8.0);

  Correspondences matches;
  for (const Point& p : {Point(0, 0), Point(20, 0), Point(0, 20),
                         Point(20, 20), Point(7, 13)}) {
    matches.emplace_back(p, Point(a * p + t));
  }
  MovingLeastSquaresTransform mls(ModelType::Affine, 1.0);
  mls.fit(matches);

  for (const Point& p : {Point(5, 5), Point(-10, 30), Point(12.5, 3.25)}) {
    const Point expected = a * p + t;
    EXPECT_NEAR((mls.apply(p) - expected).norm(), 0.0, 1e-8);
  }
}

TEST(MovingLeastSquaresTest, ZeroAlphaIsGlobalFit) {
  // alpha = 0 weighs all control points equally at every query
  auto matches = makeWarpedGrid();
  MovingLeastSquaresTransform mls(ModelType::Affine, 0.0);
  mls.fit(matches);

  auto global = createModel(ModelType::Affine);
  global->fit(matches);

  const Point p(13.0, 27.0);
  EXPECT_NEAR((mls.apply(p) - global->apply(p)).norm(), 0.0, 1e-9);
}

TEST(MovingLeastSquaresTest, UnfittedIsIdentity) {
  MovingLeastSquaresTransform mls;
  EXPECT_EQ(mls.apply(Point(4, -2)), Point(4, -2));
}

TEST(MovingLeastSquaresTest, RigidLocalModel) {
  auto matches = makeWarpedGrid();
  MovingLeastSquaresTransform mls(ModelType::Rigid, 1.0);
  mls.fit(matches);

  EXPECT_EQ(mls.minNumMatches(), 2u);
  const Point q = mls.apply(matches[5].source());
  EXPECT_NEAR((q - matches[5].target()).norm(), 0.0, 1e-9);
}

TEST(MovingLeastSquaresTest, InvalidSettingsThrow) {
  EXPECT_THROW(MovingLeastSquaresTransform(ModelType::MovingLeastSquares, 1.0),
               std::invalid_argument);
  EXPECT_THROW(MovingLeastSquaresTransform(ModelType::Affine, -0.5),
               std::invalid_argument);
}

TEST(MovingLeastSquaresTest, DegenerateControlPointsThrow) {
  Correspondences collinear = {
      Correspondence(Point(0, 0), Point(0, 0)),
      Correspondence(Point(1, 1), Point(1, 1)),
      Correspondence(Point(2, 2), Point(2, 2)),
  };
  MovingLeastSquaresTransform mls;
  EXPECT_THROW(mls.fit(collinear), IllConditionedError);
  EXPECT_THROW(mls.fit({collinear[0]}), InsufficientDataError);
}

TEST(MovingLeastSquaresTest, ParametersListControlPoints) {
  auto matches = makeWarpedGrid();
  MovingLeastSquaresTransform mls(ModelType::Affine, 2.0);
  mls.fit(matches);

  const Eigen::VectorXd params = mls.parameters();
  ASSERT_EQ(params.size(), static_cast<Eigen::Index>(1 + 5 * matches.size()));
  EXPECT_DOUBLE_EQ(params(0), 2.0);
  EXPECT_DOUBLE_EQ(params(1), matches[0].source().x());
  EXPECT_DOUBLE_EQ(params(5), matches[0].weight());
  EXPECT_EQ(mls.controlPoints().size(), matches.size());
}

TEST(MovingLeastSquaresTest, CloneKeepsControlPoints) {
  auto matches = makeWarpedGrid();
  MovingLeastSquaresTransform mls;
  mls.fit(matches);
  auto copy = mls.clone();

  const Point p(14.0, 6.0);
  EXPECT_EQ(copy->apply(p), mls.apply(p));
}
