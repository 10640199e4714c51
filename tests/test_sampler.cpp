// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_sampler.cpp
 *
 * Tests for reproducible per-trial index sampling.
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <set>

#include "fastreg/estimation/sampler.hpp"

using namespace fastreg;

TEST(SamplerTest, SameSeedAndTrialGiveSameSample) {
  SampleGenerator a(42, 7);
  SampleGenerator b(42, 7);
  std::vector<size_t> sa, sb;
  a.drawSample(100, 4, sa);
  b.drawSample(100, 4, sb);
  EXPECT_EQ(sa, sb);
}

TEST(SamplerTest, TrialsDrawIndependentStreams) {
  std::vector<size_t> s0, s1;
  SampleGenerator(42, 0).drawSample(1000, 4, s0);
  SampleGenerator(42, 1).drawSample(1000, 4, s1);
  EXPECT_NE(s0, s1);
}

TEST(SamplerTest, SampleIndicesAreDistinctAndInRange) {
  SampleGenerator rng(3, 0);
  std::vector<size_t> sample;
  for (int round = 0; round < 200; ++round) {
    rng.drawSample(5, 4, sample);
    ASSERT_EQ(sample.size(), 4u);
    std::set<size_t> unique(sample.begin(), sample.end());
    EXPECT_EQ(unique.size(), 4u);
    EXPECT_LT(*std::max_element(sample.begin(), sample.end()), 5u);
  }
}

TEST(SamplerTest, FullSampleIsPermutation) {
  SampleGenerator rng(11, 2);
  std::vector<size_t> sample;
  rng.drawSample(6, 6, sample);
  std::sort(sample.begin(), sample.end());
  EXPECT_EQ(sample, (std::vector<size_t>{0, 1, 2, 3, 4, 5}));
}

TEST(SamplerTest, UniformIndexCoversRange) {
  SampleGenerator rng(5, 0);
  std::vector<int> counts(3, 0);
  for (int i = 0; i < 3000; ++i) ++counts[rng.uniformIndex(3)];
  for (int c : counts) {
    EXPECT_GT(c, 800);
    EXPECT_LT(c, 1200);
  }
}

TEST(SamplerTest, SplitMixIsDeterministic) {
  EXPECT_EQ(splitMix64(0), splitMix64(0));
  EXPECT_NE(splitMix64(0), splitMix64(1));
}
