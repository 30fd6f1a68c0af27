// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_bluenoise_integration.cpp
 *
 * End-to-end tests for the one-shot API and the sampling helpers.
 */

#include <gtest/gtest.h>

#include <cmath>
#include <cstdio>
#include <random>
#include <set>

#include "bluenoise/bluenoise.hpp"
#include "bluenoise/io/xyz.hpp"

using namespace bluenoise;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

std::vector<Point> randomSphere(std::size_t count, double radius,
                                unsigned seed) {
  std::mt19937 gen(seed);
  std::normal_distribution<double> dist(0.0, 1.0);
  std::vector<Point> points;
  points.reserve(count);
  while (points.size() < count) {
    Point p(dist(gen), dist(gen), dist(gen));
    if (p.norm() < 1e-9) continue;
    points.push_back(p.normalized() * radius);
  }
  return points;
}

}  // namespace

// ─── One-shot API ────────────────────────────────────────────────────────────

TEST(BlueNoiseIntegrationTest, EliminatePositionsUsesIndices) {
  const auto points = randomSphere(400, 1.0, 5);
  const auto ids = eliminate(points, 100, DistributionMode::Surface,
                             4.0 * EIGEN_PI);

  ASSERT_EQ(ids.size(), 100u);
  for (PointId id : ids) {
    EXPECT_GE(id, 0);
    EXPECT_LT(id, 400);
  }
}

TEST(BlueNoiseIntegrationTest, SamplesAndIdsAgree) {
  const SampleSet samples = toSamples(randomSphere(300, 2.0, 9));

  const auto ids = eliminate(samples, 60, DistributionMode::Volume);
  const auto kept = eliminateSamples(samples, 60, DistributionMode::Volume);

  ASSERT_EQ(ids.size(), kept.size());
  for (std::size_t i = 0; i < ids.size(); ++i) {
    EXPECT_EQ(kept[i].id, ids[i]);
  }
}

TEST(BlueNoiseIntegrationTest, DeterministicAcrossRuns) {
  const SampleSet samples = toSamples(randomSphere(500, 1.0, 1));
  const auto first = eliminate(samples, 120, DistributionMode::Volume);
  const auto second = eliminate(samples, 120, DistributionMode::Volume);
  EXPECT_EQ(first, second);
}

TEST(BlueNoiseIntegrationTest, SurfaceAreaSpreadsBetterThanRandom) {
  const auto points = randomSphere(2000, 1.0, 21);
  const SampleSet samples = toSamples(points);

  const auto kept = eliminateSamples(samples, 200, DistributionMode::Surface,
                                     4.0 * EIGEN_PI);

  SampleSet random(samples.begin(), samples.begin() + 200);
  EXPECT_GT(minimumSeparation(kept), minimumSeparation(random));
}

TEST(BlueNoiseIntegrationTest, EmptyInputThrows) {
  EXPECT_THROW(eliminate(std::vector<Point>{}, 1, DistributionMode::Volume),
               InvalidInput);
}

// ─── Config-driven run ───────────────────────────────────────────────────────

TEST(BlueNoiseIntegrationTest, ConfigDrivenRun) {
  Config cfg;
  cfg.sampling.count = 150;
  cfg.sampling.quality = Quality::Medium;
  cfg.sampling.emit_from = EmitFrom::Faces;
  cfg.sampling.surface_area = 4.0 * EIGEN_PI;

  const SampleSet samples = toSamples(randomSphere(300, 1.0, 17));
  const auto kept = eliminateSamples(samples, cfg);
  EXPECT_EQ(kept.size(), 150u);
}

TEST(BlueNoiseIntegrationTest, ConfigVolumeModeIgnoresArea) {
  Config cfg;
  cfg.sampling.count = 50;
  cfg.sampling.emit_from = EmitFrom::Volume;
  cfg.sampling.surface_area = 1e-6;

  const SampleSet samples = toSamples(randomSphere(200, 1.0, 3));
  const auto by_config = eliminateSamples(samples, cfg);
  const auto direct = eliminateSamples(samples, 50, DistributionMode::Volume);
  EXPECT_EQ(by_config.size(), direct.size());
  for (std::size_t i = 0; i < direct.size(); ++i) {
    EXPECT_EQ(by_config[i].id, direct[i].id);
  }
}

TEST(BlueNoiseIntegrationTest, ResultRoundTripsThroughFile) {
  const SampleSet samples = toSamples(randomSphere(200, 1.0, 8));
  const auto kept = eliminateSamples(samples, 40, DistributionMode::Volume);

  const std::string path = testing::TempDir() + "/integration.xyz";
  ASSERT_TRUE(io::saveXyz(path, kept));
  SampleSet loaded;
  ASSERT_TRUE(io::loadXyz(path, loaded));
  std::remove(path.c_str());

  ASSERT_EQ(loaded.size(), kept.size());
  EXPECT_EQ(loaded.front().id, kept.front().id);
}

// ─── Sampling helpers ────────────────────────────────────────────────────────

TEST(SamplingTest, OversamplingFactors) {
  EXPECT_DOUBLE_EQ(oversamplingFactor(Quality::Low), 1.5);
  EXPECT_DOUBLE_EQ(oversamplingFactor(Quality::Medium), 2.0);
  EXPECT_DOUBLE_EQ(oversamplingFactor(Quality::High), 5.0);
}

TEST(SamplingTest, CandidateCountRoundsUp) {
  EXPECT_EQ(candidateCount(3, Quality::Low), 5u);
  EXPECT_EQ(candidateCount(100, Quality::Medium), 200u);
  EXPECT_EQ(candidateCount(0, Quality::High), 0u);
}

TEST(SamplingTest, EmitModeMapping) {
  EXPECT_EQ(distributionMode(EmitFrom::Volume), DistributionMode::Volume);
  EXPECT_EQ(distributionMode(EmitFrom::Faces), DistributionMode::Surface);
  EXPECT_EQ(distributionMode(EmitFrom::Vertices), DistributionMode::Surface);
}

TEST(SamplingTest, ToSamplesAssignsIndices) {
  const auto samples = toSamples({Point(1, 0, 0), Point(0, 1, 0)});
  ASSERT_EQ(samples.size(), 2u);
  EXPECT_EQ(samples[0].id, 0);
  EXPECT_EQ(samples[1].id, 1);
  EXPECT_DOUBLE_EQ(samples[1].position.y(), 1.0);
}

TEST(SamplingTest, MinimumSeparation) {
  EXPECT_TRUE(std::isinf(minimumSeparation(SampleSet{})));
  const SampleSet samples = {{0, Point(0, 0, 0)},
                             {1, Point(3, 0, 0)},
                             {2, Point(3, 0.5, 0)}};
  EXPECT_DOUBLE_EQ(minimumSeparation(samples), 0.5);
}
