// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_spatial_index.cpp
 *
 * Tests for KD-tree radius and nearest neighbor queries.
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <random>

#include "bluenoise/search/spatial_index.hpp"

using namespace bluenoise;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

std::vector<PointId> sortedIds(const std::vector<Neighbor>& neighbors) {
  std::vector<PointId> ids;
  for (const auto& nb : neighbors) ids.push_back(nb.id);
  std::sort(ids.begin(), ids.end());
  return ids;
}

}  // namespace

class SpatialIndexTest : public ::testing::Test {
 protected:
  // Points on the x axis at 0, 1, 2, 3 with ids 10, 20, 30, 40
  SampleSet line = {{10, Point(0, 0, 0)},
                    {20, Point(1, 0, 0)},
                    {30, Point(2, 0, 0)},
                    {40, Point(3, 0, 0)}};
};

// ─── Radius queries ──────────────────────────────────────────────────────────

TEST_F(SpatialIndexTest, SizeAndAccessors) {
  SpatialIndex index(line);
  EXPECT_FALSE(index.empty());
  EXPECT_EQ(index.size(), 4u);
  EXPECT_EQ(index.id(2), 30);
  EXPECT_DOUBLE_EQ(index.position(3).x(), 3.0);
}

TEST_F(SpatialIndexTest, RadiusExcludesQueriedPoint) {
  SpatialIndex index(line);
  auto hits = index.radius(1, 0.5);
  EXPECT_TRUE(hits.empty());
}

TEST_F(SpatialIndexTest, RadiusBoundaryIsInclusive) {
  SpatialIndex index(line);
  auto hits = index.radius(1, 1.0);
  EXPECT_EQ(sortedIds(hits), (std::vector<PointId>{10, 30}));
  for (const auto& nb : hits) {
    EXPECT_DOUBLE_EQ(nb.distance, 1.0);
  }
}

TEST_F(SpatialIndexTest, RadiusReportsSlotAndDistance) {
  SpatialIndex index(line);
  auto hits = index.radius(0, 2.5);
  ASSERT_EQ(hits.size(), 2u);
  for (const auto& nb : hits) {
    EXPECT_EQ(index.id(nb.slot), nb.id);
    EXPECT_DOUBLE_EQ(nb.distance, index.position(nb.slot).x());
  }
}

TEST_F(SpatialIndexTest, CenterQueryHasNoExclusion) {
  SpatialIndex index(line);
  auto hits = index.radius(Point(1, 0, 0), 1.0);
  EXPECT_EQ(sortedIds(hits), (std::vector<PointId>{10, 20, 30}));
}

TEST_F(SpatialIndexTest, NegativeRadiusIsEmpty) {
  SpatialIndex index(line);
  EXPECT_TRUE(index.radius(0, -1.0).empty());
}

TEST_F(SpatialIndexTest, ReusesOutputBuffer) {
  SpatialIndex index(line);
  std::vector<Neighbor> out;
  index.radius(0, 3.0, out);
  EXPECT_EQ(out.size(), 3u);
  index.radius(0, 0.5, out);
  EXPECT_TRUE(out.empty());
}

TEST(SpatialIndexDuplicateTest, CoincidentPointsAreNeighbors) {
  SampleSet samples = {{1, Point(0.5, 0.5, 0.5)}, {2, Point(0.5, 0.5, 0.5)}};
  SpatialIndex index(samples);

  auto hits = index.radius(0, 0.0);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].id, 2);
  EXPECT_DOUBLE_EQ(hits[0].distance, 0.0);
}

TEST(SpatialIndexEmptyTest, EmptyIndexAnswersNothing) {
  SpatialIndex index(SampleSet{});
  EXPECT_TRUE(index.empty());
  EXPECT_TRUE(index.radius(Point::Zero(), 10.0).empty());
}

// ─── Nearest neighbor ────────────────────────────────────────────────────────

TEST_F(SpatialIndexTest, NearestSkipsSelf) {
  line.push_back({50, Point(3.25, 0, 0)});
  SpatialIndex index(line);

  auto nb = index.nearest(3);
  ASSERT_TRUE(nb.has_value());
  EXPECT_EQ(nb->id, 50);
  EXPECT_DOUBLE_EQ(nb->distance, 0.25);
}

TEST(SpatialIndexNearestTest, SinglePointHasNoNeighbor) {
  SampleSet samples = {{7, Point(1, 2, 3)}};
  SpatialIndex index(samples);
  EXPECT_FALSE(index.nearest(0).has_value());
}

TEST(SpatialIndexNearestTest, MatchesBruteForce) {
  std::mt19937 gen(7);
  std::uniform_real_distribution<double> dist(0.0, 1.0);
  SampleSet samples;
  for (PointId i = 0; i < 300; ++i) {
    samples.push_back({i, Point(dist(gen), dist(gen), dist(gen))});
  }
  SpatialIndex index(samples);

  for (std::size_t i = 0; i < samples.size(); i += 17) {
    double best = std::numeric_limits<double>::infinity();
    for (std::size_t j = 0; j < samples.size(); ++j) {
      if (i == j) continue;
      best = std::min(best,
                      (samples[i].position - samples[j].position).norm());
    }
    auto nb = index.nearest(i);
    ASSERT_TRUE(nb.has_value());
    EXPECT_NEAR(nb->distance, best, 1e-12);
  }
}

TEST(SpatialIndexRadiusTest, MatchesBruteForce) {
  std::mt19937 gen(11);
  std::uniform_real_distribution<double> dist(-1.0, 1.0);
  SampleSet samples;
  for (PointId i = 0; i < 500; ++i) {
    samples.push_back({i, Point(dist(gen), dist(gen), dist(gen))});
  }
  SpatialIndex index(samples);

  const double r = 0.3;
  for (std::size_t i = 0; i < samples.size(); i += 23) {
    std::vector<PointId> expected;
    for (std::size_t j = 0; j < samples.size(); ++j) {
      if (i == j) continue;
      if ((samples[i].position - samples[j].position).norm() <= r) {
        expected.push_back(samples[j].id);
      }
    }
    EXPECT_EQ(sortedIds(index.radius(i, r)), expected);
  }
}
