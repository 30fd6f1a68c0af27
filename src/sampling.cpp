// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "bluenoise/sampling.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "bluenoise/search/spatial_index.hpp"

namespace bluenoise {

double oversamplingFactor(Quality quality) noexcept {
  switch (quality) {
    case Quality::Low:
      return 1.5;
    case Quality::High:
      return 5.0;
    case Quality::Medium:
    default:
      return 2.0;
  }
}

std::size_t candidateCount(std::size_t count, Quality quality) noexcept {
  return static_cast<std::size_t>(
      std::ceil(static_cast<double>(count) * oversamplingFactor(quality)));
}

DistributionMode distributionMode(EmitFrom emit_from) noexcept {
  return emit_from == EmitFrom::Volume ? DistributionMode::Volume
                                       : DistributionMode::Surface;
}

SampleSet toSamples(const std::vector<Point>& points) {
  SampleSet samples;
  samples.reserve(points.size());
  for (std::size_t i = 0; i < points.size(); ++i) {
    samples.push_back(Sample{static_cast<PointId>(i), points[i]});
  }
  return samples;
}

double minimumSeparation(const SampleSet& samples) {
  double min_dist = std::numeric_limits<double>::infinity();
  if (samples.size() < 2) return min_dist;

  SpatialIndex index(samples);
  for (std::size_t slot = 0; slot < index.size(); ++slot) {
    if (auto nb = index.nearest(slot)) {
      min_dist = std::min(min_dist, nb->distance);
    }
  }
  return min_dist;
}

}  // namespace bluenoise
