// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "bluenoise/bluenoise.hpp"

#include <spdlog/spdlog.h>

namespace bluenoise {

std::vector<PointId> eliminate(const SampleSet& samples,
                               std::int64_t target_count,
                               DistributionMode mode,
                               std::optional<double> surface_area,
                               const config::Elimination& cfg) {
  SampleElimination elimination(samples, target_count, mode, surface_area,
                                cfg);
  elimination.eliminate();
  return elimination.survivors();
}

std::vector<PointId> eliminate(const std::vector<Point>& points,
                               std::int64_t target_count,
                               DistributionMode mode,
                               std::optional<double> surface_area,
                               const config::Elimination& cfg) {
  return eliminate(toSamples(points), target_count, mode, surface_area, cfg);
}

SampleSet eliminateSamples(const SampleSet& samples, std::int64_t target_count,
                           DistributionMode mode,
                           std::optional<double> surface_area,
                           const config::Elimination& cfg) {
  SampleElimination elimination(samples, target_count, mode, surface_area,
                                cfg);
  elimination.eliminate();
  return elimination.survivingSamples();
}

SampleSet eliminateSamples(const SampleSet& samples, const Config& cfg) {
  const auto& s = cfg.sampling;
  const DistributionMode mode = distributionMode(s.emit_from);

  std::optional<double> area;
  if (mode == DistributionMode::Surface && s.surface_area > 0.0) {
    area = s.surface_area;
  }

  const auto expected = candidateCount(s.count, s.quality);
  if (samples.size() < expected) {
    spdlog::warn(
        "[BlueNoise] {} candidates for {} targets, expected at least {} at "
        "this quality",
        samples.size(), s.count, expected);
  }

  return eliminateSamples(samples, static_cast<std::int64_t>(s.count), mode,
                          area, cfg.elimination);
}

}  // namespace bluenoise
