// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "bluenoise/elimination/radius_heuristics.hpp"

#include <Eigen/Geometry>
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

#include "bluenoise/exceptions.hpp"

namespace bluenoise {

Eigen::Vector3d boundingExtents(const SampleSet& samples) {
  if (samples.empty()) return Eigen::Vector3d::Zero();

  Eigen::AlignedBox3d box;
  for (const auto& s : samples) {
    box.extend(s.position);
  }
  return box.sizes();
}

double volumeRadius(double volume, std::size_t target_count) {
  const double n = static_cast<double>(target_count);
  return std::cbrt(volume / (4.0 * std::sqrt(2.0) * n));
}

double surfaceRadius(double area, std::size_t target_count) {
  const double n = static_cast<double>(target_count);
  return std::sqrt(area / (2.0 * std::sqrt(3.0) * n));
}

void checkExtents(const Eigen::Vector3d& extents, DistributionMode mode,
                  std::optional<double> surface_area) {
  if (!extents.allFinite()) {
    throw InvalidInput("RadiusHeuristics", "non-finite bounding box extents");
  }
  if (mode == DistributionMode::Surface && surface_area) {
    const double area = *surface_area;
    if (!(area > 0.0) || !std::isfinite(area)) {
      throw InvalidInput("RadiusHeuristics",
                         "surface area must be > 0, got " +
                             std::to_string(area));
    }
    return;
  }
  for (int i = 0; i < 3; ++i) {
    if (!(extents[i] > 0.0)) {
      throw InvalidInput("RadiusHeuristics",
                         "degenerate bounding box extent along axis " +
                             std::to_string(i) + " (" +
                             std::to_string(extents[i]) + ")");
    }
  }
}

Radii computeRadii(const Eigen::Vector3d& extents, std::size_t input_count,
                   std::size_t target_count, DistributionMode mode,
                   std::optional<double> surface_area,
                   const config::Elimination& cfg) {
  if (input_count == 0) {
    throw InvalidInput("RadiusHeuristics", "input point count is zero");
  }
  if (target_count == 0) {
    throw InvalidInput("RadiusHeuristics", "target count is zero");
  }
  checkExtents(extents, mode, surface_area);

  Radii radii;
  radii.rmax = std::numeric_limits<double>::infinity();
  if (extents.minCoeff() > 0.0) {
    radii.rmax = volumeRadius(extents.prod(), target_count);
  }

  // Surface bound only with a known reference area
  if (mode == DistributionMode::Surface && surface_area) {
    radii.rmax =
        std::min(radii.rmax, surfaceRadius(*surface_area, target_count));
  }

  if (!std::isfinite(radii.rmax) || radii.rmax <= 0.0) {
    throw NumericInstability("RadiusHeuristics",
                             "rmax is not a positive finite value (" +
                                 std::to_string(radii.rmax) + ")");
  }

  const double ratio = static_cast<double>(target_count) /
                       static_cast<double>(input_count);
  radii.rmin = radii.rmax * (1.0 - std::pow(ratio, cfg.gamma)) * cfg.beta;

  if (!std::isfinite(radii.rmin)) {
    throw NumericInstability("RadiusHeuristics",
                             "rmin is not finite (" +
                                 std::to_string(radii.rmin) + ")");
  }
  return radii;
}

}  // namespace bluenoise
