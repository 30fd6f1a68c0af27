// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * point_types.hpp
 *
 * Point and sample type aliases for bluenoise.
 */

#ifndef BLUENOISE_POINT_TYPES_HPP
#define BLUENOISE_POINT_TYPES_HPP

#include <Eigen/Core>
#include <cstdint>
#include <vector>

namespace bluenoise {

using Point = Eigen::Vector3d;

/// Caller-supplied identifier. Unique within one input set, not necessarily
/// contiguous.
using PointId = std::int64_t;

/// Identified candidate position.
struct Sample {
  PointId id = 0;
  Point position = Point::Zero();
};

using SampleSet = std::vector<Sample>;

/// Distribution the candidates were drawn from.
enum class DistributionMode {
  Volume,  ///< Points fill a 3D volume (random close packing bound)
  Surface  ///< Points lie on a 2D surface (hexagonal packing bound)
};

}  // namespace bluenoise

#endif  // BLUENOISE_POINT_TYPES_HPP
