// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * radius_heuristics.hpp
 *
 * Falloff radius bounds derived from the geometry of the candidate set.
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef BLUENOISE_ELIMINATION_RADIUS_HEURISTICS_HPP
#define BLUENOISE_ELIMINATION_RADIUS_HEURISTICS_HPP

#include <Eigen/Core>
#include <cstddef>
#include <optional>

#include "bluenoise/config/elimination.hpp"
#include "bluenoise/point_types.hpp"

namespace bluenoise {

/// Falloff radius bounds.
struct Radii {
  double rmax = 0.0;  ///< Weight support is 2 * rmax
  double rmin = 0.0;  ///< Reported lower bound (not enforced)
};

/// Axis-aligned bounding box extents (max - min per axis).
/// Returns zero extents for an empty set.
Eigen::Vector3d boundingExtents(const SampleSet& samples);

/// rmax from 3D random close packing: (V / (4 sqrt(2) N))^(1/3).
double volumeRadius(double volume, std::size_t target_count);

/// rmax from 2D hexagonal close packing: sqrt(A / (2 sqrt(3) N)).
double surfaceRadius(double area, std::size_t target_count);

/**
 * @brief Reject bounding boxes that give no usable radius bound.
 *
 * Every extent must be positive, unless a reference area is supplied in
 * Surface mode: flat or thin surfaces are then sized by the area alone.
 *
 * @throws InvalidInput on a zero extent without a usable area, or a
 *         non-positive area
 */
void checkExtents(const Eigen::Vector3d& extents, DistributionMode mode,
                  std::optional<double> surface_area = std::nullopt);

/**
 * @brief Compute rmax and rmin for a candidate set.
 *
 * The volume bound is evaluated whenever the bounding box has volume. In
 * Surface mode with a reference area, the tighter of the volume and surface
 * bounds is used.
 *
 * @param extents Bounding box extents of the candidates
 * @param input_count Number of candidates (M)
 * @param target_count Number of survivors (N)
 * @param mode Volume or Surface distribution
 * @param surface_area Optional reference area (Surface mode only)
 * @param cfg Heuristic constants (gamma, beta)
 * @throws InvalidInput on zero counts, degenerate extents or a bad area
 * @throws NumericInstability if a radius is not finite
 */
Radii computeRadii(const Eigen::Vector3d& extents, std::size_t input_count,
                   std::size_t target_count, DistributionMode mode,
                   std::optional<double> surface_area = std::nullopt,
                   const config::Elimination& cfg = {});

}  // namespace bluenoise

#endif  // BLUENOISE_ELIMINATION_RADIUS_HEURISTICS_HPP
