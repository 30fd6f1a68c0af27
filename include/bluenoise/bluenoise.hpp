// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * bluenoise.hpp
 *
 * BlueNoise: weighted sample elimination for 3D point sets.
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef BLUENOISE_BLUENOISE_HPP
#define BLUENOISE_BLUENOISE_HPP

#include <cstdint>
#include <optional>
#include <vector>

// Configs
#include "bluenoise/config/bluenoise.hpp"

// Data types
#include "bluenoise/exceptions.hpp"
#include "bluenoise/point_types.hpp"

// Core objects
#include "bluenoise/elimination/radius_heuristics.hpp"
#include "bluenoise/elimination/sample_elimination.hpp"
#include "bluenoise/elimination/weight_function.hpp"
#include "bluenoise/sampling.hpp"
#include "bluenoise/search/spatial_index.hpp"

namespace bluenoise {

// ─── Free functions: one-shot elimination ────────────────────────────

/**
 * @brief Thin samples to target_count points with blue noise spacing.
 *
 * Builds a SampleElimination, runs it to completion and returns the
 * surviving identifiers in input order.
 *
 * @param samples Candidates with unique identifiers
 * @param target_count Number of survivors (>= 0); clamped to samples.size()
 * @param mode Volume or Surface distribution
 * @param surface_area Optional reference area (Surface mode only)
 * @param cfg Heuristic constants
 * @throws InvalidInput on empty input, negative target, degenerate bounding
 *         box or duplicate identifiers
 */
std::vector<PointId> eliminate(const SampleSet& samples,
                               std::int64_t target_count,
                               DistributionMode mode,
                               std::optional<double> surface_area = std::nullopt,
                               const config::Elimination& cfg = {});

/// Positions only; identifiers are the vector indices.
std::vector<PointId> eliminate(const std::vector<Point>& points,
                               std::int64_t target_count,
                               DistributionMode mode,
                               std::optional<double> surface_area = std::nullopt,
                               const config::Elimination& cfg = {});

/// Same as eliminate(), returning the surviving samples with positions.
SampleSet eliminateSamples(const SampleSet& samples, std::int64_t target_count,
                           DistributionMode mode,
                           std::optional<double> surface_area = std::nullopt,
                           const config::Elimination& cfg = {});

/// Run with sampling options from a loaded Config.
SampleSet eliminateSamples(const SampleSet& samples, const Config& cfg);

}  // namespace bluenoise

#endif  // BLUENOISE_BLUENOISE_HPP
