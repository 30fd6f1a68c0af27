// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * sampling.hpp
 *
 * Helpers around the candidate set: oversampling, emission mode and
 * spacing statistics.
 */

#ifndef BLUENOISE_SAMPLING_HPP
#define BLUENOISE_SAMPLING_HPP

#include <cstddef>
#include <vector>

#include "bluenoise/config/sampling.hpp"
#include "bluenoise/point_types.hpp"

namespace bluenoise {

/// Candidate-to-target ratio: Low 1.5, Medium 2, High 5.
double oversamplingFactor(Quality quality) noexcept;

/// Number of candidates to generate for count survivors (rounded up).
std::size_t candidateCount(std::size_t count, Quality quality) noexcept;

/// Volume emission maps to DistributionMode::Volume, everything else to
/// Surface.
DistributionMode distributionMode(EmitFrom emit_from) noexcept;

/// Wrap bare positions as samples with ids 0..n-1.
SampleSet toSamples(const std::vector<Point>& points);

/// Smallest pairwise distance, or +inf for fewer than two samples.
double minimumSeparation(const SampleSet& samples);

}  // namespace bluenoise

#endif  // BLUENOISE_SAMPLING_HPP
