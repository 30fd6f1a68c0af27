// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * data_generator.hpp
 *
 * Synthetic candidate sets for examples (uniform white noise).
 */

#ifndef EXAMPLES_COMMON_DATA_GENERATOR_HPP
#define EXAMPLES_COMMON_DATA_GENERATOR_HPP

#include <bluenoise/point_types.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <random>
#include <string>

namespace examples {

/// Uniform points inside an axis-aligned box [0, size]^3.
inline bluenoise::SampleSet generateBoxCloud(std::size_t count, double size,
                                             unsigned seed = 42) {
  std::mt19937 rng(seed);
  std::uniform_real_distribution<double> u(0.0, size);

  bluenoise::SampleSet samples;
  samples.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    samples.push_back({static_cast<bluenoise::PointId>(i),
                       bluenoise::Point(u(rng), u(rng), u(rng))});
  }
  return samples;
}

/// Uniform points on a sphere surface (area 4 pi r^2).
inline bluenoise::SampleSet generateSphereCloud(std::size_t count,
                                                double radius,
                                                unsigned seed = 42) {
  std::mt19937 rng(seed);
  std::normal_distribution<double> n(0.0, 1.0);

  bluenoise::SampleSet samples;
  samples.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    bluenoise::Point p(n(rng), n(rng), n(rng));
    samples.push_back({static_cast<bluenoise::PointId>(i),
                       radius * p.normalized()});
  }
  return samples;
}

/// Uniform random subset of the given size (reference white noise).
inline bluenoise::SampleSet randomSubset(const bluenoise::SampleSet& samples,
                                         std::size_t count,
                                         unsigned seed = 7) {
  bluenoise::SampleSet shuffled = samples;
  std::shuffle(shuffled.begin(), shuffled.end(), std::mt19937(seed));
  shuffled.resize(std::min(count, shuffled.size()));
  return shuffled;
}

inline void printSummary(const std::string& label,
                         const bluenoise::SampleSet& samples,
                         double min_separation) {
  std::cout << "  " << label << ": " << samples.size()
            << " points, min separation " << min_separation << std::endl;
}

}  // namespace examples

#endif  // EXAMPLES_COMMON_DATA_GENERATOR_HPP
