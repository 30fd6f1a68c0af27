// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * elimination.hpp
 *
 * Heuristic constants for weighted sample elimination.
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef BLUENOISE_CONFIG_ELIMINATION_HPP
#define BLUENOISE_CONFIG_ELIMINATION_HPP

namespace bluenoise {
namespace config {

/**
 * @brief Elimination heuristics.
 *
 * weight(d) = (1 - clamp(d, 0, 2 rmax) / (2 rmax))^alpha
 * rmin      = rmax * (1 - (target / input)^gamma) * beta
 *
 * rmin is reported but never enforced as a rejection radius.
 */
struct Elimination {
  double alpha = 8.0;   ///< Weight falloff exponent
  double gamma = 1.5;   ///< rmin exponent on the target/input ratio
  double beta = 0.65;   ///< rmin scale relative to rmax
};

}  // namespace config
}  // namespace bluenoise

#endif  // BLUENOISE_CONFIG_ELIMINATION_HPP
