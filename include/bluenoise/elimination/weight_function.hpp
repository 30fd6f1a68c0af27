// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * weight_function.hpp
 *
 * Compactly supported distance falloff used to score local sample density.
 */

#ifndef BLUENOISE_ELIMINATION_WEIGHT_FUNCTION_HPP
#define BLUENOISE_ELIMINATION_WEIGHT_FUNCTION_HPP

#include <algorithm>
#include <cmath>
#include <string>

#include "bluenoise/exceptions.hpp"

namespace bluenoise {

/**
 * @brief Pairwise weight w(d) = (1 - clamp(d, 0, 2 rmax) / (2 rmax))^alpha.
 *
 * Equals 1 for coincident points, decreases monotonically with distance and
 * is exactly zero at and beyond the support radius 2 rmax.
 */
class WeightFunction {
 public:
  explicit WeightFunction(double rmax, double alpha = 8.0)
      : support_(2.0 * rmax), alpha_(alpha) {
    if (!std::isfinite(rmax)) {
      throw NumericInstability("WeightFunction",
                               "rmax is not finite (" + std::to_string(rmax) +
                                   ")");
    }
    if (rmax <= 0.0) {
      throw InvalidInput("WeightFunction",
                         "rmax must be > 0, got " + std::to_string(rmax));
    }
    if (!(alpha > 0.0) || !std::isfinite(alpha)) {
      throw InvalidInput("WeightFunction",
                         "alpha must be > 0, got " + std::to_string(alpha));
    }
  }

  double operator()(double d) const {
    const double clamped = std::clamp(d, 0.0, support_);
    return std::pow(1.0 - clamped / support_, alpha_);
  }

  /// Distance beyond which two points no longer interact (2 rmax).
  double supportRadius() const noexcept { return support_; }
  double alpha() const noexcept { return alpha_; }

 private:
  double support_;
  double alpha_;
};

}  // namespace bluenoise

#endif  // BLUENOISE_ELIMINATION_WEIGHT_FUNCTION_HPP
