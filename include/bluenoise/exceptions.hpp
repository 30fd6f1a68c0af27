// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * exceptions.hpp
 *
 * Exception hierarchy for sample elimination errors.
 *
 * Exception hierarchy:
 *   InvalidInput       - Malformed or degenerate arguments (std::invalid_argument)
 *   NumericInstability - Non-finite radius or weight (std::runtime_error)
 *
 * Both are raised before any partial result is produced:
 *   try {
 *     auto ids = bluenoise::eliminate(samples, 1000, DistributionMode::Volume);
 *   } catch (const bluenoise::InvalidInput& e) {
 *     // e.component() == "SampleElimination", e.message() == "..."
 *   }
 */

#ifndef BLUENOISE_EXCEPTIONS_HPP
#define BLUENOISE_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace bluenoise {

/**
 * @brief Malformed or degenerate input.
 *
 * Examples:
 * - Empty sample set
 * - Negative target count
 * - Zero-sized bounding box extent
 * - Duplicate point identifiers
 */
class InvalidInput : public std::invalid_argument {
 public:
  InvalidInput(const std::string& component, const std::string& message)
      : std::invalid_argument("[" + component + "] " + message),
        component_(component),
        message_(message) {}

  const std::string& component() const { return component_; }
  const std::string& message() const { return message_; }

 private:
  std::string component_;
  std::string message_;
};

/**
 * @brief Heuristic breakdown on pathological geometry.
 *
 * Raised when a radius or weight becomes non-finite even though input
 * validation passed.
 */
class NumericInstability : public std::runtime_error {
 public:
  NumericInstability(const std::string& component, const std::string& message)
      : std::runtime_error("[" + component + "] " + message),
        component_(component),
        message_(message) {}

  const std::string& component() const { return component_; }
  const std::string& message() const { return message_; }

 private:
  std::string component_;
  std::string message_;
};

}  // namespace bluenoise

#endif  // BLUENOISE_EXCEPTIONS_HPP
