// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * timer.hpp
 *
 * Simple timer utility for examples.
 */

#ifndef EXAMPLES_COMMON_TIMER_HPP
#define EXAMPLES_COMMON_TIMER_HPP

#include <chrono>
#include <iostream>
#include <string>

namespace examples {

class Timer {
 public:
  using Clock = std::chrono::steady_clock;

  void start() { start_ = Clock::now(); }

  double elapsedMs() const {
    return std::chrono::duration<double, std::milli>(Clock::now() - start_)
        .count();
  }

  void printElapsed(const std::string& label) const {
    std::cout << "[" << label << "] " << elapsedMs() << " ms" << std::endl;
  }

 private:
  Clock::time_point start_ = Clock::now();
};

}  // namespace examples

#endif  // EXAMPLES_COMMON_TIMER_HPP
