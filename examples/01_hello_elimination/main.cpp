// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * 01_hello_elimination - BlueNoise basic usage
 *
 * Demonstrates:
 * - Generating an oversampled candidate set
 * - Running SampleElimination step by step and in one call
 * - Comparing spacing against a random subset of the same size
 */

#include <bluenoise/bluenoise.hpp>

#include <iostream>

#include "../common/data_generator.hpp"
#include "../common/timer.hpp"

using namespace bluenoise;

int main() {
  std::cout << "=== 01_hello_elimination ===\n" << std::endl;

  // 1. Oversampled candidates (medium quality = 2x)
  const std::size_t target = 1000;
  const auto candidates = examples::generateBoxCloud(
      candidateCount(target, Quality::Medium), 1.0);
  std::cout << "Generated " << candidates.size() << " candidates" << std::endl;

  // 2. Build + eliminate
  examples::Timer timer;
  timer.start();
  SampleElimination elimination(candidates, target, DistributionMode::Volume);
  timer.printElapsed("Build");
  std::cout << "  rmax = " << elimination.rmax()
            << ", rmin = " << elimination.rmin() << std::endl;

  timer.start();
  elimination.eliminate();
  timer.printElapsed("Eliminate");

  const auto& history = elimination.history();
  if (!history.empty()) {
    std::cout << "  first removed: id " << history.front().id << " (weight "
              << history.front().weight << ")" << std::endl;
    std::cout << "  last removed:  id " << history.back().id << " (weight "
              << history.back().weight << ")" << std::endl;
  }

  // 3. Results
  const auto survivors = elimination.survivingSamples();
  examples::printSummary("Blue noise", survivors,
                         minimumSeparation(survivors));

  const auto random = examples::randomSubset(candidates, target);
  examples::printSummary("Random", random, minimumSeparation(random));

  // 4. One-shot API
  const auto ids = eliminate(candidates, target, DistributionMode::Volume);
  std::cout << "One-shot eliminate kept " << ids.size() << " ids" << std::endl;

  return 0;
}
