// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * 02_config_loading - YAML configuration loading
 *
 * Demonstrates:
 * - Loading surface and volume presets from YAML config files
 * - Supplying a reference surface area
 * - Oversampling candidates according to the configured quality
 */

#include <bluenoise/bluenoise.hpp>

#include <cmath>
#include <iostream>

#include "../common/data_generator.hpp"
#include "../common/timer.hpp"

using namespace bluenoise;

int main() {
  std::cout << "=== 02_config_loading ===\n" << std::endl;

  // 1. Load configs from YAML presets
  auto surface_cfg = loadConfig(EXAMPLE_CONFIG_DIR "/default.yaml");
  auto volume_cfg = loadConfig(EXAMPLE_CONFIG_DIR "/volume.yaml");

  std::cout << "Loaded surface preset (default.yaml)" << std::endl;
  std::cout << "Loaded volume preset (volume.yaml)\n" << std::endl;

  // 2. Surface: unit sphere with known area
  const double radius = 1.0;
  surface_cfg.sampling.surface_area = 4.0 * EIGEN_PI * radius * radius;
  const auto sphere = examples::generateSphereCloud(
      candidateCount(surface_cfg.sampling.count, surface_cfg.sampling.quality),
      radius);

  examples::Timer timer;
  timer.start();
  const auto sphere_out = eliminateSamples(sphere, surface_cfg);
  timer.printElapsed("Surface elimination");
  examples::printSummary("Sphere", sphere_out, minimumSeparation(sphere_out));

  // 3. Volume: unit cube
  const auto cube = examples::generateBoxCloud(
      candidateCount(volume_cfg.sampling.count, volume_cfg.sampling.quality),
      1.0);

  timer.start();
  const auto cube_out = eliminateSamples(cube, volume_cfg);
  timer.printElapsed("Volume elimination");
  examples::printSummary("Cube", cube_out, minimumSeparation(cube_out));

  return 0;
}
