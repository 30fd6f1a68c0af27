// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * blue_noise - Thin an oversampled point file to a blue noise subset.
 *
 * Pipeline: load → weighted sample elimination → save
 *
 * Usage:
 *   ./blue_noise input.xyz output.xyz [count] [options]
 *
 * Options:
 *   --config <file.yaml>  Load elimination/sampling parameters
 *   --volume              Treat points as a volume distribution
 *   --area <value>        Reference surface area (surface mode)
 *   --verbose             Debug logging
 *
 * Example:
 *   ./blue_noise particles.xyz particles_bn.xyz 1000 --area 12.5
 */

#include <spdlog/spdlog.h>

#include <bluenoise/bluenoise.hpp>
#include <bluenoise/io/xyz.hpp>
#include <iostream>
#include <string>

using namespace bluenoise;

namespace {

void printUsage() {
  std::cerr << "Usage: blue_noise <input.xyz> <output.xyz> [count] [options]\n"
            << "  count: number of points to keep (default: sampling.count)\n"
            << "  --config <file.yaml>  load parameters from YAML\n"
            << "  --volume              volume distribution (default: surface)\n"
            << "  --area <value>        reference surface area\n"
            << "  --verbose             debug logging\n";
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    printUsage();
    return 1;
  }

  const std::string input_path = argv[1];
  const std::string output_path = argv[2];

  Config config;
  std::string count_arg;
  bool force_volume = false;
  std::string area_arg;

  for (int i = 3; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      try {
        config = loadConfig(argv[++i]);
      } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 2;
      }
    } else if (arg == "--volume") {
      force_volume = true;
    } else if (arg == "--area" && i + 1 < argc) {
      area_arg = argv[++i];
    } else if (arg == "--verbose") {
      spdlog::set_level(spdlog::level::debug);
    } else if (count_arg.empty() && arg.rfind("--", 0) != 0) {
      count_arg = arg;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      printUsage();
      return 1;
    }
  }

  try {
    if (!count_arg.empty()) {
      const long long count = std::stoll(count_arg);
      if (count < 0) {
        std::cerr << "count must be >= 0\n";
        return 1;
      }
      config.sampling.count = static_cast<std::size_t>(count);
    }
    if (!area_arg.empty()) config.sampling.surface_area = std::stod(area_arg);
  } catch (const std::logic_error&) {
    std::cerr << "Invalid numeric argument\n";
    printUsage();
    return 1;
  }
  if (force_volume) config.sampling.emit_from = EmitFrom::Volume;

  // Load
  std::cout << "Loading " << input_path << " ..." << std::endl;
  SampleSet samples;
  if (!io::loadXyz(input_path, samples)) return 2;
  std::cout << "  " << samples.size() << " points" << std::endl;

  // Eliminate
  const bool volume =
      distributionMode(config.sampling.emit_from) == DistributionMode::Volume;
  std::cout << "Eliminating to " << config.sampling.count << " points ("
            << (volume ? "volume" : "surface") << ") ..." << std::endl;

  SampleSet output;
  try {
    output = eliminateSamples(samples, config);
  } catch (const std::exception& e) {
    std::cerr << e.what() << std::endl;
    return 2;
  }
  std::cout << "  " << output.size() << " points kept, min separation "
            << minimumSeparation(output) << std::endl;

  // Export
  if (!io::saveXyz(output_path, output)) return 2;
  std::cout << "Saved to " << output_path << std::endl;

  return 0;
}
