// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef BLUENOISE_CONFIG_BLUENOISE_HPP
#define BLUENOISE_CONFIG_BLUENOISE_HPP

#include <string>

namespace YAML {
class Node;
}

#include "bluenoise/config/elimination.hpp"
#include "bluenoise/config/sampling.hpp"

namespace bluenoise {

/// Top-level configuration.
struct Config {
  config::Elimination elimination;
  config::Sampling sampling;
};

Config parseConfig(const YAML::Node& root);
Config loadConfig(const std::string& path);

}  // namespace bluenoise

#endif  // BLUENOISE_CONFIG_BLUENOISE_HPP
