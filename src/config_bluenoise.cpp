// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * config_bluenoise.cpp
 *
 * YAML configuration loading.
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "bluenoise/config/bluenoise.hpp"

namespace bluenoise {
namespace detail {

template <typename T>
void load(const YAML::Node& node, const std::string& key, T& value) {
  if (node[key]) {
    value = node[key].as<T>();
  }
}

Quality parseQuality(const std::string& quality) {
  if (quality == "low") return Quality::Low;
  if (quality == "medium") return Quality::Medium;
  if (quality == "high") return Quality::High;
  spdlog::warn("[Config] Unknown sampling.quality '{}', defaulting to medium",
               quality);
  return Quality::Medium;
}

EmitFrom parseEmitFrom(const std::string& emit_from) {
  if (emit_from == "vert" || emit_from == "vertices") return EmitFrom::Vertices;
  if (emit_from == "face" || emit_from == "faces") return EmitFrom::Faces;
  if (emit_from == "volume") return EmitFrom::Volume;
  spdlog::warn("[Config] Unknown sampling.emit_from '{}', defaulting to face",
               emit_from);
  return EmitFrom::Faces;
}

Config parse(const YAML::Node& root) {
  Config cfg;

  // Elimination heuristics
  if (auto n = root["elimination"]) {
    load(n, "alpha", cfg.elimination.alpha);
    load(n, "gamma", cfg.elimination.gamma);
    load(n, "beta", cfg.elimination.beta);
  }

  // Sampling
  if (auto n = root["sampling"]) {
    auto& s = cfg.sampling;
    if (n["count"]) {
      const auto count = n["count"].as<long long>();
      if (count < 0) {
        throw std::invalid_argument("sampling.count (" +
                                    std::to_string(count) + ") must be >= 0");
      }
      s.count = static_cast<std::size_t>(count);
    }
    std::string quality_str;
    load(n, "quality", quality_str);
    if (!quality_str.empty()) s.quality = parseQuality(quality_str);
    std::string emit_str;
    load(n, "emit_from", emit_str);
    if (!emit_str.empty()) s.emit_from = parseEmitFrom(emit_str);
    load(n, "surface_area", s.surface_area);
  }

  return cfg;
}

void validate(Config& cfg) {
  auto& e = cfg.elimination;

  // --- Fatal: invalid values that break the weight function ---
  if (!(e.alpha > 0.0) || !std::isfinite(e.alpha)) {
    throw std::invalid_argument("elimination.alpha (" +
                                std::to_string(e.alpha) + ") must be > 0");
  }

  // --- Non-fatal: warn and clamp ---
  if (!(e.gamma > 0.0)) {
    spdlog::warn("[Config] elimination.gamma ({}) must be > 0, clamping to 1.5",
                 e.gamma);
    e.gamma = 1.5;
  }
  if (!(e.beta >= 0.0 && e.beta <= 1.0)) {
    spdlog::warn("[Config] elimination.beta ({}) out of range [0, 1], clamping",
                 e.beta);
    e.beta = std::isnan(e.beta) ? 0.65 : std::clamp(e.beta, 0.0, 1.0);
  }
  if (!std::isfinite(cfg.sampling.surface_area) ||
      cfg.sampling.surface_area < 0.0) {
    spdlog::warn(
        "[Config] sampling.surface_area ({}) must be >= 0, treating as not "
        "supplied",
        cfg.sampling.surface_area);
    cfg.sampling.surface_area = 0.0;
  }
}

}  // namespace detail

Config parseConfig(const YAML::Node& root) {
  auto cfg = detail::parse(root);
  detail::validate(cfg);
  return cfg;
}

Config loadConfig(const std::string& path) {
  try {
    return parseConfig(YAML::LoadFile(path));
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load config: " + path + " - " +
                             e.what());
  }
}

}  // namespace bluenoise
