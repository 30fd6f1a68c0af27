// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * sample_elimination.cpp
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "bluenoise/elimination/sample_elimination.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <string>

#include "bluenoise/exceptions.hpp"

namespace bluenoise {

SampleElimination::SampleElimination(const SampleSet& samples,
                                     std::int64_t target_count,
                                     DistributionMode mode,
                                     std::optional<double> surface_area,
                                     const Config& cfg) {
  validate(samples, target_count, mode, surface_area);

  const std::size_t input_count = samples.size();
  target_count_ =
      std::min(static_cast<std::size_t>(target_count), input_count);

  index_ = std::make_unique<SpatialIndex>(samples);

  std::vector<double> weights(input_count, 0.0);
  if (target_count_ > 0) {
    radii_ = computeRadii(boundingExtents(samples), input_count, target_count_,
                          mode, surface_area, cfg);
    weight_fn_.emplace(radii_.rmax, cfg.alpha);
    weights = computeInitialWeights();
  }

  std::vector<PointId> ids;
  ids.reserve(input_count);
  for (const auto& s : samples) ids.push_back(s.id);
  heap_.build(std::move(weights), std::move(ids));

  history_.reserve(input_count - target_count_);

  spdlog::debug(
      "[SampleElimination] {} candidates -> {} targets (rmax={:.6g}, "
      "rmin={:.6g})",
      input_count, target_count_, radii_.rmax, radii_.rmin);
}

SampleElimination::~SampleElimination() = default;

void SampleElimination::validate(const SampleSet& samples,
                                 std::int64_t target_count,
                                 DistributionMode mode,
                                 std::optional<double> surface_area) {
  if (samples.empty()) {
    throw InvalidInput("SampleElimination", "empty sample set");
  }
  if (target_count < 0) {
    throw InvalidInput("SampleElimination",
                       "negative target count (" +
                           std::to_string(target_count) + ")");
  }

  slots_.reserve(samples.size());
  for (std::size_t i = 0; i < samples.size(); ++i) {
    if (!samples[i].position.allFinite()) {
      throw InvalidInput("SampleElimination",
                         "non-finite position for id " +
                             std::to_string(samples[i].id));
    }
    if (!slots_.emplace(samples[i].id, i).second) {
      throw InvalidInput("SampleElimination",
                         "duplicate point id " + std::to_string(samples[i].id));
    }
  }

  checkExtents(boundingExtents(samples), mode, surface_area);
}

std::vector<double> SampleElimination::computeInitialWeights() const {
  const std::size_t n = index_->size();
  const double support = weight_fn_->supportRadius();

  std::vector<double> weights(n, 0.0);
  std::vector<Neighbor> neighbors;
  for (std::size_t slot = 0; slot < n; ++slot) {
    index_->radius(slot, support, neighbors);
    double total = 0.0;
    for (const auto& nb : neighbors) {
      total += (*weight_fn_)(nb.distance);
    }
    if (!std::isfinite(total)) {
      throw NumericInstability("SampleElimination",
                               "non-finite weight for id " +
                                   std::to_string(index_->id(slot)));
    }
    weights[slot] = total;
  }
  return weights;
}

std::optional<SampleElimination::Step> SampleElimination::eliminateOne() {
  if (heap_.empty() || heap_.size() <= target_count_) return std::nullopt;

  const std::size_t slot = heap_.pop();
  const Step step{heap_.id(slot), heap_.weight(slot)};

  // Eliminated neighbors are skipped by decrease()
  if (weight_fn_) {
    index_->radius(slot, weight_fn_->supportRadius(), neighbors_);
    for (const auto& nb : neighbors_) {
      heap_.decrease(nb.slot, (*weight_fn_)(nb.distance));
    }
  }

  history_.push_back(step);
  return step;
}

void SampleElimination::eliminate() {
  while (eliminateOne()) {
  }
  spdlog::debug("[SampleElimination] {} eliminated, {} remaining",
                history_.size(), heap_.size());
}

std::vector<PointId> SampleElimination::survivors() const {
  std::vector<PointId> ids;
  ids.reserve(heap_.size());
  for (std::size_t slot = 0; slot < heap_.capacity(); ++slot) {
    if (heap_.contains(slot)) ids.push_back(heap_.id(slot));
  }
  return ids;
}

SampleSet SampleElimination::survivingSamples() const {
  SampleSet out;
  out.reserve(heap_.size());
  for (std::size_t slot = 0; slot < heap_.capacity(); ++slot) {
    if (heap_.contains(slot)) {
      out.push_back(Sample{heap_.id(slot), index_->position(slot)});
    }
  }
  return out;
}

std::optional<double> SampleElimination::weightOf(PointId id) const {
  auto it = slots_.find(id);
  if (it == slots_.end() || !heap_.contains(it->second)) return std::nullopt;
  return heap_.weight(it->second);
}

bool SampleElimination::contains(PointId id) const {
  auto it = slots_.find(id);
  return it != slots_.end() && heap_.contains(it->second);
}

}  // namespace bluenoise
