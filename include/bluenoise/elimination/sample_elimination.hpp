// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * sample_elimination.hpp
 *
 * Weighted sample elimination: thins an oversampled point set to a target
 * size with blue noise characteristics.
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef BLUENOISE_ELIMINATION_SAMPLE_ELIMINATION_HPP
#define BLUENOISE_ELIMINATION_SAMPLE_ELIMINATION_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include "bluenoise/config/elimination.hpp"
#include "bluenoise/elimination/radius_heuristics.hpp"
#include "bluenoise/elimination/weight_function.hpp"
#include "bluenoise/elimination/weight_heap.hpp"
#include "bluenoise/point_types.hpp"
#include "bluenoise/search/spatial_index.hpp"

namespace bluenoise {

/**
 * @brief Single-use weighted sample elimination engine.
 *
 * ## Phases
 *
 * 1. **Build** (constructor): validate input, build the spatial index,
 *    compute rmax/rmin, sum each point's initial weight over neighbors
 *    within 2 rmax, heapify.
 * 2. **Eliminate** (eliminate() / eliminateOne()): pop the heaviest live
 *    point and subtract its contribution from every live neighbor within
 *    2 rmax, until the target count remains.
 * 3. **Collect** (survivors() / survivingSamples()): points still in the
 *    heap, in input order.
 *
 * Weight ties are broken towards the lowest identifier.
 *
 * The target count is clamped to the input size (no eliminations). A target
 * of zero skips radius and weight computation (rmax() == rmin() == 0): every
 * point carries weight 0 and the set drains in ascending id order.
 *
 * ## Thread safety
 *
 * Not thread-safe. Separate instances share no state and can run in
 * parallel.
 */
class SampleElimination {
 public:
  using Config = config::Elimination;

  /// One elimination step: the removed point and its weight when popped.
  struct Step {
    PointId id;
    double weight;
  };

  /**
   * @brief Build phase.
   *
   * @param samples Candidates with unique identifiers
   * @param target_count Number of survivors (>= 0)
   * @param mode Volume or Surface distribution
   * @param surface_area Optional reference area (Surface mode only)
   * @param cfg Heuristic constants
   * @throws InvalidInput on empty input, negative target, duplicate ids or
   *         degenerate bounding box (zero extents are accepted in Surface
   *         mode with a reference area)
   * @throws NumericInstability if a radius or weight is not finite
   */
  SampleElimination(const SampleSet& samples, std::int64_t target_count,
                    DistributionMode mode,
                    std::optional<double> surface_area = std::nullopt,
                    const Config& cfg = Config{});
  ~SampleElimination();

  // Non-copyable
  SampleElimination(const SampleElimination&) = delete;
  SampleElimination& operator=(const SampleElimination&) = delete;

  /// Remove the current heaviest point. Returns nullopt once the target
  /// count is reached.
  std::optional<Step> eliminateOne();

  /// Run eliminateOne() until the target count is reached.
  void eliminate();

  /// Surviving identifiers, in input order.
  std::vector<PointId> survivors() const;

  /// Surviving samples (identifier + position), in input order.
  SampleSet survivingSamples() const;

  /// Current weight of a live point; nullopt if unknown or eliminated.
  std::optional<double> weightOf(PointId id) const;

  /// True if id is part of the input and not yet eliminated.
  bool contains(PointId id) const;

  /// Steps taken so far, in elimination order.
  const std::vector<Step>& history() const noexcept { return history_; }

  double rmax() const noexcept { return radii_.rmax; }
  double rmin() const noexcept { return radii_.rmin; }
  std::size_t inputCount() const noexcept { return index_->size(); }
  std::size_t currentCount() const noexcept { return heap_.size(); }
  std::size_t targetCount() const noexcept { return target_count_; }
  bool done() const noexcept { return heap_.size() <= target_count_; }

  const SpatialIndex& index() const noexcept { return *index_; }

 private:
  void validate(const SampleSet& samples, std::int64_t target_count,
                DistributionMode mode, std::optional<double> surface_area);
  std::vector<double> computeInitialWeights() const;

  std::unordered_map<PointId, std::size_t> slots_;
  std::unique_ptr<SpatialIndex> index_;
  std::optional<WeightFunction> weight_fn_;  // empty when target is zero
  WeightHeap heap_;
  Radii radii_;
  std::size_t target_count_ = 0;

  std::vector<Step> history_;
  std::vector<Neighbor> neighbors_;  // scratch buffer for eliminateOne()
};

}  // namespace bluenoise

#endif  // BLUENOISE_ELIMINATION_SAMPLE_ELIMINATION_HPP
