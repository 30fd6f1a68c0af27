// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * weight_heap.hpp
 *
 * Addressable max-heap over per-point weights.
 */

#ifndef BLUENOISE_ELIMINATION_WEIGHT_HEAP_HPP
#define BLUENOISE_ELIMINATION_WEIGHT_HEAP_HPP

#include <cstddef>
#include <limits>
#include <vector>

#include "bluenoise/point_types.hpp"

namespace bluenoise {

/**
 * @brief Binary max-heap with random access by slot.
 *
 * Each entry is addressed by its slot (0..n-1) for the whole lifetime of
 * the heap, so weights can be changed in O(log n) without searching.
 * Popped entries leave the heap for good; their last weight stays readable.
 *
 * Ordering: larger weight first; equal weights resolve to the lower id.
 */
class WeightHeap {
 public:
  static constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

  WeightHeap() = default;

  /// Heapify all entries. weights and ids must have the same length.
  void build(std::vector<double> weights, std::vector<PointId> ids);

  [[nodiscard]] bool empty() const noexcept { return heap_.empty(); }
  [[nodiscard]] std::size_t size() const noexcept { return heap_.size(); }

  /// Total number of slots, including popped ones.
  [[nodiscard]] std::size_t capacity() const noexcept {
    return weights_.size();
  }

  bool contains(std::size_t slot) const { return pos_[slot] != npos; }
  double weight(std::size_t slot) const { return weights_[slot]; }
  PointId id(std::size_t slot) const { return ids_[slot]; }

  /// Slot of the highest-priority entry. Heap must not be empty.
  std::size_t top() const { return heap_.front(); }

  /// Remove the highest-priority entry and return its slot.
  std::size_t pop();

  /// Lower the weight of a live entry by delta. No-op for popped slots.
  void decrease(std::size_t slot, double delta);

  /// Set the weight of a live entry and restore heap order.
  void update(std::size_t slot, double weight);

 private:
  bool higher(std::size_t a, std::size_t b) const;
  void siftUp(std::size_t pos);
  void siftDown(std::size_t pos);
  void swapAt(std::size_t i, std::size_t j);

  std::vector<double> weights_;      // per slot
  std::vector<PointId> ids_;         // per slot, tie-break key
  std::vector<std::size_t> heap_;    // heap position -> slot
  std::vector<std::size_t> pos_;     // slot -> heap position (npos if popped)
};

}  // namespace bluenoise

#endif  // BLUENOISE_ELIMINATION_WEIGHT_HEAP_HPP
