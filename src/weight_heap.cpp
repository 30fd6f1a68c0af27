// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "bluenoise/elimination/weight_heap.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace bluenoise {

void WeightHeap::build(std::vector<double> weights, std::vector<PointId> ids) {
  if (weights.size() != ids.size()) {
    throw std::invalid_argument("[WeightHeap] weights (" +
                                std::to_string(weights.size()) +
                                ") and ids (" + std::to_string(ids.size()) +
                                ") differ in length");
  }

  weights_ = std::move(weights);
  ids_ = std::move(ids);

  const std::size_t n = weights_.size();
  heap_.resize(n);
  pos_.resize(n);
  for (std::size_t i = 0; i < n; ++i) {
    heap_[i] = i;
    pos_[i] = i;
  }

  // Floyd heapify
  for (std::size_t i = n / 2; i > 0; --i) {
    siftDown(i - 1);
  }
}

std::size_t WeightHeap::pop() {
  if (heap_.empty()) {
    throw std::out_of_range("[WeightHeap] pop() on empty heap");
  }

  const std::size_t slot = heap_.front();
  swapAt(0, heap_.size() - 1);
  heap_.pop_back();
  pos_[slot] = npos;
  if (!heap_.empty()) siftDown(0);
  return slot;
}

void WeightHeap::decrease(std::size_t slot, double delta) {
  if (!contains(slot)) return;
  weights_[slot] -= delta;
  if (delta >= 0.0) {
    siftDown(pos_[slot]);
  } else {
    siftUp(pos_[slot]);
  }
}

void WeightHeap::update(std::size_t slot, double weight) {
  if (!contains(slot)) return;
  weights_[slot] = weight;
  const std::size_t pos = pos_[slot];
  siftUp(pos);
  siftDown(pos_[slot]);
}

bool WeightHeap::higher(std::size_t a, std::size_t b) const {
  if (weights_[a] != weights_[b]) return weights_[a] > weights_[b];
  return ids_[a] < ids_[b];
}

void WeightHeap::siftUp(std::size_t pos) {
  while (pos > 0) {
    const std::size_t parent = (pos - 1) / 2;
    if (!higher(heap_[pos], heap_[parent])) break;
    swapAt(pos, parent);
    pos = parent;
  }
}

void WeightHeap::siftDown(std::size_t pos) {
  const std::size_t n = heap_.size();
  while (true) {
    const std::size_t left = 2 * pos + 1;
    const std::size_t right = left + 1;
    std::size_t best = pos;
    if (left < n && higher(heap_[left], heap_[best])) best = left;
    if (right < n && higher(heap_[right], heap_[best])) best = right;
    if (best == pos) return;
    swapAt(pos, best);
    pos = best;
  }
}

void WeightHeap::swapAt(std::size_t i, std::size_t j) {
  std::swap(heap_[i], heap_[j]);
  pos_[heap_[i]] = i;
  pos_[heap_[j]] = j;
}

}  // namespace bluenoise
