// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * spatial_index.hpp
 *
 * Static KD-tree over the candidate set for radius queries.
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef BLUENOISE_SEARCH_SPATIAL_INDEX_HPP
#define BLUENOISE_SEARCH_SPATIAL_INDEX_HPP

#include <nanoflann.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "bluenoise/point_types.hpp"

namespace bluenoise {

/// Radius query hit.
struct Neighbor {
  std::size_t slot;  ///< Position of the point in the build order
  PointId id;
  double distance;
};

/**
 * @brief KD-tree for radius search, built once and never mutated.
 *
 * Points are addressed by slot (their position in the sample set passed to
 * the constructor). Every point given at construction stays queryable for
 * the lifetime of the index.
 *
 * Queries are const and may run concurrently.
 */
class SpatialIndex {
 public:
  explicit SpatialIndex(const SampleSet& samples);
  ~SpatialIndex();

  // Adaptor references points_, so the index is pinned in memory
  SpatialIndex(const SpatialIndex&) = delete;
  SpatialIndex& operator=(const SpatialIndex&) = delete;
  SpatialIndex(SpatialIndex&&) = delete;
  SpatialIndex& operator=(SpatialIndex&&) = delete;

  /// All other points within r of the point at slot (inclusive).
  /// The queried point itself is never reported; coincident duplicates are.
  std::vector<Neighbor> radius(std::size_t slot, double r) const;
  void radius(std::size_t slot, double r, std::vector<Neighbor>& out) const;

  /// All points within r of an arbitrary center (inclusive, no exclusion).
  std::vector<Neighbor> radius(const Point& center, double r) const;
  void radius(const Point& center, double r, std::vector<Neighbor>& out) const;

  /// Closest other point to the point at slot; nullopt if it is alone.
  std::optional<Neighbor> nearest(std::size_t slot) const;

  // Accessors
  [[nodiscard]] bool empty() const noexcept { return points_.empty(); }
  [[nodiscard]] std::size_t size() const noexcept { return points_.size(); }
  const Point& position(std::size_t slot) const { return points_[slot]; }
  PointId id(std::size_t slot) const { return ids_[slot]; }

 private:
  struct PointAdaptor {
    const std::vector<Point>* points;
    explicit PointAdaptor(const std::vector<Point>* p) : points(p) {}
    std::size_t kdtree_get_point_count() const { return points->size(); }
    double kdtree_get_pt(std::size_t idx, std::size_t dim) const {
      return (*points)[idx][dim];
    }
    template <class BBOX>
    bool kdtree_get_bbox(BBOX&) const {
      return false;
    }
  };

  using KdTreeIndex = nanoflann::KDTreeSingleIndexAdaptor<
      nanoflann::L2_Simple_Adaptor<double, PointAdaptor>, PointAdaptor, 3,
      std::uint32_t>;

  void search(const Point& center, double r, std::size_t exclude,
              std::vector<Neighbor>& out) const;

  std::vector<Point> points_;
  std::vector<PointId> ids_;
  std::unique_ptr<PointAdaptor> adaptor_;
  std::unique_ptr<KdTreeIndex> index_;
};

}  // namespace bluenoise

#endif  // BLUENOISE_SEARCH_SPATIAL_INDEX_HPP
