// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "bluenoise/search/spatial_index.hpp"

#include <cmath>
#include <limits>

#include "bluenoise/exceptions.hpp"

namespace bluenoise {

namespace {
constexpr std::size_t kNoExclusion = std::numeric_limits<std::size_t>::max();
}  // namespace

SpatialIndex::SpatialIndex(const SampleSet& samples) {
  if (samples.size() > std::numeric_limits<std::uint32_t>::max()) {
    throw InvalidInput("SpatialIndex", "too many points (" +
                                           std::to_string(samples.size()) +
                                           ")");
  }

  points_.reserve(samples.size());
  ids_.reserve(samples.size());
  for (const auto& s : samples) {
    points_.push_back(s.position);
    ids_.push_back(s.id);
  }

  if (points_.empty()) return;

  adaptor_ = std::make_unique<PointAdaptor>(&points_);
  index_ = std::make_unique<KdTreeIndex>(
      3, *adaptor_, nanoflann::KDTreeSingleIndexAdaptorParams(10));
}

SpatialIndex::~SpatialIndex() = default;

void SpatialIndex::search(const Point& center, double r, std::size_t exclude,
                          std::vector<Neighbor>& out) const {
  out.clear();
  if (!index_ || !(r >= 0.0)) return;

  // nanoflann keeps dist < radius; widen by one ulp and filter for <= r
  const double r_sq = r * r;
  const double search_sq =
      std::nextafter(r_sq, std::numeric_limits<double>::infinity());

  nanoflann::SearchParameters params;
  params.sorted = false;

  std::vector<nanoflann::ResultItem<std::uint32_t, double>> matches;
  index_->radiusSearch(center.data(), search_sq, matches, params);

  out.reserve(matches.size());
  for (const auto& m : matches) {
    const std::size_t slot = m.first;
    if (slot == exclude || m.second > r_sq) continue;
    out.push_back(Neighbor{slot, ids_[slot], std::sqrt(m.second)});
  }
}

void SpatialIndex::radius(std::size_t slot, double r,
                          std::vector<Neighbor>& out) const {
  search(points_[slot], r, slot, out);
}

std::vector<Neighbor> SpatialIndex::radius(std::size_t slot, double r) const {
  std::vector<Neighbor> result;
  radius(slot, r, result);
  return result;
}

void SpatialIndex::radius(const Point& center, double r,
                          std::vector<Neighbor>& out) const {
  search(center, r, kNoExclusion, out);
}

std::vector<Neighbor> SpatialIndex::radius(const Point& center,
                                           double r) const {
  std::vector<Neighbor> result;
  radius(center, r, result);
  return result;
}

std::optional<Neighbor> SpatialIndex::nearest(std::size_t slot) const {
  if (!index_ || points_.size() < 2) return std::nullopt;

  // Two hits: the point itself and its closest neighbor (either order when
  // coincident)
  std::uint32_t indices[2];
  double dists_sq[2];
  nanoflann::KNNResultSet<double, std::uint32_t> result_set(2);
  result_set.init(indices, dists_sq);
  index_->findNeighbors(result_set, points_[slot].data());

  for (std::size_t i = 0; i < result_set.size(); ++i) {
    if (indices[i] == slot) continue;
    return Neighbor{indices[i], ids_[indices[i]], std::sqrt(dists_sq[i])};
  }
  return std::nullopt;
}

}  // namespace bluenoise
