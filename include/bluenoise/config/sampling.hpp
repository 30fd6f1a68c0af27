// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * sampling.hpp
 *
 * Sampling configuration: target count, oversampling quality and emission
 * domain of the candidate set.
 */

#ifndef BLUENOISE_CONFIG_SAMPLING_HPP
#define BLUENOISE_CONFIG_SAMPLING_HPP

#include <cstddef>

namespace bluenoise {

/// Oversampling level of the candidate set relative to the target count.
enum class Quality {
  Low,     ///< 1.5x candidates
  Medium,  ///< 2x candidates
  High     ///< 5x candidates
};

/// Where the candidate points were emitted from.
enum class EmitFrom {
  Vertices,  ///< Mesh vertices (surface distribution)
  Faces,     ///< Mesh faces (surface distribution)
  Volume     ///< Mesh interior (volume distribution)
};

namespace config {

struct Sampling {
  std::size_t count = 1000;  ///< Number of surviving points
  Quality quality = Quality::Medium;
  EmitFrom emit_from = EmitFrom::Faces;
  double surface_area = 0.0;  ///< Reference area; <= 0 means not supplied
};

}  // namespace config
}  // namespace bluenoise

#endif  // BLUENOISE_CONFIG_SAMPLING_HPP
