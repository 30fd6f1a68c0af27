// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * xyz.hpp
 *
 * Plain-text point files, one point per line:
 *
 *   # comment
 *   id x y z      (4 columns)
 *   x y z         (3 columns, id = point line number from 0)
 *
 * All point lines of a file must use the same column count.
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef BLUENOISE_IO_XYZ_HPP
#define BLUENOISE_IO_XYZ_HPP

#include <string>

#include "bluenoise/point_types.hpp"

namespace bluenoise {
namespace io {

/// Save samples as "id x y z" lines (full double precision).
bool saveXyz(const std::string& filename, const SampleSet& samples);

/// Load samples from a 3- or 4-column file. samples is replaced on success
/// and left untouched on failure.
bool loadXyz(const std::string& filename, SampleSet& samples);

}  // namespace io
}  // namespace bluenoise

#endif  // BLUENOISE_IO_XYZ_HPP
