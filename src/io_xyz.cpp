// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * io_xyz.cpp
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "bluenoise/io/xyz.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <utility>
#include <vector>

namespace bluenoise {
namespace io {

namespace detail {

/// Split a line into whitespace-separated tokens.
std::vector<std::string> tokenize(const std::string& line) {
  std::vector<std::string> tokens;
  std::istringstream ss(line);
  std::string token;
  while (ss >> token) tokens.push_back(token);
  return tokens;
}

bool parseDouble(const std::string& token, double& value) {
  std::istringstream ss(token);
  ss >> value;
  return !ss.fail() && ss.eof();
}

bool parseId(const std::string& token, PointId& value) {
  std::istringstream ss(token);
  long long v = 0;
  ss >> v;
  if (ss.fail() || !ss.eof()) return false;
  value = static_cast<PointId>(v);
  return true;
}

}  // namespace detail

bool saveXyz(const std::string& filename, const SampleSet& samples) {
  std::ofstream ofs(filename);
  if (!ofs) {
    spdlog::error("[io::saveXyz] Cannot open '{}' for writing", filename);
    return false;
  }

  ofs << "# id x y z\n";
  ofs << std::setprecision(std::numeric_limits<double>::max_digits10);
  for (const auto& s : samples) {
    ofs << s.id << ' ' << s.position.x() << ' ' << s.position.y() << ' '
        << s.position.z() << '\n';
  }

  if (!ofs) {
    spdlog::error("[io::saveXyz] Write failed for '{}'", filename);
    return false;
  }
  return true;
}

bool loadXyz(const std::string& filename, SampleSet& samples) {
  std::ifstream ifs(filename);
  if (!ifs) {
    spdlog::error("[io::loadXyz] Cannot open '{}'", filename);
    return false;
  }

  SampleSet loaded;
  std::size_t columns = 0;
  std::size_t line_no = 0;
  std::string line;

  while (std::getline(ifs, line)) {
    ++line_no;
    const auto tokens = detail::tokenize(line);
    if (tokens.empty() || tokens.front().front() == '#') continue;

    if (tokens.size() != 3 && tokens.size() != 4) {
      spdlog::error("[io::loadXyz] {}:{}: expected 3 or 4 columns, got {}",
                    filename, line_no, tokens.size());
      return false;
    }
    if (columns == 0) columns = tokens.size();
    if (tokens.size() != columns) {
      spdlog::error("[io::loadXyz] {}:{}: column count changed from {} to {}",
                    filename, line_no, columns, tokens.size());
      return false;
    }

    Sample s;
    s.id = static_cast<PointId>(loaded.size());
    const std::size_t offset = columns - 3;
    if (columns == 4 && !detail::parseId(tokens[0], s.id)) {
      spdlog::error("[io::loadXyz] {}:{}: invalid id '{}'", filename, line_no,
                    tokens[0]);
      return false;
    }
    for (std::size_t axis = 0; axis < 3; ++axis) {
      if (!detail::parseDouble(tokens[offset + axis], s.position[axis])) {
        spdlog::error("[io::loadXyz] {}:{}: invalid coordinate '{}'", filename,
                      line_no, tokens[offset + axis]);
        return false;
      }
    }
    loaded.push_back(s);
  }

  samples = std::move(loaded);
  return true;
}

}  // namespace io
}  // namespace bluenoise
