// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: GPL-3.0
//
// This library is free software: you can redistribute it and/or
// modify it under the terms of the GNU Public License as published
// by the Free Software Foundation; either version 3 of the License,
// or (at your option) any later version.
//
// This library is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
// Library General Public License for more details.
//
// You should have received a copy of the GNU Public License along
// with this library.  If not, see
// <https://www.gnu.org/licenses/>

#include "dhslink/text.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

#include "dhslink/errors.hpp"

namespace dhslink {

void strip_line_terminator(std::string &buffer) noexcept {
  if (!buffer.empty() && buffer.back() == '\r') {
    buffer.resize(buffer.size() - 1);
  }
}

bool is_blank(std::string_view line) noexcept {
  return std::ranges::all_of(line, [](unsigned char c) { return std::isspace(c) != 0; });
}

std::ifstream open_text_file_checked(const std::filesystem::path &path) {
  std::error_code ec{};
  if (!std::filesystem::exists(path, ec)) {
    throw MissingFileError(path);
  }
  if (std::filesystem::is_directory(path, ec)) {
    throw MissingFileError(path, "path points to a directory");
  }

  std::ifstream ifs(path);
  if (!ifs) {
    throw MissingFileError(path, "permission denied or I/O error");
  }
  ifs.exceptions(std::ios::badbit);
  return ifs;
}

}  // namespace dhslink
