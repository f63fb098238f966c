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

#pragma once

#include <fmt/format.h>
#include <fmt/std.h>

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace dhslink {

// Configuration or sample list file that cannot be opened
class MissingFileError : public std::runtime_error {
  std::filesystem::path _path;

 public:
  explicit MissingFileError(std::filesystem::path path, std::string_view reason = "no such file")
      : std::runtime_error(fmt::format("unable to read file {}: {}", path, reason)),
        _path(std::move(path)) {}

  [[nodiscard]] const std::filesystem::path &path() const noexcept { return _path; }
};

// Required field(s) missing or invalid for the selected input mode
class ValidationError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// List file line that cannot be turned into an analysis unit.
// Never thrown by the list parser: entries carry it so that the unit can be reported as skipped.
class MalformedListEntryError : public std::runtime_error {
 public:
  MalformedListEntryError(const std::filesystem::path &path, std::size_t line,
                          std::string_view reason)
      : std::runtime_error(
            path.empty() ? fmt::format("malformed entry at line {}: {}", line, reason)
                         : fmt::format("malformed entry at line {} of file {}: {}", line, path,
                                       reason)) {}
};

}  // namespace dhslink
