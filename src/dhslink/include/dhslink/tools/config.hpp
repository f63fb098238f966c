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

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace dhslink {

// NOLINTBEGIN(clang-analyzer-optin.performance.Padding)
struct DispatchConfig {
  std::filesystem::path path_to_config;

  std::filesystem::path analysis_program{"dhslink-analyze"};
  std::filesystem::path merge_program{"dhslink-merge-tracks"};

  // 0 means one thread per available core
  std::size_t threads{0};

  bool print_config{false};
  bool write_report{true};

  std::uint8_t verbosity{3};
};
// NOLINTEND(clang-analyzer-optin.performance.Padding)

}  // namespace dhslink
