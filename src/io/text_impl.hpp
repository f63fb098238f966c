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

#include <array>
#include <cstddef>
#include <string_view>

namespace dhslink {

template <std::size_t NTOKS>
constexpr std::array<std::string_view, NTOKS> tokenize_record(std::string_view record, char sep) {
  static_assert(NTOKS != 0);

  std::array<std::string_view, NTOKS> toks{};
  for (std::size_t i = 0; i < NTOKS; ++i) {
    const auto pos = record.find(sep);
    toks[i] = record.substr(0, pos);
    if (pos == std::string_view::npos) [[unlikely]] {
      break;
    }
    record.remove_prefix(pos + 1);
  }

  return toks;
}

template <std::size_t NTOKS>
constexpr std::array<std::string_view, NTOKS> tokenize_record_collapse(std::string_view record,
                                                                       char sep) {
  static_assert(NTOKS != 0);

  std::array<std::string_view, NTOKS> toks{};
  for (std::size_t i = 0; i < NTOKS; ++i) {
    const auto first = record.find_first_not_of(sep);
    if (first == std::string_view::npos) [[unlikely]] {
      break;
    }
    record.remove_prefix(first);

    const auto last = record.find(sep);
    toks[i] = record.substr(0, last);
    if (last == std::string_view::npos) {
      break;
    }
    record.remove_prefix(last);
  }

  return toks;
}

}  // namespace dhslink
