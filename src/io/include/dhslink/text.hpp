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
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

namespace dhslink {

// Split a record cut-style: every occurrence of sep delimits a field, so empty fields are preserved.
// Fields beyond NTOKS are ignored, missing fields are returned as empty strings.
template <std::size_t NTOKS>
[[nodiscard]] constexpr std::array<std::string_view, NTOKS> tokenize_record(std::string_view record,
                                                                            char sep = '\t');

// Split a record awk-style: leading separators are skipped and runs of separators are collapsed.
template <std::size_t NTOKS>
[[nodiscard]] constexpr std::array<std::string_view, NTOKS> tokenize_record_collapse(
    std::string_view record, char sep = ' ');

void strip_line_terminator(std::string &buffer) noexcept;
[[nodiscard]] bool is_blank(std::string_view line) noexcept;

[[nodiscard]] std::ifstream open_text_file_checked(const std::filesystem::path &path);

}  // namespace dhslink

#include "../../text_impl.hpp"
