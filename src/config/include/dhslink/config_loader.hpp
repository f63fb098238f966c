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
#include <filesystem>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include "dhslink/config_store.hpp"

namespace dhslink {

// Parse a configuration file.
// Lines are either "key=value" assignments, "module load <name>..." directives, or ignored.
// Values support $NAME, ${NAME} and ${NAME:-default} substitutions: NAME is looked up among the
// keys assigned by previous lines first, then in the process environment.
[[nodiscard]] ConfigStore load_config(const std::filesystem::path &path);
[[nodiscard]] ConfigStore load_config(std::istream &stream, const std::filesystem::path &path = {});

namespace internal {

[[nodiscard]] std::size_t find_unescaped(std::string_view s, char c) noexcept;
[[nodiscard]] bool is_module_directive(std::string_view line) noexcept;
[[nodiscard]] std::vector<std::string> parse_module_directive(std::string_view line);
[[nodiscard]] std::string expand_value(std::string_view raw, const ConfigStore &vars);

}  // namespace internal

}  // namespace dhslink
