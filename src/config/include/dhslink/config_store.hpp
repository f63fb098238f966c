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

#include <parallel_hashmap/btree.h>

#include <array>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace dhslink {

struct ConfigOption {
  std::string_view key;
  std::string_view default_value;
  std::string_view description;
};

// Option names recognized in configuration files
// clang-format off
inline constexpr std::array<ConfigOption, 18> known_config_options{{
  {"reference",            "",     "Path to a BED file with the DHS regions of a single sample."},
  {"db",                   "",     "Path to the DHS signal database (regions x samples signal matrix)."},
  {"anchor",               "",     "Path to a BED file with the anchor regions (required)."},
  {"outDirectory",         "",     "Folder where output files are written (required)."},
  {"matrix",               "",     "Path to a precomputed signal matrix for a single sample."},
  {"references",           "",     "Path to a tab-separated list of <reference> <sample name> pairs."},
  {"matrices",             "",     "Path to a space-separated list of <matrix> <sample name> pairs."},
  {"tracks",               "n",    "Generate and merge genome browser tracks (y/n)."},
  {"assembly",             "hg19", "Genome assembly used to generate tracks."},
  {"window",               "",     "Window size (bp) around each anchor used to search for DHSs."},
  {"correlationThreshold", "",     "Minimum correlation coefficient for an interaction to be reported."},
  {"pValueThreshold",      "",     "P-value cutoff used to call significant interactions."},
  {"qValueThreshold",      "",     "Q-value cutoff used to call significant interactions."},
  {"correlationMethod",    "",     "Correlation coefficient used to score interactions."},
  {"figures",              "",     "Render interaction landscape figures (y/n)."},
  {"figureWidth",          "",     "Width of the interaction landscape figures."},
  {"zoom",                 "",     "Zoom level used when plotting interaction landscapes."},
  {"colours",              "",     "Colour palette used by figures."},
}};
// clang-format on

[[nodiscard]] bool is_known_config_option(std::string_view key) noexcept;
[[nodiscard]] std::string format_config_options_help();

// Key/value pairs read from a configuration file.
// Keys that were never assigned resolve to the documented default (see known_config_options).
class ConfigStore {
 public:
  using MapT = phmap::btree_map<std::string, std::string, std::less<>>;
  using ModuleDirective = std::vector<std::string>;

 private:
  std::filesystem::path _path{};
  MapT _values{};
  std::vector<ModuleDirective> _module_directives{};

 public:
  ConfigStore() = default;
  explicit ConfigStore(std::filesystem::path path);

  [[nodiscard]] const std::filesystem::path &path() const noexcept;

  [[nodiscard]] std::string_view get(std::string_view key) const noexcept;
  [[nodiscard]] bool has_value(std::string_view key) const noexcept;
  [[nodiscard]] bool contains(std::string_view key) const noexcept;
  [[nodiscard]] std::size_t size() const noexcept;
  [[nodiscard]] bool empty() const noexcept;
  [[nodiscard]] auto begin() const noexcept { return _values.begin(); }
  [[nodiscard]] auto end() const noexcept { return _values.end(); }

  void set(std::string key, std::string value);

  void add_module_directive(ModuleDirective modules);
  [[nodiscard]] auto module_directives() const noexcept -> const std::vector<ModuleDirective> &;

  [[nodiscard]] std::vector<std::string_view> unknown_keys() const;
  [[nodiscard]] std::string dump() const;
};

}  // namespace dhslink
