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

#include "dhslink/config_store.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dhslink {

[[nodiscard]] static const ConfigOption *find_option(std::string_view key) noexcept {
  const auto match = std::ranges::find(known_config_options, key, &ConfigOption::key);
  if (match == known_config_options.end()) {
    return nullptr;
  }
  return &*match;
}

bool is_known_config_option(std::string_view key) noexcept { return find_option(key) != nullptr; }

std::string format_config_options_help() {
  const auto width = std::ranges::max(known_config_options, {}, [](const auto &opt) {
                       return opt.key.size();
                     }).key.size();

  std::string buff{"Configuration file options (one key=value pair per line):\n"};
  for (const auto &[key, default_value, description] : known_config_options) {
    if (default_value.empty()) {
      fmt::format_to(std::back_inserter(buff), "  {:<{}}  {}\n", key, width, description);
    } else {
      fmt::format_to(std::back_inserter(buff), "  {:<{}}  {} Default: {}.\n", key, width,
                     description, default_value);
    }
  }
  buff += "Lines containing \"module load\" load environment modules before each analysis run.\n";
  return buff;
}

ConfigStore::ConfigStore(std::filesystem::path path) : _path(std::move(path)) {}

const std::filesystem::path &ConfigStore::path() const noexcept { return _path; }

std::string_view ConfigStore::get(std::string_view key) const noexcept {
  if (const auto match = _values.find(key); match != _values.end()) {
    return match->second;
  }
  if (const auto *opt = find_option(key); opt) {
    return opt->default_value;
  }
  return {};
}

bool ConfigStore::has_value(std::string_view key) const noexcept { return !get(key).empty(); }

bool ConfigStore::contains(std::string_view key) const noexcept { return _values.contains(key); }

std::size_t ConfigStore::size() const noexcept { return _values.size(); }

bool ConfigStore::empty() const noexcept { return _values.empty(); }

void ConfigStore::set(std::string key, std::string value) {
  _values.insert_or_assign(std::move(key), std::move(value));
}

void ConfigStore::add_module_directive(ModuleDirective modules) {
  if (!modules.empty()) {
    _module_directives.emplace_back(std::move(modules));
  }
}

auto ConfigStore::module_directives() const noexcept -> const std::vector<ModuleDirective> & {
  return _module_directives;
}

std::vector<std::string_view> ConfigStore::unknown_keys() const {
  std::vector<std::string_view> keys{};
  for (const auto &[key, _] : _values) {
    if (!is_known_config_option(key)) {
      keys.emplace_back(key);
    }
  }
  return keys;
}

std::string ConfigStore::dump() const {
  std::string buff{};
  auto out = std::back_inserter(buff);

  for (const auto &opt : known_config_options) {
    fmt::format_to(out, "{}={}\n", opt.key, get(opt.key));
  }
  for (const auto &key : unknown_keys()) {
    fmt::format_to(out, "{}={}\n", key, get(key));
  }
  for (const auto &modules : _module_directives) {
    fmt::format_to(out, "module load {}\n", fmt::join(modules, " "));
  }

  return buff;
}

}  // namespace dhslink
