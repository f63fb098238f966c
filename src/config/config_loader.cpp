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

#include "dhslink/config_loader.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cassert>
#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "dhslink/errors.hpp"
#include "dhslink/text.hpp"

namespace dhslink {

namespace internal {

static constexpr std::string_view module_load_token{"module load"};

[[nodiscard]] static bool is_valid_variable_name(std::string_view name) noexcept {
  if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())) != 0) {
    return false;
  }
  return std::ranges::all_of(name, [](unsigned char c) { return std::isalnum(c) != 0 || c == '_'; });
}

[[nodiscard]] static bool is_valid_module_name(std::string_view name) noexcept {
  constexpr std::string_view extra_chars{"._+/-"};
  return !name.empty() && std::ranges::all_of(name, [&](unsigned char c) {
    return std::isalnum(c) != 0 || extra_chars.find(static_cast<char>(c)) != std::string_view::npos;
  });
}

[[nodiscard]] static std::string lookup_variable(std::string_view name, const ConfigStore &vars) {
  if (vars.contains(name)) {
    return std::string{vars.get(name)};
  }

  // NOLINTNEXTLINE(*-mt-unsafe)
  if (const auto *value = std::getenv(std::string{name}.c_str()); value) {
    return value;
  }

  return {};
}

[[nodiscard]] static std::string expand_tilde(std::string_view value) {
  if (value.empty() || value.front() != '~' || (value.size() > 1 && value[1] != '/')) {
    return std::string{value};
  }

  // NOLINTNEXTLINE(*-mt-unsafe)
  const auto *home = std::getenv("HOME");
  if (!home) {
    return std::string{value};
  }
  return fmt::format("{}{}", home, value.substr(1));
}

std::size_t find_unescaped(std::string_view s, char c) noexcept {
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\\') {
      ++i;
      continue;
    }
    if (s[i] == c) {
      return i;
    }
  }
  return std::string_view::npos;
}

bool is_module_directive(std::string_view line) noexcept {
  return line.find(module_load_token) != std::string_view::npos;
}

std::vector<std::string> parse_module_directive(std::string_view line) {
  const auto pos = line.find(module_load_token);
  assert(pos != std::string_view::npos);
  line.remove_prefix(pos + module_load_token.size());

  std::vector<std::string> modules{};
  while (!line.empty()) {
    const auto first = line.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
      break;
    }
    line.remove_prefix(first);
    const auto last = line.find_first_of(" \t");
    const auto name = line.substr(0, last);

    if (!is_valid_module_name(name)) {
      throw ValidationError(
          fmt::format("invalid module name \"{}\": only environment module names are allowed "
                      "after \"module load\"",
                      name));
    }
    modules.emplace_back(name);
    line.remove_prefix(name.size());
  }

  if (modules.empty()) {
    throw ValidationError("\"module load\" directive does not name any module");
  }

  return modules;
}

// Position of the '}' closing the reference that starts at s[0] ("${").
// Nested references (e.g. ${A:-${B}}) are skipped over.
[[nodiscard]] static std::size_t find_closing_brace(std::string_view s) noexcept {
  std::size_t depth = 0;
  for (std::size_t i = 1; i < s.size(); ++i) {
    if (s[i] == '\\') {
      ++i;
      continue;
    }
    if (s[i] == '{') {
      ++depth;
    } else if (s[i] == '}' && --depth == 0) {
      return i;
    }
  }
  return std::string_view::npos;
}

// Expand ${NAME} or ${NAME:-default} starting at the opening brace.
// Returns the expanded text and the number of characters consumed.
[[nodiscard]] static std::pair<std::string, std::size_t> expand_braced_variable(
    std::string_view s, const ConfigStore &vars) {
  assert(s.starts_with("${"));
  const auto end = find_closing_brace(s);
  if (end == std::string_view::npos) {
    throw ValidationError(fmt::format("unterminated variable reference in \"{}\"", s));
  }

  auto body = s.substr(2, end - 2);
  std::optional<std::string_view> default_value{};
  if (const auto sep = body.find(":-"); sep != std::string_view::npos) {
    default_value = body.substr(sep + 2);
    body = body.substr(0, sep);
  }

  if (!is_valid_variable_name(body)) {
    throw ValidationError(fmt::format("bad substitution: \"{}\"", s.substr(0, end + 1)));
  }

  auto value = lookup_variable(body, vars);
  if (value.empty() && default_value.has_value()) {
    value = expand_value(*default_value, vars);
  }
  return {std::move(value), end + 1};
}

std::string expand_value(std::string_view raw, const ConfigStore &vars) {
  if (raw.size() > 1 && raw.front() == '\'' && raw.back() == '\'') {
    return std::string{raw.substr(1, raw.size() - 2)};
  }
  if (raw.size() > 1 && raw.front() == '"' && raw.back() == '"') {
    raw = raw.substr(1, raw.size() - 2);
  }

  const auto s = expand_tilde(raw);
  const std::string_view sv{s};

  std::string buff{};
  buff.reserve(s.size());

  for (std::size_t i = 0; i < sv.size(); ++i) {
    const auto c = sv[i];
    if (c == '\\' && i + 1 < sv.size()) {
      const auto next = sv[i + 1];
      if (next == '$' || next == '=' || next == '\\' || next == '"' || next == '\'' ||
          next == '`') {
        buff.push_back(next);
        ++i;
        continue;
      }
      buff.push_back(c);
      continue;
    }

    if (c == '`') {
      SPDLOG_WARN("command substitution is not supported: keeping \"{}\" as is", s);
      buff.push_back(c);
      continue;
    }

    if (c != '$' || i + 1 == sv.size()) {
      buff.push_back(c);
      continue;
    }

    const auto next = sv[i + 1];
    if (next == '{') {
      auto [value, consumed] = expand_braced_variable(sv.substr(i), vars);
      buff.append(value);
      i += consumed - 1;
      continue;
    }

    if (next == '(') {
      SPDLOG_WARN("command substitution is not supported: keeping \"{}\" as is", s);
      buff.push_back(c);
      continue;
    }

    if (std::isalpha(static_cast<unsigned char>(next)) != 0 || next == '_') {
      std::size_t j = i + 1;
      while (j < sv.size() &&
             (std::isalnum(static_cast<unsigned char>(sv[j])) != 0 || sv[j] == '_')) {
        ++j;
      }
      buff.append(lookup_variable(sv.substr(i + 1, j - (i + 1)), vars));
      i = j - 1;
      continue;
    }

    buff.push_back(c);
  }

  return buff;
}

[[nodiscard]] static bool is_comment(std::string_view line) noexcept {
  const auto pos = line.find_first_not_of(" \t");
  return pos != std::string_view::npos && line[pos] == '#';
}

}  // namespace internal

ConfigStore load_config(std::istream &stream, const std::filesystem::path &path) {
  if (path.empty()) {
    SPDLOG_DEBUG("reading configuration...");
  } else {
    SPDLOG_DEBUG("reading configuration from {}...", path);
  }

  ConfigStore config{path};
  std::string buffer{};

  for (std::size_t i = 1; std::getline(stream, buffer); ++i) {
    strip_line_terminator(buffer);
    const std::string_view line{buffer};

    try {
      if (internal::is_comment(line)) {
        continue;
      }

      if (internal::is_module_directive(line)) {
        auto modules = internal::parse_module_directive(line);
        SPDLOG_DEBUG("line {}: found directive to load module(s) {}", i, fmt::join(modules, ", "));
        config.add_module_directive(std::move(modules));
        continue;
      }

      const auto pos = internal::find_unescaped(line, '=');
      if (pos == std::string_view::npos) {
        continue;
      }

      std::string key{line.substr(0, pos)};
      auto value = internal::expand_value(line.substr(pos + 1), config);
      if (config.contains(key)) {
        SPDLOG_DEBUG("line {}: overriding previous value for \"{}\"", i, key);
      }
      config.set(std::move(key), std::move(value));

    } catch (const ValidationError &e) {
      if (path.empty()) {
        throw ValidationError(fmt::format("invalid configuration at line {}: {}", i, e.what()));
      }
      throw ValidationError(
          fmt::format("invalid configuration at line {} of file {}: {}", i, path, e.what()));
    }
  }

  for (const auto &key : config.unknown_keys()) {
    SPDLOG_DEBUG("configuration option \"{}\" is not recognized and will be ignored", key);
  }

  return config;
}

ConfigStore load_config(const std::filesystem::path &path) {
  auto fs = open_text_file_checked(path);
  return load_config(fs, path);
}

}  // namespace dhslink
