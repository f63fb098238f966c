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

#include "dhslink/sample_list.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fmt/std.h>
#include <parallel_hashmap/btree.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cassert>
#include <cstddef>
#include <filesystem>
#include <istream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "dhslink/errors.hpp"
#include "dhslink/input_mode.hpp"
#include "dhslink/text.hpp"

namespace dhslink {

[[nodiscard]] static std::array<std::string_view, 2> split_entry(InputMode mode,
                                                                 std::string_view line) {
  switch (mode) {
    case InputMode::MATRIX_LIST:
      return tokenize_record_collapse<2>(line, ' ');
    case InputMode::REFERENCE_LIST:
      return tokenize_record<2>(line, '\t');
    case InputMode::SINGLE_SAMPLE:
      break;
  }
  throw std::logic_error("sample lists are not used in single-sample mode");
}

// Sample names become folder names under outDirectory
[[nodiscard]] static std::optional<std::string_view> check_sample_name(std::string_view name) {
  if (name == "." || name == "..") {
    return "sample name cannot be \".\" or \"..\"";
  }
  if (name.find('/') != std::string_view::npos) {
    return "sample name cannot contain \"/\"";
  }
  return std::nullopt;
}

static void validate_sample_names(const std::vector<SampleSpec> &samples,
                                  const std::filesystem::path &path) {
  phmap::btree_set<std::string_view> names{};
  std::vector<std::string_view> duplicates{};
  for (const auto &s : samples) {
    if (s.malformed()) {
      continue;
    }
    if (!names.emplace(s.sample_name).second) {
      duplicates.emplace_back(s.sample_name);
    }
  }

  if (!duplicates.empty()) {
    throw ValidationError(fmt::format(
        "found duplicate sample name(s) in {}: {}. Sample names are used as output folder names "
        "and must be unique",
        path, fmt::join(duplicates, ", ")));
  }
}

std::vector<SampleSpec> parse_sample_list(InputMode mode, std::istream &stream,
                                          const std::filesystem::path &path) {
  assert(mode != InputMode::SINGLE_SAMPLE);
  SPDLOG_DEBUG("reading {} from {}...", to_string(mode), path);

  std::vector<SampleSpec> samples{};
  std::string buffer{};

  for (std::size_t i = 1; std::getline(stream, buffer); ++i) {
    strip_line_terminator(buffer);
    if (is_blank(buffer)) {
      continue;
    }

    const auto [input_path, sample_name] = split_entry(mode, buffer);
    auto &s = samples.emplace_back(
        SampleSpec{.input_path = std::string{input_path}, .sample_name = std::string{sample_name}});

    if (input_path.empty() || sample_name.empty()) {
      s.error = MalformedListEntryError(
          path, i,
          fmt::format("expected two {}-separated fields, found \"{}\"",
                      mode == InputMode::MATRIX_LIST ? "space" : "tab", buffer));
    } else if (const auto reason = check_sample_name(sample_name); reason.has_value()) {
      s.error = MalformedListEntryError(path, i, fmt::format("{}, found \"{}\"", *reason,
                                                             sample_name));
    }

    if (s.malformed()) {
      SPDLOG_WARN("{}", s.error->what());
    }
  }

  const auto num_samples = samples.size();
  for (std::size_t i = 0; i < num_samples; ++i) {
    samples[i].ordinal = i + 1;
    samples[i].total_samples = num_samples;
  }

  validate_sample_names(samples, path);

  return samples;
}

std::vector<SampleSpec> parse_sample_list(InputMode mode, const std::filesystem::path &path) {
  auto fs = open_text_file_checked(path);
  return parse_sample_list(mode, fs, path);
}

std::vector<SampleSpec> build_sample_specs(const ResolvedConfig &c) {
  if (c.multi_sample()) {
    auto samples = parse_sample_list(c.mode, c.sample_list);
    if (samples.empty()) {
      SPDLOG_WARN("sample list {} does not contain any sample. Is this intended?", c.sample_list);
    }
    return samples;
  }

  const auto input =
      c.config.has_value("matrix") ? c.config.get("matrix") : c.config.get("reference");
  return {SampleSpec{.input_path = std::string{input}}};
}

}  // namespace dhslink
