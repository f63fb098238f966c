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

#include "dhslink/input_mode.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <string_view>
#include <utility>

#include "dhslink/common.hpp"
#include "dhslink/config_store.hpp"
#include "dhslink/errors.hpp"

namespace dhslink {

bool ResolvedConfig::multi_sample() const noexcept { return mode != InputMode::SINGLE_SAMPLE; }

std::filesystem::path ResolvedConfig::output_directory() const {
  return std::filesystem::path{config.get("outDirectory")};
}

ResolvedConfig resolve_input_mode(ConfigStore config) {
  if (!config.has_value("anchor") || !config.has_value("outDirectory")) {
    throw ValidationError("missing anchor or outDirectory");
  }

  if (!config.has_value("assembly")) {
    config.set("assembly", "hg19");
  }

  if (config.has_value("matrices")) {
    if (config.has_value("references")) {
      SPDLOG_DEBUG("both matrices and references have been specified: references will be ignored");
    }
    std::filesystem::path list{config.get("matrices")};
    return {.config = std::move(config),
            .mode = InputMode::MATRIX_LIST,
            .sample_list = std::move(list)};
  }

  if (config.has_value("references")) {
    if (!config.has_value("db")) {
      throw ValidationError("missing db");
    }
    std::filesystem::path list{config.get("references")};
    return {.config = std::move(config),
            .mode = InputMode::REFERENCE_LIST,
            .sample_list = std::move(list)};
  }

  const auto has_reference_and_db = config.has_value("reference") && config.has_value("db");
  if (!config.has_value("matrix") && !has_reference_and_db) {
    throw ValidationError("missing reference or db");
  }

  return {.config = std::move(config), .mode = InputMode::SINGLE_SAMPLE, .sample_list = {}};
}

std::string_view to_string(InputMode mode) noexcept {
  switch (mode) {
    case InputMode::MATRIX_LIST:
      return "matrix-list";
    case InputMode::REFERENCE_LIST:
      return "reference-list";
    case InputMode::SINGLE_SAMPLE:
      return "single-sample";
  }
  return "unknown";
}

std::string_view input_flag(InputMode mode) {
  switch (mode) {
    case InputMode::MATRIX_LIST:
      return "-matrix";
    case InputMode::REFERENCE_LIST:
      return "-ref";
    case InputMode::SINGLE_SAMPLE:
      return "";
  }
  unreachable_code();
}

}  // namespace dhslink
