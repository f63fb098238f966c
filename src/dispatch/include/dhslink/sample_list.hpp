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
#include <optional>
#include <string>
#include <vector>

#include "dhslink/errors.hpp"
#include "dhslink/input_mode.hpp"

namespace dhslink {

struct SampleSpec {
  std::string input_path{};
  std::string sample_name{};
  // Only set when more than one sample is being processed
  std::optional<std::size_t> ordinal{};
  std::optional<std::size_t> total_samples{};
  // Set when the entry was missing fields in the sample list
  std::optional<MalformedListEntryError> error{};

  [[nodiscard]] bool malformed() const noexcept { return error.has_value(); }
};

// Parse a list of samples.
// MATRIX_LIST lists are space-delimited (<matrix> <sample>), REFERENCE_LIST lists are
// tab-delimited (<reference>\t<sample>). Ordinals are assigned in file order starting from 1.
[[nodiscard]] std::vector<SampleSpec> parse_sample_list(InputMode mode, std::istream &stream,
                                                        const std::filesystem::path &path = {});
[[nodiscard]] std::vector<SampleSpec> parse_sample_list(InputMode mode,
                                                        const std::filesystem::path &path);

// Samples to be processed given a resolved configuration.
// In SINGLE_SAMPLE mode this returns one implicit sample without ordinal and total.
[[nodiscard]] std::vector<SampleSpec> build_sample_specs(const ResolvedConfig &c);

}  // namespace dhslink
