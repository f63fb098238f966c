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

#include <cstdint>
#include <filesystem>
#include <string_view>

#include "dhslink/config_store.hpp"

namespace dhslink {

enum class InputMode : std::uint8_t { MATRIX_LIST, REFERENCE_LIST, SINGLE_SAMPLE };

struct ResolvedConfig {
  ConfigStore config;
  InputMode mode{InputMode::SINGLE_SAMPLE};
  // List of samples to be dispatched. Empty when mode is SINGLE_SAMPLE
  std::filesystem::path sample_list{};

  [[nodiscard]] bool multi_sample() const noexcept;
  [[nodiscard]] std::filesystem::path output_directory() const;
};

// Select the input mode and validate the options it requires.
// Matrix lists take precedence over reference lists, which take precedence over single-sample
// options. Throws ValidationError when required options are missing.
[[nodiscard]] ResolvedConfig resolve_input_mode(ConfigStore config);

[[nodiscard]] std::string_view to_string(InputMode mode) noexcept;
// Flag used to pass the input of one sample to the analysis program
[[nodiscard]] std::string_view input_flag(InputMode mode);

}  // namespace dhslink
