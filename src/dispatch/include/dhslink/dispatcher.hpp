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

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dhslink/input_mode.hpp"
#include "dhslink/process.hpp"
#include "dhslink/sample_list.hpp"

namespace dhslink {

// Arguments for one run of the single-sample analysis program
struct AnalysisInvocation {
  std::filesystem::path config_path{};
  std::string input_flag{};
  std::string input_path{};
  std::filesystem::path output_dir{};
  std::string sample_name{};
  std::optional<std::size_t> ordinal{};
  std::optional<std::size_t> total_samples{};

  [[nodiscard]] bool multi_sample() const noexcept;
  [[nodiscard]] std::vector<std::string> args() const;
};

struct UnitOutcome {
  enum class Status : std::uint8_t { SUCCEEDED, FAILED, SKIPPED };

  std::string sample_name{};
  std::filesystem::path output_dir{};
  std::string command{};
  Status status{Status::FAILED};
  int exit_code{-1};
  std::string error{};
  std::chrono::milliseconds elapsed{};

  [[nodiscard]] bool ok() const noexcept { return status == Status::SUCCEEDED; }
};

[[nodiscard]] std::string_view to_string(UnitOutcome::Status status) noexcept;

struct DispatchOptions {
  std::filesystem::path analysis_program{"dhslink-analyze"};
  std::size_t threads{1};
};

[[nodiscard]] AnalysisInvocation make_analysis_invocation(const ResolvedConfig &c,
                                                          const SampleSpec &sample);

[[nodiscard]] std::filesystem::path generate_unit_log_file_name(
    const AnalysisInvocation &invocation);

// Run one analysis unit per sample and wait for all of them to return.
// Outcomes are returned in the same order as samples.
// Failures of individual units are recorded in their outcome and never interrupt other units.
// Throws when the analysis program cannot be found.
[[nodiscard]] std::vector<UnitOutcome> dispatch_units(const ResolvedConfig &c,
                                                      const std::vector<SampleSpec> &samples,
                                                      const DispatchOptions &opts,
                                                      ProcessLauncher &launcher);

}  // namespace dhslink
