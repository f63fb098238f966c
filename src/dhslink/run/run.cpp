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

#include <fmt/format.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

#include "dhslink/aggregation.hpp"
#include "dhslink/common.hpp"
#include "dhslink/config_loader.hpp"
#include "dhslink/dispatcher.hpp"
#include "dhslink/errors.hpp"
#include "dhslink/input_mode.hpp"
#include "dhslink/process.hpp"
#include "dhslink/run_report.hpp"
#include "dhslink/sample_list.hpp"
#include "dhslink/tools/config.hpp"
#include "dhslink/tools/logging.hpp"
#include "dhslink/tools/tools.hpp"

namespace dhslink {

[[nodiscard]] static std::string_view aggregation_status(const std::optional<UnitOutcome> &merge) {
  if (!merge.has_value()) {
    return "skipped";
  }
  return to_string(merge->status);
}

static void write_report(const ResolvedConfig &c, const std::vector<UnitOutcome> &outcomes,
                         const std::optional<UnitOutcome> &merge) {
  const auto path = c.output_directory() / "dhslink_report.json";
  try {
    RunReport report(c.config.path(), to_string(c.mode), outcomes.size());
    for (const auto &outcome : outcomes) {
      report.add_unit({.sample = outcome.sample_name,
                       .output_dir = outcome.output_dir.string(),
                       .command = outcome.command,
                       .status = std::string{to_string(outcome.status)},
                       .exit_code = outcome.exit_code,
                       .error = outcome.error,
                       .elapsed_seconds = std::chrono::duration<double>(outcome.elapsed).count()});
    }
    report.set_aggregation_status(aggregation_status(merge));
    report.write(path);
    SPDLOG_INFO("run report written to {}", path);
  } catch (const std::exception &e) {
    SPDLOG_WARN("failed to write run report to {}: {}", path, e.what());
  }
}

int run_command(const DispatchConfig &c) {
  const auto t0 = std::chrono::steady_clock::now();

  const auto resolved = resolve_input_mode(load_config(c.path_to_config));
  if (c.print_config) {
    fmt::print("# input mode: {}\n{}", to_string(resolved.mode), resolved.config.dump());
    return 0;
  }

  const auto output_dir = resolved.output_directory();
  std::filesystem::create_directories(output_dir);

  std::optional<ScopedLogFile> log_file{};
  try {
    log_file.emplace(output_dir / "dhslink.log", spdlog::level::level_enum{c.verbosity});
  } catch (const std::exception &e) {
    SPDLOG_WARN("unable to initialize log file {}: {}", output_dir / "dhslink.log", e.what());
  }

  SPDLOG_INFO("reading configuration from {}", resolved.config.path());
  SPDLOG_INFO("input mode: {}", to_string(resolved.mode));
  if (resolved.multi_sample()) {
    SPDLOG_INFO("reading samples from {}", resolved.sample_list);
  }

  const auto samples = build_sample_specs(resolved);

  ProcessLauncher launcher{resolved.config.module_directives()};
  if (launcher.uses_environment_modules()) {
    SPDLOG_INFO("programs will be launched after loading {} environment module directive(s)",
                resolved.config.module_directives().size());
  }

  const auto outcomes = dispatch_units(
      resolved, samples, {.analysis_program = c.analysis_program, .threads = c.threads}, launcher);

  // all analysis units have returned at this point
  const auto merge = trigger_aggregation(resolved, outcomes, c.merge_program, launcher);

  if (c.write_report) {
    write_report(resolved, outcomes, merge);
  }

  const auto num_failures = std::ranges::count_if(outcomes, [](const auto &o) { return !o.ok(); });
  const auto t1 = std::chrono::steady_clock::now();
  SPDLOG_INFO("processed {} sample(s) ({} failure(s)) in {}", outcomes.size(), num_failures,
              format_duration(t1 - t0));

  if (merge.has_value() && !merge->ok()) {
    return 1;
  }
  return 0;
}

int run_command_checked(const DispatchConfig &c, std::FILE *failure_stream) {
  try {
    return run_command(c);
  } catch (const MissingFileError &e) {
    fmt::print(failure_stream, "FAILURE! {}\n", e.what());
  } catch (const ValidationError &e) {
    fmt::print(failure_stream, "FAILURE! {}\n", e.what());
  }
  std::fflush(failure_stream);
  return 1;
}

}  // namespace dhslink
