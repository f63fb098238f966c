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

#include "dhslink/aggregation.hpp"

#include <fmt/format.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "dhslink/common.hpp"

namespace dhslink {

std::vector<std::string> MergeTracksInvocation::args() const {
  return {anchors.string(), output_dir.string(), sample_list.string(), assembly};
}

bool merge_tracks_requested(const ConfigStore &config) { return config.get("tracks") == "y"; }

MergeTracksInvocation make_merge_tracks_invocation(const ResolvedConfig &c) {
  const auto output_dir = c.output_directory();
  return {.anchors = output_dir / "anchors.bed",
          .output_dir = output_dir,
          .sample_list = c.multi_sample() ? c.sample_list : c.config.path(),
          .assembly = std::string{c.config.get("assembly")}};
}

std::optional<UnitOutcome> trigger_aggregation(const ResolvedConfig &c,
                                               const std::vector<UnitOutcome> &units,
                                               const std::filesystem::path &merge_program,
                                               ProcessLauncher &launcher) {
  if (!merge_tracks_requested(c.config)) {
    SPDLOG_DEBUG("track merging was not requested: skipping aggregation step");
    return {};
  }

  const auto invocation = make_merge_tracks_invocation(c);
  UnitOutcome outcome{.output_dir = invocation.output_dir};

  const auto num_failures = std::ranges::count_if(units, [](const auto &u) { return !u.ok(); });
  if (num_failures != 0) {
    SPDLOG_WARN("merging tracks even though {}/{} analysis unit(s) failed", num_failures,
                units.size());
  }
  if (!std::filesystem::exists(invocation.anchors)) {
    SPDLOG_WARN("anchor file {} does not exist", invocation.anchors);
  }

  const auto t0 = std::chrono::steady_clock::now();
  try {
    const auto cmd = launcher.make_command(launcher.resolve(merge_program), invocation.args());
    outcome.command = cmd.to_string();

    std::filesystem::create_directories(invocation.output_dir);
    SPDLOG_INFO("merging tracks: {}", outcome.command);
    outcome.exit_code = launcher.run(cmd, invocation.output_dir / "merge_tracks.log");

    const auto t1 = std::chrono::steady_clock::now();
    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0);
    if (outcome.exit_code != 0) {
      outcome.error = fmt::format("track merging terminated with exit code {}", outcome.exit_code);
      SPDLOG_ERROR("{} (see {} for more details)", outcome.error,
                   invocation.output_dir / "merge_tracks.log");
      return outcome;
    }

    outcome.status = UnitOutcome::Status::SUCCEEDED;
    SPDLOG_INFO("merged tracks in {}", format_duration(t1 - t0));
  } catch (const std::exception &e) {
    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0);
    outcome.error = e.what();
    SPDLOG_ERROR("failed to merge tracks: {}", outcome.error);
  }

  return outcome;
}

}  // namespace dhslink
