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

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "dhslink/config_store.hpp"
#include "dhslink/dispatcher.hpp"
#include "dhslink/input_mode.hpp"
#include "dhslink/process.hpp"

namespace dhslink {

struct MergeTracksInvocation {
  std::filesystem::path anchors{};
  std::filesystem::path output_dir{};
  std::filesystem::path sample_list{};
  std::string assembly{};

  [[nodiscard]] std::vector<std::string> args() const;
};

[[nodiscard]] bool merge_tracks_requested(const ConfigStore &config);

[[nodiscard]] MergeTracksInvocation make_merge_tracks_invocation(const ResolvedConfig &c);

// Merge the tracks generated by the analysis units.
// Must be called only once all units have returned. Returns std::nullopt when track merging
// was not requested. Failures to run the merge program are reported through the returned outcome.
[[nodiscard]] std::optional<UnitOutcome> trigger_aggregation(
    const ResolvedConfig &c, const std::vector<UnitOutcome> &units,
    const std::filesystem::path &merge_program, ProcessLauncher &launcher);

}  // namespace dhslink
