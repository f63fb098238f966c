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

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <filesystem>
#include <string>
#include <vector>

#include "dhslink/config_store.hpp"
#include "dhslink/dispatcher.hpp"
#include "dhslink/input_mode.hpp"
#include "dhslink/process.hpp"
#include "dhslink/sample_list.hpp"
#include "dhslink/test/tmpdir.hpp"

namespace dhslink::test {

[[nodiscard]] static ConfigStore make_config(const std::filesystem::path &dir) {
  ConfigStore config{dir / "config.txt"};
  config.set("anchor", (dir / "anchors.bed").string());
  config.set("outDirectory", (dir / "out").string());
  config.set("matrix", "m.txt");
  return config;
}

// NOLINTBEGIN(*-avoid-magic-numbers,readability-function-cognitive-complexity)
TEST_CASE("Aggregation: trigger", "[short][dispatch]") {
  ConfigStore config{};
  CHECK_FALSE(merge_tracks_requested(config));

  for (const auto *value : {"n", "", "Y", "yes", "true", " y"}) {
    config.set("tracks", value);
    CHECK_FALSE(merge_tracks_requested(config));
  }

  config.set("tracks", "y");
  CHECK(merge_tracks_requested(config));
}

TEST_CASE("Aggregation: invocation", "[short][dispatch]") {
  ConfigStore config{"config.txt"};
  config.set("anchor", "a.bed");
  config.set("outDirectory", "/out");

  SECTION("multi-sample") {
    config.set("references", "references.txt");
    config.set("db", "db.txt");
    config.set("assembly", "mm10");
    const auto invocation = make_merge_tracks_invocation(resolve_input_mode(config));
    const std::vector<std::string> expected{"/out/anchors.bed", "/out", "references.txt", "mm10"};
    CHECK(invocation.args() == expected);
  }

  SECTION("single-sample") {
    config.set("matrix", "m.txt");
    const auto invocation = make_merge_tracks_invocation(resolve_input_mode(config));
    const std::vector<std::string> expected{"/out/anchors.bed", "/out", "config.txt", "hg19"};
    CHECK(invocation.args() == expected);
  }
}

TEST_CASE("Aggregation: run", "[short][dispatch]") {
  const auto dir = testdir() / "aggregation_run";
  const auto merge_program = write_script(dir / "merge.sh", R"(printf '%s\n' "$@" > "$2/merge_args.txt"
echo "merging tracks")");
  const auto failing_merge_program = write_script(dir / "merge_ko.sh", "exit 1");

  auto config = make_config(dir);
  ProcessLauncher launcher{};

  SECTION("not requested") {
    const auto c = resolve_input_mode(config);
    CHECK_FALSE(trigger_aggregation(c, {}, merge_program, launcher).has_value());
    CHECK_FALSE(std::filesystem::exists(dir / "out" / "merge_args.txt"));
  }

  SECTION("requested") {
    config.set("tracks", "y");
    const auto c = resolve_input_mode(config);
    const auto outcome = trigger_aggregation(c, {}, merge_program, launcher);
    REQUIRE(outcome.has_value());
    CHECK(outcome->ok());
    CHECK(read_file(dir / "out" / "merge_args.txt") ==
          fmt::format("{}\n{}\n{}\nhg19\n", (dir / "out" / "anchors.bed").string(),
                      (dir / "out").string(), (dir / "config.txt").string()));
    CHECK_THAT(read_file(dir / "out" / "merge_tracks.log"),
               Catch::Matchers::ContainsSubstring("merging tracks"));
  }

  SECTION("failed units do not prevent merging") {
    config.set("tracks", "y");
    const auto c = resolve_input_mode(config);
    const std::vector<UnitOutcome> units{{.sample_name = "A", .exit_code = 1}};
    const auto outcome = trigger_aggregation(c, units, merge_program, launcher);
    REQUIRE(outcome.has_value());
    CHECK(outcome->ok());
  }

  SECTION("merge failure") {
    config.set("tracks", "y");
    const auto c = resolve_input_mode(config);
    const auto outcome = trigger_aggregation(c, {}, failing_merge_program, launcher);
    REQUIRE(outcome.has_value());
    CHECK_FALSE(outcome->ok());
    CHECK(outcome->exit_code == 1);
  }

  SECTION("missing merge program") {
    config.set("tracks", "y");
    const auto c = resolve_input_mode(config);
    const auto outcome =
        trigger_aggregation(c, {}, "dhslink-program-that-does-not-exist", launcher);
    REQUIRE(outcome.has_value());
    CHECK_FALSE(outcome->ok());
    CHECK_THAT(outcome->error, Catch::Matchers::ContainsSubstring("unable to find program"));
  }
}

TEST_CASE("Aggregation: runs after all units have returned", "[short][dispatch]") {
  const auto dir = testdir() / "aggregation_ordering";
  const auto analysis_program = write_script(dir / "analyze.sh", R"(sleep 0.2
touch "$5/done")");
  const auto merge_program =
      write_script(dir / "merge.sh", R"(ls "$2"/*/done | wc -l | tr -d ' ' > "$2/num_done.txt")");
  const auto list = write_file(dir / "matrices.txt", "m1.txt A\nm2.txt B\nm3.txt C\nm4.txt D\n");

  auto config = make_config(dir);
  config.set("matrices", list.string());
  config.set("tracks", "y");
  const auto c = resolve_input_mode(config);

  ProcessLauncher launcher{};
  const auto outcomes = dispatch_units(
      c, build_sample_specs(c), {.analysis_program = analysis_program, .threads = 4}, launcher);
  REQUIRE(outcomes.size() == 4);

  const auto merge = trigger_aggregation(c, outcomes, merge_program, launcher);
  REQUIRE(merge.has_value());
  CHECK(merge->ok());
  CHECK(read_file(dir / "out" / "num_done.txt") == "4\n");
}
// NOLINTEND(*-avoid-magic-numbers,readability-function-cognitive-complexity)

}  // namespace dhslink::test
