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

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include "dhslink/config_store.hpp"
#include "dhslink/errors.hpp"
#include "dhslink/input_mode.hpp"
#include "dhslink/sample_list.hpp"
#include "dhslink/test/tmpdir.hpp"

namespace dhslink::test {

[[nodiscard]] static std::vector<SampleSpec> parse(InputMode mode, const std::string &content) {
  std::istringstream ss{content};
  return parse_sample_list(mode, ss, "samples.txt");
}

// NOLINTBEGIN(*-avoid-magic-numbers,readability-function-cognitive-complexity)
TEST_CASE("SampleList: matrix list", "[short][dispatch]") {
  SECTION("simple") {
    const auto samples = parse(InputMode::MATRIX_LIST, "m1.txt A\nm2.txt B\n");
    REQUIRE(samples.size() == 2);

    CHECK(samples[0].input_path == "m1.txt");
    CHECK(samples[0].sample_name == "A");
    CHECK(samples[0].ordinal == 1);
    CHECK(samples[0].total_samples == 2);
    CHECK_FALSE(samples[0].malformed());

    CHECK(samples[1].input_path == "m2.txt");
    CHECK(samples[1].sample_name == "B");
    CHECK(samples[1].ordinal == 2);
    CHECK(samples[1].total_samples == 2);
  }

  SECTION("repeated and leading spaces") {
    const auto samples = parse(InputMode::MATRIX_LIST, "   m1.txt    A   extra\r\n");
    REQUIRE(samples.size() == 1);
    CHECK(samples[0].input_path == "m1.txt");
    CHECK(samples[0].sample_name == "A");
  }

  SECTION("blank lines") {
    const auto samples = parse(InputMode::MATRIX_LIST, "\nm1.txt A\n   \n\nm2.txt B");
    REQUIRE(samples.size() == 2);
    CHECK(samples[1].ordinal == 2);
    CHECK(samples[1].total_samples == 2);
  }

  SECTION("tabs are not separators") {
    const auto samples = parse(InputMode::MATRIX_LIST, "m1.txt\tA\n");
    REQUIRE(samples.size() == 1);
    CHECK(samples[0].malformed());
    CHECK(samples[0].input_path == "m1.txt\tA");
    CHECK(samples[0].sample_name.empty());
  }
}

TEST_CASE("SampleList: reference list", "[short][dispatch]") {
  SECTION("simple") {
    const auto samples = parse(InputMode::REFERENCE_LIST, "r1.bed\tA\nr2.bed\tB\nr3.bed\tC\n");
    REQUIRE(samples.size() == 3);
    CHECK(samples[2].input_path == "r3.bed");
    CHECK(samples[2].sample_name == "C");
    CHECK(samples[2].ordinal == 3);
    CHECK(samples[2].total_samples == 3);
  }

  SECTION("spaces are part of the fields") {
    const auto samples = parse(InputMode::REFERENCE_LIST, "my file.bed\tsample A\n");
    REQUIRE(samples.size() == 1);
    CHECK(samples[0].input_path == "my file.bed");
    CHECK(samples[0].sample_name == "sample A");
  }

  SECTION("empty fields are preserved") {
    const auto samples = parse(InputMode::REFERENCE_LIST, "\tA\nr2.bed\t\tB\n");
    REQUIRE(samples.size() == 2);
    CHECK(samples[0].malformed());
    CHECK(samples[0].input_path.empty());
    CHECK(samples[0].sample_name == "A");
    CHECK(samples[1].malformed());
    CHECK(samples[1].input_path == "r2.bed");
    CHECK(samples[1].sample_name.empty());
  }
}

TEST_CASE("SampleList: malformed entries", "[short][dispatch]") {
  const auto samples = parse(InputMode::MATRIX_LIST, "m1.txt A\nm2.txt\nm3.txt C\n");
  REQUIRE(samples.size() == 3);

  CHECK_FALSE(samples[0].malformed());
  CHECK_FALSE(samples[2].malformed());

  REQUIRE(samples[1].malformed());
  CHECK(samples[1].input_path == "m2.txt");
  CHECK(samples[1].ordinal == 2);
  CHECK(samples[1].total_samples == 3);
  CHECK_THAT(samples[1].error->what(),
             Catch::Matchers::ContainsSubstring("malformed entry at line 2 of file"));
  CHECK_THAT(samples[1].error->what(), Catch::Matchers::ContainsSubstring("samples.txt"));
}

TEST_CASE("SampleList: sample names that are not folder names", "[short][dispatch]") {
  SECTION("matrix list") {
    const auto samples =
        parse(InputMode::MATRIX_LIST, "m1.txt /abs\nm2.txt grp/A\nm3.txt ..\nm4.txt .\nm5.txt A\n");
    REQUIRE(samples.size() == 5);

    for (const auto i : {0UZ, 1UZ}) {
      REQUIRE(samples[i].malformed());
      CHECK_THAT(samples[i].error->what(), Catch::Matchers::ContainsSubstring("cannot contain"));
    }
    for (const auto i : {2UZ, 3UZ}) {
      REQUIRE(samples[i].malformed());
      CHECK_THAT(samples[i].error->what(), Catch::Matchers::ContainsSubstring("cannot be"));
    }
    CHECK_THAT(samples[1].error->what(),
               Catch::Matchers::ContainsSubstring("malformed entry at line 2"));

    CHECK_FALSE(samples[4].malformed());
    CHECK(samples[4].ordinal == 5);
    CHECK(samples[4].total_samples == 5);
  }

  SECTION("reference list") {
    const auto samples = parse(InputMode::REFERENCE_LIST, "r1.bed\t../A\nr2.bed\tA.1\n");
    REQUIRE(samples.size() == 2);
    CHECK(samples[0].malformed());
    CHECK_FALSE(samples[1].malformed());
  }

  SECTION("rejected names are not checked for duplicates") {
    const auto samples = parse(InputMode::MATRIX_LIST, "m1.txt ..\nm2.txt ..\n");
    REQUIRE(samples.size() == 2);
    CHECK(samples[0].malformed());
    CHECK(samples[1].malformed());
  }
}

TEST_CASE("SampleList: duplicate sample names", "[short][dispatch]") {
  CHECK_THROWS_AS(parse(InputMode::MATRIX_LIST, "m1.txt A\nm2.txt B\nm3.txt A\n"), ValidationError);
  CHECK_THROWS_WITH(parse(InputMode::REFERENCE_LIST, "r1.bed\tX\nr2.bed\tX\n"),
                    Catch::Matchers::ContainsSubstring("duplicate sample name(s)"));
}

TEST_CASE("SampleList: empty list", "[short][dispatch]") {
  CHECK(parse(InputMode::MATRIX_LIST, "").empty());
  CHECK(parse(InputMode::REFERENCE_LIST, "\n\n").empty());
}

TEST_CASE("SampleList: build sample specs", "[short][dispatch]") {
  const auto dir = testdir() / "sample_list";

  ConfigStore config{dir / "config.txt"};
  config.set("anchor", "a.bed");
  config.set("outDirectory", (dir / "out").string());

  SECTION("matrix list") {
    const auto list = write_file(dir / "matrices.txt", "m1.txt A\nm2.txt B\n");
    config.set("matrices", list.string());
    const auto samples = build_sample_specs(resolve_input_mode(config));
    REQUIRE(samples.size() == 2);
    CHECK(samples[1].sample_name == "B");
  }

  SECTION("missing list file") {
    config.set("references", (dir / "missing.txt").string());
    config.set("db", "db.txt");
    const auto c = resolve_input_mode(config);
    CHECK_THROWS_AS(build_sample_specs(c), MissingFileError);
  }

  SECTION("list file is a directory") {
    std::filesystem::create_directories(dir / "a_folder");
    config.set("matrices", (dir / "a_folder").string());
    CHECK_THROWS_AS(build_sample_specs(resolve_input_mode(config)), MissingFileError);
  }

  SECTION("single sample from reference") {
    config.set("reference", "ref.bed");
    config.set("db", "db.txt");
    const auto samples = build_sample_specs(resolve_input_mode(config));
    REQUIRE(samples.size() == 1);
    CHECK(samples[0].input_path == "ref.bed");
    CHECK(samples[0].sample_name.empty());
    CHECK_FALSE(samples[0].ordinal.has_value());
    CHECK_FALSE(samples[0].total_samples.has_value());
  }

  SECTION("single sample from matrix") {
    config.set("matrix", "m.txt");
    config.set("reference", "ref.bed");
    config.set("db", "db.txt");
    const auto samples = build_sample_specs(resolve_input_mode(config));
    REQUIRE(samples.size() == 1);
    CHECK(samples[0].input_path == "m.txt");
  }
}
// NOLINTEND(*-avoid-magic-numbers,readability-function-cognitive-complexity)

}  // namespace dhslink::test
