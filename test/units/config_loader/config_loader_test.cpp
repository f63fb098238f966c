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
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include "dhslink/config_loader.hpp"
#include "dhslink/config_store.hpp"
#include "dhslink/errors.hpp"
#include "dhslink/test/tmpdir.hpp"

namespace dhslink::test {

[[nodiscard]] static ConfigStore parse(const std::string &content) {
  std::istringstream ss{content};
  return load_config(ss);
}

// NOLINTBEGIN(*-avoid-magic-numbers,readability-function-cognitive-complexity)
TEST_CASE("ConfigLoader: key-value pairs", "[short][config]") {
  SECTION("simple") {
    const auto config = parse(
        "anchor=anchors.bed\n"
        "outDirectory=/tmp/out\n"
        "window=500000\n");
    CHECK(config.size() == 3);
    CHECK(config.get("anchor") == "anchors.bed");
    CHECK(config.get("outDirectory") == "/tmp/out");
    CHECK(config.get("window") == "500000");
  }

  SECTION("comments and lines without assignment") {
    const auto config = parse(
        "# anchor=commented.bed\n"
        "   # another comment\n"
        "\n"
        "just some text\n"
        "anchor=anchors.bed\n");
    CHECK(config.size() == 1);
    CHECK(config.get("anchor") == "anchors.bed");
  }

  SECTION("CRLF line terminators") {
    const auto config = parse("anchor=anchors.bed\r\nassembly=hg38\r\n");
    CHECK(config.get("anchor") == "anchors.bed");
    CHECK(config.get("assembly") == "hg38");
  }

  SECTION("split on the first equal sign") {
    const auto config = parse("colours=a=b=c\n");
    CHECK(config.get("colours") == "a=b=c");
  }

  SECTION("escaped equal sign in key") {
    const auto config = parse("weird\\=key=value\n");
    CHECK(config.get("weird\\=key") == "value");
  }

  SECTION("last occurrence wins") {
    const auto config = parse("assembly=hg38\nassembly=mm10\n");
    CHECK(config.size() == 1);
    CHECK(config.get("assembly") == "mm10");
  }

  SECTION("empty values") {
    const auto config = parse("matrices=\n");
    CHECK(config.contains("matrices"));
    CHECK_FALSE(config.has_value("matrices"));
  }

  SECTION("unknown keys are preserved") {
    const auto config = parse("myPrefix=/data\n");
    CHECK(config.get("myPrefix") == "/data");
  }

  SECTION("reading keys back") {
    const std::vector<std::pair<std::string, std::string>> pairs{
        {"reference", "ref.bed"},        {"db", "db.txt"},
        {"anchor", "a.bed"},             {"outDirectory", "/tmp/out"},
        {"correlationThreshold", "0.7"}, {"pValueThreshold", "0.05"},
        {"correlationMethod", "pearson"}};
    std::string content{};
    for (const auto &[k, v] : pairs) {
      content += k + "=" + v + "\n";
    }
    const auto config = parse(content);
    CHECK(config.size() == pairs.size());
    for (const auto &[k, v] : pairs) {
      CHECK(config.get(k) == v);
    }
  }
}

TEST_CASE("ConfigLoader: variable expansion", "[short][config]") {
  SECTION("earlier keys") {
    const auto config = parse(
        "base=/data/project\n"
        "anchor=$base/anchors.bed\n"
        "outDirectory=${base}/out\n");
    CHECK(config.get("anchor") == "/data/project/anchors.bed");
    CHECK(config.get("outDirectory") == "/data/project/out");
  }

  SECTION("later keys are not visible") {
    const auto config = parse(
        "anchor=$base/anchors.bed\n"
        "base=/data/project\n");
    CHECK(config.get("anchor") == "/anchors.bed");
  }

  SECTION("environment variables") {
    // NOLINTNEXTLINE(*-mt-unsafe)
    REQUIRE(setenv("DHSLINK_TEST_VARIABLE", "/scratch", 1) == 0);
    const auto config = parse("outDirectory=${DHSLINK_TEST_VARIABLE}/out\n");
    CHECK(config.get("outDirectory") == "/scratch/out");
  }

  SECTION("undefined variables") {
    const auto config = parse("outDirectory=$DHSLINK_UNDEFINED_VARIABLE/out\n");
    CHECK(config.get("outDirectory") == "/out");
  }

  SECTION("default values") {
    const auto config = parse(
        "base=/data\n"
        "a=${DHSLINK_UNDEFINED_VARIABLE:-fallback}\n"
        "b=${base:-fallback}\n"
        "c=${DHSLINK_UNDEFINED_VARIABLE:-$base/x}\n");
    CHECK(config.get("a") == "fallback");
    CHECK(config.get("b") == "/data");
    CHECK(config.get("c") == "/data/x");
  }

  SECTION("nested default values") {
    const auto config = parse(
        "base=/data\n"
        "a=${DHSLINK_UNDEFINED_VARIABLE:-${base}}/x\n"
        "b=${DHSLINK_UNDEFINED_VARIABLE:-${DHSLINK_UNDEFINED_VARIABLE:-${base}/y}}\n");
    CHECK(config.get("a") == "/data/x");
    CHECK(config.get("b") == "/data/y");
    CHECK_THROWS_AS(parse("a=${DHSLINK_UNDEFINED_VARIABLE:-${base}\n"), ValidationError);
  }

  SECTION("quotes") {
    const auto config = parse(
        "base=/data\n"
        "a=\"$base/with spaces\"\n"
        "b='$base/literal'\n");
    CHECK(config.get("a") == "/data/with spaces");
    CHECK(config.get("b") == "$base/literal");
  }

  SECTION("escapes") {
    const auto config = parse("a=\\$HOME\nb=x\\\\y\nc=a\\=b\n");
    CHECK(config.get("a") == "$HOME");
    CHECK(config.get("b") == "x\\y");
    CHECK(config.get("c") == "a=b");
  }

  SECTION("tilde") {
    // NOLINTNEXTLINE(*-mt-unsafe)
    REQUIRE(setenv("HOME", "/home/dhslink", 1) == 0);
    const auto config = parse("a=~/data\nb=~user/data\nc=/x/~/y\n");
    CHECK(config.get("a") == "/home/dhslink/data");
    CHECK(config.get("b") == "~user/data");
    CHECK(config.get("c") == "/x/~/y");
  }

  SECTION("command substitution is not performed") {
    const auto config = parse("a=$(rm -rf /tmp/x)\nb=`whoami`\n");
    CHECK(config.get("a") == "$(rm -rf /tmp/x)");
    CHECK(config.get("b") == "`whoami`");
  }

  SECTION("bad substitutions") {
    CHECK_THROWS_AS(parse("a=${unterminated\n"), ValidationError);
    CHECK_THROWS_WITH(parse("\n\na=${1abc}\n"),
                      Catch::Matchers::ContainsSubstring("invalid configuration at line 3"));
  }
}

TEST_CASE("ConfigLoader: module directives", "[short][config]") {
  SECTION("valid") {
    const auto config = parse(
        "module load R/4.2.1 bedtools\n"
        "anchor=anchors.bed\n"
        "  module load python3\n");
    CHECK(config.size() == 1);
    CHECK_FALSE(config.contains("module load R/4.2.1 bedtools"));
    REQUIRE(config.module_directives().size() == 2);
    CHECK(config.module_directives()[0] == std::vector<std::string>{"R/4.2.1", "bedtools"});
    CHECK(config.module_directives()[1] == std::vector<std::string>{"python3"});
  }

  SECTION("commented") {
    const auto config = parse("# module load R\n");
    CHECK(config.module_directives().empty());
  }

  SECTION("invalid module names") {
    CHECK_THROWS_WITH(parse("module load R; rm -rf /\n"),
                      Catch::Matchers::ContainsSubstring("invalid module name"));
    CHECK_THROWS_WITH(parse("module load $(whoami)\n"),
                      Catch::Matchers::ContainsSubstring("invalid module name"));
    CHECK_THROWS_AS(parse("module load\n"), ValidationError);
  }
}

TEST_CASE("ConfigLoader: files", "[short][config]") {
  const auto dir = testdir() / "config_loader";

  SECTION("valid file") {
    const auto path = write_file(dir / "config.txt", "anchor=anchors.bed\noutDirectory=out\n");
    const auto config = load_config(path);
    CHECK(config.path() == path);
    CHECK(config.get("anchor") == "anchors.bed");
  }

  SECTION("missing file") {
    const auto path = dir / "missing.txt";
    CHECK_THROWS_AS(load_config(path), MissingFileError);
    CHECK_THROWS_WITH(load_config(path), Catch::Matchers::ContainsSubstring("missing.txt"));
  }

  SECTION("errors mention the file name") {
    const auto path = write_file(dir / "bad_config.txt", "module load a|b\n");
    CHECK_THROWS_WITH(load_config(path),
                      Catch::Matchers::ContainsSubstring("line 1 of file") &&
                          Catch::Matchers::ContainsSubstring("bad_config.txt"));
  }
}

TEST_CASE("ConfigLoader: internal helpers", "[short][config]") {
  CHECK(internal::find_unescaped("a=b", '=') == 1);
  CHECK(internal::find_unescaped("a\\=b=c", '=') == 4);
  CHECK(internal::find_unescaped("abc", '=') == std::string_view::npos);

  CHECK(internal::is_module_directive("module load R"));
  CHECK_FALSE(internal::is_module_directive("module=R"));
}
// NOLINTEND(*-avoid-magic-numbers,readability-function-cognitive-complexity)

}  // namespace dhslink::test
