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

#include "dhslink/tools/cli.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>
#include <algorithm>
#include <cassert>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "dhslink/config_store.hpp"
#include "dhslink/tools/config.hpp"
#include "dhslink/version.hpp"

namespace dhslink {

Cli::Cli(int argc, char **argv) : _argc(argc), _argv(argv), _exec_name(*argv) { make_cli(); }

auto Cli::parse_arguments() -> DispatchConfig {
  try {
    _cli.name(_exec_name);
    if (handle_help_flags()) {
      return _config;
    }
    _cli.parse(_argc, _argv);
  } catch (const CLI::ParseError &e) {
    //  This takes care of formatting and printing error messages (if any)
    _exit_code = _cli.exit(e);
    return _config;
  } catch (const std::exception &e) {
    _exit_code = 1;
    throw std::runtime_error(
        fmt::format("An unexpected error has occurred while parsing "
                    "CLI arguments: {}. If you see this "
                    "message, please file an issue on GitHub",
                    e.what()));

  } catch (...) {
    _exit_code = 1;
    throw std::runtime_error(
        "An unknown error occurred while parsing CLI "
        "arguments! If you see this message, please "
        "file an issue on GitHub");
  }
  validate_args();
  transform_args();

  _exit_code = 0;
  _ready = true;
  return _config;
}

int Cli::exit(const CLI::ParseError &e) const { return _cli.exit(e); }
int Cli::exit() const noexcept { return _exit_code; }
bool Cli::ready() const noexcept { return _ready; }

void Cli::log_warnings() const noexcept {
  for (const auto &w : _warnings) {
    SPDLOG_WARN("{}", w);
  }
  _warnings.clear();
}

void Cli::make_cli() {
  _cli.name(_exec_name);
  _cli.description(
      "DHSLink: run the single-sample DHS linkage analysis over one sample or a list of samples.");
  _cli.set_version_flag("-V,--version", std::string{config::version::str_long()});
  _cli.footer(format_config_options_help());

  auto &c = _config;

  // clang-format off
  _cli.add_option(
    "config",
    c.path_to_config,
    "Path to the configuration file with one key=value pair per line.")
    ->required();
  _cli.add_option(
    "--analysis-program",
    c.analysis_program,
    "Name of or path to the program used to analyze individual samples.")
    ->capture_default_str();
  _cli.add_option(
    "--merge-program",
    c.merge_program,
    "Name of or path to the program used to merge the tracks generated for each sample.")
    ->capture_default_str();
  _cli.add_option(
    "-t,--threads",
    c.threads,
    "Maximum number of samples to be processed concurrently.\n"
    "Defaults to the number of available CPU cores.")
    ->check(CLI::PositiveNumber);
  _cli.add_flag(
    "--print-config",
    c.print_config,
    "Print the configuration after applying defaults and exit.")
    ->capture_default_str();
  _cli.add_flag_function(
    "--no-report",
    [&c](auto n) { if (n != 0) { c.write_report = false; } },
    "Do not write the JSON report summarizing the outcome of each analysis.");
  _cli.add_option(
    "-v,--verbosity",
    c.verbosity,
    "Set verbosity of output to the console.")
    ->check(CLI::Range(1, 4))
    ->capture_default_str();
  // clang-format on
}

void Cli::validate_args() const {
  const auto max_threads = std::thread::hardware_concurrency();
  if (max_threads != 0 && _config.threads > max_threads) {
    _warnings.emplace_back(
        fmt::format("number of threads specified through --threads exceeds the number of "
                    "available CPU cores ({} > {})",
                    _config.threads, max_threads));
  }

  std::vector<std::string> errors;
  if (_config.analysis_program.empty()) {
    errors.emplace_back("--analysis-program cannot be empty");
  }
  if (_config.merge_program.empty()) {
    errors.emplace_back("--merge-program cannot be empty");
  }

  if (!errors.empty()) {
    throw std::runtime_error(
        fmt::format("the following error(s) where encountered while validating CLI "
                    "arguments:\n - {}",
                    fmt::join(errors, "\n - ")));
  }
}

void Cli::transform_args() {
  auto &c = _config;
  if (c.threads == 0) {
    c.threads = std::max(1U, std::thread::hardware_concurrency());
  }

  // in spdlog, high numbers correspond to low log levels
  assert(c.verbosity > 0 && c.verbosity <= SPDLOG_LEVEL_CRITICAL);
  c.verbosity = static_cast<std::uint8_t>(spdlog::level::critical) - c.verbosity;
}

// CLI11 does not accept multi-character flags with a single dash
bool Cli::handle_help_flags() {
  for (int i = 1; i < _argc; ++i) {
    if (std::string_view{_argv[i]} == "-help") {  // NOLINT(*-pointer-arithmetic)
      _help_flag = "-help";
      break;
    }
  }

  if (_help_flag.empty()) {
    return false;
  }

  fmt::print("{}", _cli.help());
  _exit_code = 1;
  return true;
}

}  // namespace dhslink
