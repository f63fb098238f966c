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

#include "dhslink/run_report.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <glaze/json.hpp>
#include <ios>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "dhslink/version.hpp"

namespace dhslink {

RunReport::RunReport(const std::filesystem::path &config, std::string_view input_mode,
                     std::size_t num_samples)
    : _created_by(config::version::str_long()),
      _creation_time(current_time()),
      _config(config.string()),
      _input_mode(input_mode),
      _num_samples(num_samples) {}

RunReport RunReport::from_file(const std::filesystem::path &path) {
  RunReport report{};
  std::string buffer{};
  if (const auto ec = glz::read_file_json(report, path.string(), buffer); ec) {
    throw std::runtime_error(fmt::format("failed to parse report file {}: {}", path,
                                         glz::format_error(ec, buffer)));
  }
  return report;
}

void RunReport::add_unit(UnitRecord record) {
  if (record.status != "succeeded") {
    ++_num_failures;
  }
  _units.emplace_back(std::move(record));
}

void RunReport::set_aggregation_status(std::string_view status) { _aggregation = status; }

void RunReport::write(const std::filesystem::path &path) const {
  const auto json = glz::write_json(*this);
  if (!json) {
    throw std::runtime_error(
        fmt::format("failed to serialize report: {}", glz::format_error(json.error())));
  }

  const auto payload = glz::prettify_json(*json);

  std::ofstream ofs{};
  ofs.exceptions(ofs.exceptions() | std::ios::badbit | std::ios::failbit);
  ofs.open(path, std::ios::trunc);
  ofs.write(payload.data(), static_cast<std::streamsize>(payload.size()));
  SPDLOG_DEBUG("report written to {}", path);
}

std::string_view RunReport::format_version() const noexcept { return _format_version; }
std::string_view RunReport::created_by() const noexcept { return _created_by; }
std::string_view RunReport::creation_time() const noexcept { return _creation_time; }
std::string_view RunReport::config() const noexcept { return _config; }
std::string_view RunReport::input_mode() const noexcept { return _input_mode; }
std::size_t RunReport::num_samples() const noexcept { return _num_samples; }
std::size_t RunReport::num_failures() const noexcept { return _num_failures; }
std::string_view RunReport::aggregation_status() const noexcept { return _aggregation; }
auto RunReport::units() const noexcept -> const std::vector<UnitRecord> & { return _units; }

std::string RunReport::current_time() {
  const auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
  return fmt::format("{:%FT%T}", now);
}

}  // namespace dhslink
