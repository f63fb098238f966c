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

#include <cstddef>
#include <filesystem>
#include <glaze/glaze.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace dhslink {

// Summary of one dhslink invocation, serialized as JSON next to the analysis output
class RunReport {
 public:
  struct UnitRecord {
    std::string sample{};
    std::string output_dir{};
    std::string command{};
    std::string status{};
    int exit_code{-1};
    std::string error{};
    double elapsed_seconds{};

    bool operator==(const UnitRecord &other) const noexcept = default;

    struct glaze {
      using T = UnitRecord;
      // clang-format off
      static constexpr auto value =
          glz::object(
            "sample", &T::sample,
            "output-dir", &T::output_dir,
            "command", &T::command,
            "status", &T::status,
            "exit-code", &T::exit_code,
            "error", &T::error,
            "elapsed-seconds", &T::elapsed_seconds
          );
      // clang-format on
    };
  };

 private:
  std::string _format{"DHSLink dispatch report"};
  std::string _format_version{"1.0"};
  std::string _created_by{};
  std::string _creation_time{};
  std::string _config{};
  std::string _input_mode{};
  std::size_t _num_samples{};
  std::size_t _num_failures{};
  std::string _aggregation{"skipped"};
  std::vector<UnitRecord> _units{};

 public:
  RunReport() = default;
  RunReport(const std::filesystem::path &config, std::string_view input_mode,
            std::size_t num_samples);

  [[nodiscard]] static RunReport from_file(const std::filesystem::path &path);

  void add_unit(UnitRecord record);
  void set_aggregation_status(std::string_view status);
  void write(const std::filesystem::path &path) const;

  [[nodiscard]] std::string_view format_version() const noexcept;
  [[nodiscard]] std::string_view created_by() const noexcept;
  [[nodiscard]] std::string_view creation_time() const noexcept;
  [[nodiscard]] std::string_view config() const noexcept;
  [[nodiscard]] std::string_view input_mode() const noexcept;
  [[nodiscard]] std::size_t num_samples() const noexcept;
  [[nodiscard]] std::size_t num_failures() const noexcept;
  [[nodiscard]] std::string_view aggregation_status() const noexcept;
  [[nodiscard]] const std::vector<UnitRecord> &units() const noexcept;

  struct glaze {
    friend class RunReport;
    using T = RunReport;
    // clang-format off
    static constexpr auto value =
        glz::object(
          "format", &T::_format,
          "format-version", &T::_format_version,
          "created-by", &T::_created_by,
          "creation-time", &T::_creation_time,
          "config", &T::_config,
          "input-mode", &T::_input_mode,
          "num-samples", &T::_num_samples,
          "num-failures", &T::_num_failures,
          "aggregation", &T::_aggregation,
          "units", &T::_units
        );
    // clang-format on
  };

 private:
  [[nodiscard]] static std::string current_time();
};

}  // namespace dhslink
