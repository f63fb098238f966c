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

#include <CLI/CLI.hpp>
#include <string>
#include <string_view>
#include <vector>

#include "dhslink/tools/config.hpp"

namespace dhslink {

class Cli {
 public:
  Cli(int argc, char** argv);
  [[nodiscard]] auto parse_arguments() -> DispatchConfig;
  [[nodiscard]] int exit(const CLI::ParseError& e) const;
  [[nodiscard]] int exit() const noexcept;
  // Returns false when parsing stopped early, e.g. because help or version were requested
  [[nodiscard]] bool ready() const noexcept;
  void log_warnings() const noexcept;

 private:
  int _argc;
  char** _argv;
  std::string _exec_name;
  int _exit_code{1};
  bool _ready{false};
  DispatchConfig _config{};
  CLI::App _cli{};
  mutable std::vector<std::string> _warnings{};
  std::string_view _help_flag{};

  void make_cli();
  void validate_args() const;
  void transform_args();

  [[nodiscard]] bool handle_help_flags();
};

}  // namespace dhslink
