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
#include <memory>
#include <string>
#include <vector>

#include "dhslink/config_store.hpp"

namespace dhslink {

struct Command {
  std::filesystem::path exec{};
  std::vector<std::string> args{};

  // Printable command line, with arguments quoted when necessary
  [[nodiscard]] std::string to_string() const;
};

class ProcessContext;

// Launches external programs and waits for them to return.
// When the configuration requested environment modules, programs are started through
//   bash -l -c 'module load <name>... && exec "$0" "$@"' <program> <args>...
// so that only the validated module names ever end up in the shell script.
class ProcessLauncher {
  std::vector<ConfigStore::ModuleDirective> _module_directives{};
  std::size_t _max_spawn_attempts{10};
  std::unique_ptr<ProcessContext> _ctx;

 public:
  explicit ProcessLauncher(std::vector<ConfigStore::ModuleDirective> module_directives = {},
                           std::size_t max_spawn_attempts = 10);

  ProcessLauncher(const ProcessLauncher &other) = delete;
  ProcessLauncher(ProcessLauncher &&other) noexcept;

  ~ProcessLauncher() noexcept;

  ProcessLauncher &operator=(const ProcessLauncher &other) = delete;
  ProcessLauncher &operator=(ProcessLauncher &&other) noexcept;

  [[nodiscard]] bool uses_environment_modules() const noexcept;

  // Look up program in PATH unless it is a path already.
  // Resolution is deferred to the shell when environment modules are in use, as loading modules
  // usually changes PATH.
  [[nodiscard]] std::filesystem::path resolve(const std::filesystem::path &program) const;

  [[nodiscard]] Command make_command(const std::filesystem::path &program,
                                     std::vector<std::string> args) const;

  // Run cmd to completion and return its exit code. stdout and stderr are appended to log_file
  [[nodiscard]] int run(const Command &cmd, const std::filesystem::path &log_file);

 private:
  [[nodiscard]] std::string generate_module_script() const;
};

}  // namespace dhslink
