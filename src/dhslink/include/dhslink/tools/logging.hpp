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

#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/sink.h>

#include <filesystem>
#include <memory>

namespace dhslink {

// Copy the messages sent to the default logger to a file for as long as the object is alive.
// The file is truncated if it already exists.
class ScopedLogFile {
  std::filesystem::path _path{};
  std::shared_ptr<spdlog::logger> _logger{};
  std::shared_ptr<spdlog::sinks::sink> _sink{};

 public:
  ScopedLogFile(std::filesystem::path path, spdlog::level::level_enum level);

  ScopedLogFile(const ScopedLogFile &other) = delete;
  ScopedLogFile(ScopedLogFile &&other) noexcept = delete;

  ~ScopedLogFile() noexcept;

  ScopedLogFile &operator=(const ScopedLogFile &other) = delete;
  ScopedLogFile &operator=(ScopedLogFile &&other) noexcept = delete;

  [[nodiscard]] const std::filesystem::path &path() const noexcept;
  [[nodiscard]] spdlog::level::level_enum level() const noexcept;
};

}  // namespace dhslink
