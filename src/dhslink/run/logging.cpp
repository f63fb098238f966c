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

#include "dhslink/tools/logging.hpp"

#include <fmt/format.h>
#include <fmt/std.h>
#include <spdlog/details/log_msg.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include "dhslink/version.hpp"

namespace dhslink {

ScopedLogFile::ScopedLogFile(std::filesystem::path path, spdlog::level::level_enum level)
    : _path(std::move(path)), _logger(spdlog::default_logger()) {
  if (!_logger) {
    throw std::runtime_error("the default logger has not been initialized");
  }

  if (_path.has_parent_path()) {
    std::filesystem::create_directories(_path.parent_path());  // NOLINT
  }

  auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(_path.string(), true);
  sink->set_pattern("[%Y-%m-%d %T.%e] [%l]: %v");
  sink->set_level(level);
  sink->log(spdlog::details::log_msg{
      "dhslink", spdlog::level::info,
      fmt::format("{}: recording messages with level {} or higher", config::version::str_long(),
                  spdlog::level::to_string_view(level))});

  if (_logger->level() > level) {
    _logger->set_level(level);
  }
  _logger->sinks().push_back(sink);
  _sink = std::move(sink);
}

ScopedLogFile::~ScopedLogFile() noexcept { std::erase(_logger->sinks(), _sink); }

const std::filesystem::path &ScopedLogFile::path() const noexcept { return _path; }

spdlog::level::level_enum ScopedLogFile::level() const noexcept { return _sink->level(); }

}  // namespace dhslink
