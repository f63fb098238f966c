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

#include <fmt/format.h>
#include <spdlog/sinks/callback_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdio>
#include <deque>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <new>
#include <string>
#include <utility>

#include "dhslink/tools/cli.hpp"
#include "dhslink/tools/config.hpp"
#include "dhslink/tools/tools.hpp"
#include "dhslink/version.hpp"

using namespace dhslink;

// Installs the default logger (stderr) for the lifetime of the object.
// Warnings are also buffered and printed once more when the logger is destroyed, so that they are
// not lost among the messages of long runs.
class GlobalLogger {
  //                                   [2021-08-12 17:49:34.581] [info]: my log msg
  static constexpr auto *_msg_pattern{"[%Y-%m-%d %T.%e] %^[%l]%$: %v"};
  static constexpr std::size_t _max_buffered_warnings{256};

  struct Warning {
    spdlog::level::level_enum level{spdlog::level::warn};
    std::string msg{};
  };

  std::mutex _mtx;
  std::deque<Warning> _warnings{};
  std::size_t _num_warnings{};
  bool _ok{false};
  bool _replay{true};

  [[nodiscard]] static auto make_stderr_sink(spdlog::level::level_enum level) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_pattern(_msg_pattern);
    sink->set_level(level);
    return sink;
  }

  void buffer_warning(const spdlog::details::log_msg &msg) noexcept {
    try {
      [[maybe_unused]] const std::scoped_lock lck(_mtx);
      ++_num_warnings;
      if (_warnings.size() == _max_buffered_warnings) {
        _warnings.pop_front();
      }
      _warnings.emplace_back(msg.level, std::string{msg.payload.begin(), msg.payload.end()});
    } catch (const std::exception &) {  // NOLINT(*-empty-catch)
      // the warning has already been printed by the stderr sink
    }
  }

  void replay_warnings() {
    [[maybe_unused]] const std::scoped_lock lck(_mtx);
    if (_warnings.empty()) {
      return;
    }

    spdlog::logger logger{"replay_logger", make_stderr_sink(spdlog::level::warn)};
    logger.set_level(spdlog::level::warn);
    if (_num_warnings == _warnings.size()) {
      logger.warn("DHSLink raised {} warning(s):", _num_warnings);
    } else {
      logger.warn("DHSLink raised {} warnings, showing the last {}:", _num_warnings,
                  _warnings.size());
    }
    for (const auto &w : _warnings) {
      logger.log(w.level, w.msg);
    }
    _warnings.clear();
  }

 public:
  GlobalLogger() noexcept {
    try {
      auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>(
          [this](const spdlog::details::log_msg &msg) noexcept { buffer_warning(msg); });
      callback_sink->set_level(spdlog::level::warn);

      spdlog::set_default_logger(std::make_shared<spdlog::logger>(
          "main_logger", spdlog::sinks_init_list{make_stderr_sink(spdlog::level::level_enum{
                                                     SPDLOG_ACTIVE_LEVEL}),
                                                 std::move(callback_sink)}));
      _ok = true;
    } catch (const std::exception &e) {
      std::fprintf(stderr, "FAILURE! Failed to setup DHSLink's logger: %s\n", e.what());
    }
  }

  GlobalLogger(const GlobalLogger &other) = delete;
  GlobalLogger &operator=(const GlobalLogger &other) = delete;

  ~GlobalLogger() noexcept {
    try {
      if (_ok && _replay) {
        replay_warnings();
      }
      // the callback sink refers to this object
      spdlog::set_default_logger(std::make_shared<spdlog::logger>(
          "main_logger", make_stderr_sink(spdlog::level::level_enum{SPDLOG_ACTIVE_LEVEL})));
    } catch (const std::exception &e) {
      std::fprintf(stderr, "FAILURE! Failed to shut down DHSLink's logger: %s\n", e.what());
    }
  }

  [[nodiscard]] bool ok() const noexcept { return _ok; }

  // Apply the verbosity requested on the command line.
  // Sinks never become more verbose than the level they were created with.
  void set_level(const DispatchConfig &c) {
    if (!_ok) {
      return;
    }
    const spdlog::level::level_enum level{c.verbosity};
    auto logger = spdlog::default_logger();
    for (auto &sink : logger->sinks()) {
      sink->set_level(std::max(sink->level(), level));
    }
    logger->set_level(level);

    if (!c.print_config) {
      SPDLOG_INFO("Running {}", config::version::str_long());
    }
  }

  // Used when the command line was not parsed to completion (e.g. --help)
  void skip_replay() noexcept { _replay = false; }
};

// NOLINTNEXTLINE(bugprone-exception-escape)
int main(int argc, char **argv) noexcept {
  std::unique_ptr<Cli> cli{nullptr};

  try {
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    GlobalLogger logger{};
    cli = std::make_unique<Cli>(argc, argv);
    const auto config = cli->parse_arguments();
    if (!cli->ready()) {
      logger.skip_replay();
      return cli->exit();
    }

    logger.set_level(config);
    cli->log_warnings();

    return run_command_checked(config);

  } catch (const CLI::ParseError &e) {
    assert(cli);
    return cli->exit(e);  //  This takes care of formatting and printing error
                          //  messages (if any)
  } catch (const std::filesystem::filesystem_error &e) {
    SPDLOG_CRITICAL("FAILURE! {}", e.what());
    return 1;
  } catch (const std::bad_alloc &err) {
    SPDLOG_CRITICAL("FAILURE! Unable to allocate enough memory: {}", err.what());
    return 1;
  } catch (const spdlog::spdlog_ex &e) {
    fmt::print(stderr, "FAILURE! DHSLink encountered the following error while logging: {}\n",
               e.what());
    return 1;
  } catch (const std::exception &e) {
    SPDLOG_CRITICAL("FAILURE! DHSLink encountered the following error: {}", e.what());
    return 1;
  } catch (...) {
    SPDLOG_CRITICAL(
        "FAILURE! DHSLink encountered the following error: caught an unhandled exception!\n"
        "If you see this message, please file an issue on GitHub.");
    return 1;
  }
}
