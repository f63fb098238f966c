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

#include "dhslink/process.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fmt/std.h>
#include <parallel_hashmap/btree.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/io_context.hpp>
#include <cassert>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <iterator>
#include <memory>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

// clang-format off
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/stdio.hpp>
// clang-format on

namespace dhslink {

namespace bp = boost::process::v2;

class ProcessContext {
  using LockedContext = std::pair<std::unique_lock<std::mutex>, boost::asio::io_context *>;
  boost::asio::io_context _ctx;
  std::mutex _mtx;

 public:
  ProcessContext() = default;
  [[nodiscard]] LockedContext operator()() { return {std::unique_lock{_mtx}, &_ctx}; }
};

[[nodiscard]] static bool needs_quoting(std::string_view arg) {
  if (arg.empty()) {
    return true;
  }
  return std::ranges::any_of(arg, [](const char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\'' || c == '"' || c == '$' || c == '\\' ||
           c == '`' || c == '&' || c == ';' || c == '|' || c == '(' || c == ')' || c == '*';
  });
}

[[nodiscard]] static std::string quote(std::string_view arg) {
  if (!needs_quoting(arg)) {
    return std::string{arg};
  }

  std::string buff{"'"};
  for (const auto c : arg) {
    if (c == '\'') {
      buff.append("'\\''");
    } else {
      buff.push_back(c);
    }
  }
  buff.push_back('\'');
  return buff;
}

std::string Command::to_string() const {
  std::vector<std::string> tokens{};
  tokens.reserve(args.size() + 1);
  tokens.emplace_back(quote(exec.string()));
  std::ranges::transform(args, std::back_inserter(tokens),
                         [](const auto &arg) { return quote(arg); });
  return fmt::to_string(fmt::join(tokens, " "));
}

ProcessLauncher::ProcessLauncher(std::vector<ConfigStore::ModuleDirective> module_directives,
                                 std::size_t max_spawn_attempts)
    : _module_directives(std::move(module_directives)),
      _max_spawn_attempts(std::max(max_spawn_attempts, 1UZ)),
      _ctx(std::make_unique<ProcessContext>()) {
  std::erase_if(_module_directives, [](const auto &directive) { return directive.empty(); });
}

ProcessLauncher::ProcessLauncher(ProcessLauncher &&other) noexcept = default;

ProcessLauncher::~ProcessLauncher() noexcept = default;

ProcessLauncher &ProcessLauncher::operator=(ProcessLauncher &&other) noexcept = default;

bool ProcessLauncher::uses_environment_modules() const noexcept {
  return !_module_directives.empty();
}

[[nodiscard]] static std::filesystem::path find_executable(const std::filesystem::path &program) {
  if (program.empty()) {
    throw std::runtime_error("program name cannot be empty");
  }

  if (program.has_parent_path()) {
    if (!std::filesystem::exists(program)) {
      throw std::runtime_error(fmt::format("unable to find program {}", program));
    }
    return program;
  }

  auto path = bp::environment::find_executable(program.string());
  if (path.empty()) {
    throw std::runtime_error(fmt::format("unable to find program {} in PATH", program));
  }
  return path;
}

std::filesystem::path ProcessLauncher::resolve(const std::filesystem::path &program) const {
  if (uses_environment_modules() && !program.has_parent_path()) {
    if (program.empty()) {
      throw std::runtime_error("program name cannot be empty");
    }
    SPDLOG_DEBUG("deferring lookup of {} until modules have been loaded", program);
    return program;
  }
  auto path = find_executable(program);
  SPDLOG_DEBUG("program {} resolved to {}", program, path);
  return path;
}

std::string ProcessLauncher::generate_module_script() const {
  assert(uses_environment_modules());
  std::vector<std::string> statements{};
  statements.reserve(_module_directives.size() + 1);
  for (const auto &directive : _module_directives) {
    statements.emplace_back(fmt::format("module load {}", fmt::join(directive, " ")));
  }
  statements.emplace_back(R"(exec "$0" "$@")");
  return fmt::to_string(fmt::join(statements, " && "));
}

Command ProcessLauncher::make_command(const std::filesystem::path &program,
                                      std::vector<std::string> args) const {
  if (!uses_environment_modules()) {
    return {.exec = program, .args = std::move(args)};
  }

  std::vector<std::string> wrapped_args{"-l", "-c", generate_module_script(), program.string()};
  wrapped_args.reserve(wrapped_args.size() + args.size());
  std::ranges::move(args, std::back_inserter(wrapped_args));

  return {.exec = find_executable("bash"), .args = std::move(wrapped_args)};
}

[[nodiscard]] static std::chrono::milliseconds generate_random_sleep_time_ms(
    double target_sleep_ms, double stddev = 1.0, double min = 100.0, double max = 10'000.0) {
  assert(target_sleep_ms > 0);
  assert(max >= min);
  assert(stddev >= 0);
  std::random_device rd{};
  std::mt19937 rand_eng{rd()};
  const auto sleep_time_ms =
      std::clamp(std::normal_distribution{target_sleep_ms, stddev}(rand_eng), min, max);
  return std::chrono::milliseconds{static_cast<int>(sleep_time_ms)};
}

[[nodiscard]] static bp::process spawn_process(ProcessContext &ctx, const Command &cmd,
                                               std::FILE *log_fp, std::size_t max_attempts) {
  phmap::btree_set<std::string> errors{};
  double mean_sleep_time = 250;

  for (std::size_t attempt = 0; attempt < max_attempts; ++attempt) {
    try {
      const auto [lck, asio_ctx] = ctx();
      bp::process proc(*asio_ctx, cmd.exec, cmd.args,
                       bp::process_stdio{.in = nullptr, .out = log_fp, .err = log_fp});
      if (proc.running() || proc.exit_code() == 0) {
        SPDLOG_DEBUG("spawned process {}: {}", proc.id(), cmd.to_string());
        return proc;
      }
      SPDLOG_WARN("spawning process {} failed (attempt {}/{})...", proc.id(), attempt + 1,
                  max_attempts);
      proc.terminate();
    } catch (const std::exception &e) {
      SPDLOG_WARN("spawning process failed (attempt {}/{}): {}", attempt + 1, max_attempts,
                  e.what());
      errors.emplace(e.what());
    }

    if (attempt + 1 == max_attempts) {
      break;
    }

    const auto sleep_time = generate_random_sleep_time_ms(mean_sleep_time);
    SPDLOG_DEBUG("sleeping {} before attempting to spawn process one more time...", sleep_time);
    std::this_thread::sleep_for(sleep_time);
    mean_sleep_time *= 1.5;
  }

  if (errors.empty()) {
    throw std::runtime_error(fmt::format("failed to spawn process: {}", cmd.to_string()));
  }
  if (errors.size() == 1) {
    throw std::runtime_error(
        fmt::format("failed to spawn process: {}: {}", cmd.to_string(), *errors.begin()));
  }
  throw std::runtime_error(
      fmt::format("failed to spawn process: {}\n"
                  "Exception(s):\n - {}",
                  cmd.to_string(), fmt::join(errors, "\n - ")));
}

int ProcessLauncher::run(const Command &cmd, const std::filesystem::path &log_file) {
  assert(_ctx);
  std::unique_ptr<std::FILE, decltype(&std::fclose)> log_fp{
      std::fopen(log_file.string().c_str(), "a"), &std::fclose};
  if (!log_fp) {
    throw std::runtime_error(fmt::format("failed to open log file {}", log_file));
  }

  auto proc = spawn_process(*_ctx, cmd, log_fp.get(), _max_spawn_attempts);
  try {
    proc.wait();
  } catch (const std::exception &e) {
    const std::string_view msg{e.what()};
    // Deal with processes that terminated almost instantaneously
    if (msg.find("wait failed: No child processes") == std::string_view::npos) {
      throw;
    }
  }

  SPDLOG_DEBUG("process {} returned with exit code {}", proc.id(), proc.exit_code());
  return proc.exit_code();
}

}  // namespace dhslink
