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

#include "dhslink/dispatcher.hpp"

#include <fmt/format.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include <BS_thread_pool.hpp>
#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "dhslink/common.hpp"

namespace dhslink {

bool AnalysisInvocation::multi_sample() const noexcept { return ordinal.has_value(); }

std::vector<std::string> AnalysisInvocation::args() const {
  if (!multi_sample()) {
    return {config_path.string()};
  }

  assert(total_samples.has_value());
  assert(!input_flag.empty());
  return {config_path.string(),
          input_flag,
          input_path,
          "-out",
          output_dir.string(),
          "-sample",
          sample_name,
          "-track",
          fmt::to_string(*ordinal),
          "-numSamples",
          fmt::to_string(*total_samples)};
}

std::string_view to_string(UnitOutcome::Status status) noexcept {
  using Status = UnitOutcome::Status;
  switch (status) {
    case Status::SUCCEEDED:
      return "succeeded";
    case Status::FAILED:
      return "failed";
    case Status::SKIPPED:
      return "skipped";
  }
  return "unknown";
}

AnalysisInvocation make_analysis_invocation(const ResolvedConfig &c, const SampleSpec &sample) {
  if (!c.multi_sample()) {
    return {.config_path = c.config.path(), .output_dir = c.output_directory()};
  }

  return {.config_path = c.config.path(),
          .input_flag = std::string{input_flag(c.mode)},
          .input_path = sample.input_path,
          .output_dir = c.output_directory() / sample.sample_name,
          .sample_name = sample.sample_name,
          .ordinal = sample.ordinal,
          .total_samples = sample.total_samples};
}

std::filesystem::path generate_unit_log_file_name(const AnalysisInvocation &invocation) {
  if (!invocation.multi_sample()) {
    return invocation.output_dir / "analysis.log";
  }
  const auto name = std::filesystem::path{invocation.sample_name}.filename();
  return invocation.output_dir / fmt::format("{}.log", name.string());
}

[[nodiscard]] static std::string unit_label(const AnalysisInvocation &invocation) {
  if (!invocation.multi_sample()) {
    return "single-sample";
  }
  return fmt::format("{} ({}/{})", invocation.sample_name, *invocation.ordinal,
                     *invocation.total_samples);
}

[[nodiscard]] static UnitOutcome worker_fx(const SampleSpec &sample,
                                           const AnalysisInvocation &invocation,
                                           const std::filesystem::path &program,
                                           ProcessLauncher &launcher) {
  UnitOutcome outcome{.sample_name = invocation.sample_name, .output_dir = invocation.output_dir};
  const auto label = unit_label(invocation);

  if (sample.malformed()) {
    outcome.status = UnitOutcome::Status::SKIPPED;
    outcome.output_dir.clear();
    outcome.error = sample.error->what();
    SPDLOG_WARN("[{}]: skipping sample: {}", label, outcome.error);
    return outcome;
  }

  const auto t0 = std::chrono::steady_clock::now();
  try {
    const auto cmd = launcher.make_command(program, invocation.args());
    outcome.command = cmd.to_string();

    std::filesystem::create_directories(invocation.output_dir);
    SPDLOG_INFO("[{}]: launching {}", label, outcome.command);
    outcome.exit_code = launcher.run(cmd, generate_unit_log_file_name(invocation));

    const auto t1 = std::chrono::steady_clock::now();
    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0);

    if (outcome.exit_code != 0) {
      outcome.error = fmt::format("analysis terminated with exit code {}", outcome.exit_code);
      SPDLOG_WARN("[{}]: {} (see {} for more details)", label, outcome.error,
                  generate_unit_log_file_name(invocation));
      return outcome;
    }

    outcome.status = UnitOutcome::Status::SUCCEEDED;
    SPDLOG_INFO("[{}]: analysis completed in {}", label, format_duration(t1 - t0));
  } catch (const std::exception &e) {
    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0);
    outcome.error = e.what();
    SPDLOG_WARN("[{}]: failed to run analysis: {}", label, outcome.error);
  } catch (...) {
    SPDLOG_ERROR("[{}]: an unknown error occurred while running the analysis", label);
    throw;
  }

  return outcome;
}

[[nodiscard]] static std::size_t compute_num_threads(std::size_t requested,
                                                     std::size_t num_units) {
  assert(num_units != 0);
  if (requested == 0) {
    requested = std::max(1U, std::thread::hardware_concurrency());
  }

  if (requested > num_units) {
    SPDLOG_DEBUG("capping number of threads to the number of samples ({} -> {})", requested,
                 num_units);
  }
  return std::clamp(requested, 1UZ, num_units);
}

std::vector<UnitOutcome> dispatch_units(const ResolvedConfig &c,
                                        const std::vector<SampleSpec> &samples,
                                        const DispatchOptions &opts, ProcessLauncher &launcher) {
  if (samples.empty()) {
    SPDLOG_WARN("no samples to process!");
    return {};
  }

  const auto program = launcher.resolve(opts.analysis_program);
  const auto num_threads = compute_num_threads(opts.threads, samples.size());

  SPDLOG_INFO("dispatching {} analysis unit(s) using {} thread(s)...", samples.size(),
              num_threads);

  const auto t0 = std::chrono::steady_clock::now();
  BS::light_thread_pool tpool(num_threads);
  BS::multi_future<UnitOutcome> workers{};
  workers.reserve(samples.size());

  for (const auto &sample : samples) {
    workers.emplace_back(
        tpool.submit_task([&, invocation = make_analysis_invocation(c, sample)]() {
          return worker_fx(sample, invocation, program, launcher);
        }));
  }

  auto outcomes = workers.get();
  const auto t1 = std::chrono::steady_clock::now();

  const auto num_failures = std::ranges::count_if(outcomes, [](const auto &o) { return !o.ok(); });
  if (num_failures == 0) {
    SPDLOG_INFO("all {} analysis unit(s) completed successfully in {}", outcomes.size(),
                format_duration(t1 - t0));
  } else {
    SPDLOG_WARN("{}/{} analysis unit(s) failed (elapsed time: {})", num_failures, outcomes.size(),
                format_duration(t1 - t0));
  }

  return outcomes;
}

}  // namespace dhslink
