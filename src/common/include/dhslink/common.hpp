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

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <cassert>
#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

namespace dhslink {

[[nodiscard]] constexpr bool ndebug_defined() noexcept {
#ifdef NDEBUG
  return true;
#else
  return false;
#endif
}

[[nodiscard]] constexpr bool ndebug_not_defined() noexcept { return !ndebug_defined(); }

[[noreturn]] inline void unreachable_code() {
  if constexpr (ndebug_not_defined()) {
    throw std::logic_error("Unreachable code");
  }
  std::unreachable();
}

namespace internal {

[[nodiscard]] inline std::string strip_leading_zero(std::string s) {
  assert(!s.empty());
  if (s.front() == '0') {
    s.erase(0, 1);
  }
  return s;
}

}  // namespace internal

// Render durations like 350ms, 7.250s or 1h:02m:03.500s
template <typename Duration>
[[nodiscard]] inline std::string format_duration(const Duration &duration) {
  using std::chrono::duration_cast;
  using std::chrono::milliseconds;

  if (duration < std::chrono::seconds(1)) {
    return fmt::to_string(duration_cast<milliseconds>(duration));
  }

  const auto ms = duration_cast<milliseconds>(duration);
  if (duration < std::chrono::minutes(1)) {
    return internal::strip_leading_zero(fmt::format("{:%S}s", ms));
  }

  if (duration < std::chrono::hours(1)) {
    return internal::strip_leading_zero(fmt::format("{:%Mm:%S}s", ms));
  }

  return internal::strip_leading_zero(fmt::format("{:%Hh:%Mm:%S}s", ms));
}

}  // namespace dhslink
