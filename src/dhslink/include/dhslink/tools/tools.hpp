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

#include <cstdio>

#include "dhslink/tools/config.hpp"

namespace dhslink {

// Returns 1 when the merge step failed, 0 otherwise. Failed analysis units are reported but do
// not change the return value.
[[nodiscard]] int run_command(const DispatchConfig& c);

// Same as run_command, except that problems with the configuration or the list of samples
// (MissingFileError and ValidationError) are printed as "FAILURE! <message>" to failure_stream
// and mapped to 1.
[[nodiscard]] int run_command_checked(const DispatchConfig& c, std::FILE* failure_stream = stdout);

}  // namespace dhslink
