// Copyright 2025 The Herald Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>

namespace herald {

// ANSI escape sequences used to colorize log lines
inline constexpr std::string_view kColorReset = "\x1b[0m";
inline constexpr std::string_view kColorCoal = "\x1b[90m";
inline constexpr std::string_view kColorWhite = "\x1b[97m";
inline constexpr std::string_view kColorRed = "\x1b[91m";
inline constexpr std::string_view kColorGreen = "\x1b[32m";
inline constexpr std::string_view kColorOrange = "\x1b[1;33m";

bool is_terminal_stdout();
bool is_terminal_stderr();

}  // namespace herald
