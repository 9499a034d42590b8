// Copyright 2025 The Varuint Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>

namespace varuint {

// ANSI escape sequences coloring log lines, stripped when the output is not a terminal
inline constexpr std::string_view kColorReset{"\x1b[0m"};
inline constexpr std::string_view kColorCoal{"\x1b[90m"};
inline constexpr std::string_view kColorWhite{"\x1b[97m"};
inline constexpr std::string_view kColorRed{"\x1b[91m"};
inline constexpr std::string_view kColorGreen{"\x1b[32m"};
inline constexpr std::string_view kColorOrangeHigh{"\x1b[1;33m"};
inline constexpr std::string_view kBackgroundRed{"\x1b[101m"};
inline constexpr std::string_view kBackgroundPurple{"\x1b[105m"};

bool is_terminal_stdout();
bool is_terminal_stderr();

}  // namespace varuint
