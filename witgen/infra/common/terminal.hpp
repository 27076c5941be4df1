// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>

namespace witgen {

inline constexpr std::string_view kColorReset = "\x1b[0m";

inline constexpr std::string_view kColorCoal = "\x1b[90m";
inline constexpr std::string_view kColorWhite = "\x1b[97m";
inline constexpr std::string_view kColorRed = "\x1b[91m";
inline constexpr std::string_view kColorGreen = "\x1b[32m";
inline constexpr std::string_view kColorOrangeHigh = "\x1b[1;33m";
inline constexpr std::string_view kBackgroundPurple = "\x1b[105m";
inline constexpr std::string_view kBackgroundRed = "\x1b[101m";

//! Check if the stream behind a file descriptor is a teletype (TTY) terminal
bool is_terminal(int fd);

bool is_terminal_stdout();
bool is_terminal_stderr();

}  // namespace witgen
