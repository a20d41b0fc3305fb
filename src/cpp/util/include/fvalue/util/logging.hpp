/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <source_location>
#include <string_view>

//-------------------------------------------------------------------------

namespace fvalue::log
{

inline constexpr auto kDefaultLevel = spdlog::level::warn;

// Library-wide logger named "fvalue", writing to stderr.
[[nodiscard]] spdlog::logger& logger();

void setLevel(spdlog::level::level_enum level);

// Case-insensitive spdlog level name; unknown names throw instead of
// mapping to 'off'.
[[nodiscard]] spdlog::level::level_enum levelFromString(
    std::string_view name, std::source_location sl = std::source_location::current());

}  // namespace fvalue::log

//-------------------------------------------------------------------------
