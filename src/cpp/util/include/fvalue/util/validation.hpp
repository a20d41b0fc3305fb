/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <cstdint>
#include <source_location>
#include <string_view>

//-------------------------------------------------------------------------

namespace fvalue::util
{

inline constexpr int32_t kMaxSignificantFigures = 100;

int32_t validateSignificantFigures(
    int32_t significantFigures, std::source_location sl = std::source_location::current());

// Whole-string base-10 integer, optionally signed.
[[nodiscard]] int32_t parseInteger(
    std::string_view str, std::source_location sl = std::source_location::current());

}  // namespace fvalue::util

//-------------------------------------------------------------------------
