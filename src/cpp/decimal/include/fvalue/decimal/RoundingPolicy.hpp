/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <magic_enum.hpp>

#include <cstdint>
#include <source_location>
#include <string_view>

//-------------------------------------------------------------------------

namespace fvalue
{

//-------------------------------------------------------------------------

enum class RoundingPolicy : uint32_t
{
    ROUND_HALF_EVEN,
    ROUND_HALF_UP,   // Ties away from zero
    ROUND_HALF_DOWN, // Ties toward zero
    ROUND_UP,        // Away from zero
    ROUND_DOWN,      // Toward zero
    ROUND_CEILING,
    ROUND_FLOOR,
    ROUND_05UP
};

//-------------------------------------------------------------------------

// Where the discarded digits lie relative to half a unit in the last kept place.
enum class Remainder : uint32_t
{
    ZERO,
    BELOW_HALF,
    HALF,
    ABOVE_HALF
};

struct RoundingContext
{
    uint32_t lastKeptDigit;
    Remainder remainder;
    bool negative;
};

//-------------------------------------------------------------------------

/**
 * Decides whether the truncated coefficient has to be incremented by one unit
 * in the last kept place, i.e. whether the rounding moves away from zero.
 */
[[nodiscard]] bool roundsAwayFromZero(RoundingPolicy policy, const RoundingContext& ctx);

[[nodiscard]] RoundingPolicy validateRoundingPolicy(
    RoundingPolicy policy, std::source_location sl = std::source_location::current());

[[nodiscard]] RoundingPolicy roundingPolicyFromString(
    std::string_view name, std::source_location sl = std::source_location::current());

//-------------------------------------------------------------------------

}  // namespace fvalue

//-------------------------------------------------------------------------
