/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "fvalue/decimal/Decimal.hpp"

#include <cstdint>
#include <source_location>
#include <utility>

//-------------------------------------------------------------------------

namespace fvalue::rounding
{

//-------------------------------------------------------------------------

struct RoundedPair
{
    Decimal value;
    Decimal error;
    // Power of ten of the last retained digit, shared by value and error.
    int32_t position;
    bool carried;
};

//-------------------------------------------------------------------------

// Position of the last of significantFigures digits counted from the
// most significant digit of reference.
[[nodiscard]] int32_t roundingPosition(const Decimal& reference, int32_t significantFigures);

/**
 * Rounds error to significantFigures significant digits and value to the same
 * decimal position. A zero error rounds value to significantFigures digits
 * instead. When rounding carries into the next decade (9.96 -> 10) the
 * position moves up by one and both quantities are rounded again from the
 * unrounded inputs.
 */
[[nodiscard]] RoundedPair roundToSignificantFigures(
    const Decimal& value,
    const Decimal& error,
    int32_t significantFigures,
    RoundingPolicy policy,
    std::source_location sl = std::source_location::current());

const Decimal& validateMultiplier(
    const Decimal& multiplier, std::source_location sl = std::source_location::current());

//-------------------------------------------------------------------------

}  // namespace fvalue::rounding

//-------------------------------------------------------------------------
