/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "fvalue/decimal/RoundingPolicy.hpp"

#include "fvalue/util/InvalidArgument.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <array>

//-------------------------------------------------------------------------

namespace fvalue
{

//-------------------------------------------------------------------------

namespace
{

using RoundingRule = bool (*)(const RoundingContext&) noexcept;

bool roundHalfEven(const RoundingContext& ctx) noexcept
{
    return ctx.remainder == Remainder::ABOVE_HALF
        || (ctx.remainder == Remainder::HALF && ctx.lastKeptDigit % 2 == 1);
}

bool roundHalfUp(const RoundingContext& ctx) noexcept
{
    return ctx.remainder == Remainder::HALF || ctx.remainder == Remainder::ABOVE_HALF;
}

bool roundHalfDown(const RoundingContext& ctx) noexcept
{
    return ctx.remainder == Remainder::ABOVE_HALF;
}

bool roundUp(const RoundingContext& ctx) noexcept
{
    return ctx.remainder != Remainder::ZERO;
}

bool roundDown(const RoundingContext&) noexcept
{
    return false;
}

bool roundCeiling(const RoundingContext& ctx) noexcept
{
    return !ctx.negative && ctx.remainder != Remainder::ZERO;
}

bool roundFloor(const RoundingContext& ctx) noexcept
{
    return ctx.negative && ctx.remainder != Remainder::ZERO;
}

bool round05Up(const RoundingContext& ctx) noexcept
{
    return ctx.remainder != Remainder::ZERO
        && (ctx.lastKeptDigit == 0 || ctx.lastKeptDigit == 5);
}

// NOTE: Ordering must follow the declaration order of RoundingPolicy.
constexpr std::array<RoundingRule, magic_enum::enum_count<RoundingPolicy>()> kRoundingRules{
    roundHalfEven,
    roundHalfUp,
    roundHalfDown,
    roundUp,
    roundDown,
    roundCeiling,
    roundFloor,
    round05Up};

}  // namespace

//-------------------------------------------------------------------------

bool roundsAwayFromZero(RoundingPolicy policy, const RoundingContext& ctx)
{
    return kRoundingRules.at(static_cast<size_t>(validateRoundingPolicy(policy)))(ctx);
}

//-------------------------------------------------------------------------

RoundingPolicy validateRoundingPolicy(RoundingPolicy policy, std::source_location sl)
{
    if (!magic_enum::enum_contains(policy)) {
        throw InvalidArgument{fmt::format(
            "{}: unsupported rounding option {}",
            sl.function_name(),
            static_cast<uint32_t>(policy))};
    }
    return policy;
}

//-------------------------------------------------------------------------

RoundingPolicy roundingPolicyFromString(std::string_view name, std::source_location sl)
{
    if (const auto policy = magic_enum::enum_cast<RoundingPolicy>(name)) {
        return *policy;
    }
    throw InvalidArgument{fmt::format(
        "{}: unsupported rounding option '{}', expected one of {}",
        sl.function_name(),
        name,
        fmt::join(magic_enum::enum_names<RoundingPolicy>(), ", "))};
}

//-------------------------------------------------------------------------

}  // namespace fvalue

//-------------------------------------------------------------------------
