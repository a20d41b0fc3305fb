/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "fvalue/rounding/SignificantFigures.hpp"

#include <fmt/format.h>
#include <pugixml.hpp>

#include <cstdint>
#include <string>

//-------------------------------------------------------------------------

namespace fvalue::rounding
{

//-------------------------------------------------------------------------

enum class NotationMode : uint32_t
{
    AUTO,
    FIXED,
    SCIENTIFIC
};

//-------------------------------------------------------------------------

/**
 * Decides between fixed-point and scientific rendering of a rounded pair.
 *
 * In AUTO mode the exponent is
 *  - the rounding position, when fixed-point would show more than
 *    maxTrailingZeros non-significant trailing zeros (656 ± 10 -> 66 ± 1, e1);
 *  - the leading exponent, when it is below minFixedExponent and fixed-point
 *    would need many leading zeros (2.7e-6 ± 5e-7 -> 2.7 ± 0.5, e-6);
 *  - zero otherwise.
 */
struct NotationPolicy
{
    static constexpr int32_t kDefaultMinFixedExponent = -4;
    static constexpr int32_t kDefaultMaxTrailingZeros = 0;

    NotationMode mode{NotationMode::AUTO};
    int32_t minFixedExponent{kDefaultMinFixedExponent};
    int32_t maxTrailingZeros{kDefaultMaxTrailingZeros};

    [[nodiscard]] static NotationPolicy fixed() noexcept { return {.mode = NotationMode::FIXED}; }
    [[nodiscard]] static NotationPolicy scientific() noexcept
    {
        return {.mode = NotationMode::SCIENTIFIC};
    }

    [[nodiscard]] static NotationPolicy fromXML(pugi::xml_node node);

    [[nodiscard]] bool operator==(const NotationPolicy&) const = default;
};

[[nodiscard]] NotationMode notationModeFromString(
    std::string_view name, std::source_location sl = std::source_location::current());

//-------------------------------------------------------------------------

struct RoundingResult
{
    std::string value;
    std::string error;
    std::string exponent;
    uint32_t decimalPlaces;

    [[nodiscard]] bool operator==(const RoundingResult&) const = default;
};

//-------------------------------------------------------------------------

[[nodiscard]] int32_t chooseExponent(const RoundedPair& rounded, const NotationPolicy& policy);

// Renders both quantities divided by 10^exponent with shared decimal places.
[[nodiscard]] RoundingResult render(const RoundedPair& rounded, const NotationPolicy& policy);

/**
 * Full pipeline: scales by the multiplier, rounds to the error's significant
 * figures and renders according to the notation policy.
 */
[[nodiscard]] RoundingResult round(
    const Decimal& value,
    const Decimal& error,
    int32_t significantFigures,
    RoundingPolicy policy,
    const Decimal& multiplier = 1,
    const NotationPolicy& notation = {});

//-------------------------------------------------------------------------

}  // namespace fvalue::rounding

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<fvalue::rounding::RoundingResult>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const fvalue::rounding::RoundingResult& res, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "RoundingResult{{.value = {}, .error = {}, .exponent = {}, .decimalPlaces = {}}}",
            res.value,
            res.error,
            res.exponent,
            res.decimalPlaces);
    }
};

//-------------------------------------------------------------------------
