/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "fvalue/decimal/Decimal.hpp"
#include "fvalue/format/Template.hpp"
#include "fvalue/format/templates.hpp"
#include "fvalue/rounding/Notation.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

//-------------------------------------------------------------------------

namespace fvalue::format
{

//-------------------------------------------------------------------------

/**
 * A value with its uncertainty, rounded so that the error keeps a given
 * number of significant figures and the value shares its decimal places.
 *
 * Immutable after construction; every render call works on its own copy of
 * the scaled quantities.
 */
class FormattedValue
{
public:
    FormattedValue(
        Decimal value,
        Decimal error = {},
        int32_t errorSignificantFigures = 1,
        RoundingPolicy rounding = RoundingPolicy::ROUND_HALF_EVEN);

    [[nodiscard]] const Decimal& value() const noexcept { return m_value; }
    [[nodiscard]] const Decimal& error() const noexcept { return m_error; }
    [[nodiscard]] int32_t errorSignificantFigures() const noexcept
    {
        return m_errorSignificantFigures;
    }
    [[nodiscard]] RoundingPolicy rounding() const noexcept { return m_rounding; }

    [[nodiscard]] std::pair<Decimal, Decimal> actualData() const { return {m_value, m_error}; }

    // Rounded (value, error) after applying the multiplier, before any
    // notation shift.
    [[nodiscard]] std::pair<Decimal, Decimal> roundedData(const Decimal& multiplier = 1) const;

    [[nodiscard]] rounding::RoundingResult rounded(
        const Decimal& multiplier = 1, const rounding::NotationPolicy& notation = {}) const;

    [[nodiscard]] std::string formatted(
        const Template& tmpl = kSiunitxTemplate,
        std::string_view units = {},
        const Decimal& multiplier = 1,
        const rounding::NotationPolicy& notation = {}) const;

    // "value ± error" in fixed-point notation.
    [[nodiscard]] std::string toString() const;

    friend std::ostream& operator<<(std::ostream& os, const FormattedValue& val);

private:
    Decimal m_value;
    Decimal m_error;
    int32_t m_errorSignificantFigures;
    RoundingPolicy m_rounding;
};

//-------------------------------------------------------------------------

}  // namespace fvalue::format

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<fvalue::format::FormattedValue>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const fvalue::format::FormattedValue& val, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", val.toString());
    }
};

//-------------------------------------------------------------------------
