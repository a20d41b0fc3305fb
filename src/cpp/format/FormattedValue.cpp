/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "fvalue/format/FormattedValue.hpp"

#include "fvalue/rounding/SignificantFigures.hpp"
#include "fvalue/util/InvalidArgument.hpp"
#include "fvalue/util/validation.hpp"

#include <source_location>

//-------------------------------------------------------------------------

namespace fvalue::format
{

//-------------------------------------------------------------------------

FormattedValue::FormattedValue(
    Decimal value, Decimal error, int32_t errorSignificantFigures, RoundingPolicy rounding)
    : m_value{std::move(value)},
      m_error{std::move(error)},
      m_errorSignificantFigures{util::validateSignificantFigures(errorSignificantFigures)},
      m_rounding{validateRoundingPolicy(rounding)}
{
    if (m_error < Decimal{}) {
        throw InvalidArgument{fmt::format(
            "{}: the error on a value should be non-negative, not {}",
            std::source_location::current().function_name(),
            m_error)};
    }
}

//-------------------------------------------------------------------------

std::pair<Decimal, Decimal> FormattedValue::roundedData(const Decimal& multiplier) const
{
    auto rounded = rounding::roundToSignificantFigures(
        m_value * rounding::validateMultiplier(multiplier),
        m_error * multiplier,
        m_errorSignificantFigures,
        m_rounding);
    return {std::move(rounded.value), std::move(rounded.error)};
}

//-------------------------------------------------------------------------

rounding::RoundingResult FormattedValue::rounded(
    const Decimal& multiplier, const rounding::NotationPolicy& notation) const
{
    return rounding::round(
        m_value, m_error, m_errorSignificantFigures, m_rounding, multiplier, notation);
}

//-------------------------------------------------------------------------

std::string FormattedValue::formatted(
    const Template& tmpl,
    std::string_view units,
    const Decimal& multiplier,
    const rounding::NotationPolicy& notation) const
{
    return tmpl.render(rounded(multiplier, notation), units);
}

//-------------------------------------------------------------------------

std::string FormattedValue::toString() const
{
    return formatted(kPlainTemplate, {}, 1, rounding::NotationPolicy::fixed());
}

//-------------------------------------------------------------------------

std::ostream& operator<<(std::ostream& os, const FormattedValue& val)
{
    return os << val.toString();
}

//-------------------------------------------------------------------------

}  // namespace fvalue::format

//-------------------------------------------------------------------------
