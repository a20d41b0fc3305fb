/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "fvalue/rounding/Notation.hpp"

#include "fvalue/util/InvalidArgument.hpp"
#include "fvalue/util/logging.hpp"
#include "fvalue/util/validation.hpp"

#include <fmt/ranges.h>
#include <magic_enum.hpp>

#include <algorithm>
#include <optional>

//-------------------------------------------------------------------------

namespace fvalue::rounding
{

//-------------------------------------------------------------------------

namespace
{

std::optional<int32_t> leadingExponent(const RoundedPair& rounded)
{
    std::optional<int32_t> lead;
    for (const Decimal* val : {&rounded.value, &rounded.error}) {
        if (!val->isZero()) {
            lead = std::max(lead.value_or(val->adjusted()), val->adjusted());
        }
    }
    return lead;
}

}  // namespace

//-------------------------------------------------------------------------

NotationPolicy NotationPolicy::fromXML(pugi::xml_node node)
{
    NotationPolicy policy;

    if (pugi::xml_attribute attr = node.attribute("mode"); !attr.empty()) {
        policy.mode = notationModeFromString(attr.as_string());
    }
    else {
        log::logger().debug(
            "missing attribute 'mode', falling back to '{}'", magic_enum::enum_name(policy.mode));
    }
    if (pugi::xml_attribute attr = node.attribute("minFixedExponent"); !attr.empty()) {
        policy.minFixedExponent = util::parseInteger(attr.as_string());
    }
    if (pugi::xml_attribute attr = node.attribute("maxTrailingZeros"); !attr.empty()) {
        policy.maxTrailingZeros = util::parseInteger(attr.as_string());
    }

    return policy;
}

//-------------------------------------------------------------------------

NotationMode notationModeFromString(std::string_view name, std::source_location sl)
{
    if (const auto mode = magic_enum::enum_cast<NotationMode>(name, magic_enum::case_insensitive)) {
        return *mode;
    }
    throw InvalidArgument{fmt::format(
        "{}: unknown notation mode '{}', expected one of {}",
        sl.function_name(),
        name,
        fmt::join(magic_enum::enum_names<NotationMode>(), ", "))};
}

//-------------------------------------------------------------------------

int32_t chooseExponent(const RoundedPair& rounded, const NotationPolicy& policy)
{
    const int32_t lead = leadingExponent(rounded).value_or(0);

    switch (policy.mode) {
        case NotationMode::FIXED:
            return 0;
        case NotationMode::SCIENTIFIC:
            return lead;
        case NotationMode::AUTO:
            if (rounded.position > policy.maxTrailingZeros) {
                return rounded.position;
            }
            if (lead < policy.minFixedExponent) {
                return lead;
            }
            return 0;
    }
    throw InvalidArgument{fmt::format(
        "{}: unknown notation mode {}",
        std::source_location::current().function_name(),
        static_cast<uint32_t>(policy.mode))};
}

//-------------------------------------------------------------------------

RoundingResult render(const RoundedPair& rounded, const NotationPolicy& policy)
{
    const int32_t exponent = chooseExponent(rounded, policy);
    log::logger().trace(
        "rendering {} ± {} with exponent {}", rounded.value, rounded.error, exponent);

    return RoundingResult{
        .value = rounded.value.scaleb(-exponent).toString(),
        .error = rounded.error.scaleb(-exponent).toString(),
        .exponent = fmt::format("{}", exponent),
        .decimalPlaces = static_cast<uint32_t>(std::max(0, exponent - rounded.position))};
}

//-------------------------------------------------------------------------

RoundingResult round(
    const Decimal& value,
    const Decimal& error,
    int32_t significantFigures,
    RoundingPolicy policy,
    const Decimal& multiplier,
    const NotationPolicy& notation)
{
    validateMultiplier(multiplier);
    return render(
        roundToSignificantFigures(value * multiplier, error * multiplier, significantFigures, policy),
        notation);
}

//-------------------------------------------------------------------------

}  // namespace fvalue::rounding

//-------------------------------------------------------------------------
