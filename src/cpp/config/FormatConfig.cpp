/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "fvalue/config/FormatConfig.hpp"

#include "fvalue/util/InvalidArgument.hpp"
#include "fvalue/util/logging.hpp"
#include "fvalue/util/validation.hpp"

#include <fmt/std.h>

#include <source_location>

//-------------------------------------------------------------------------

namespace fvalue::config
{

//-------------------------------------------------------------------------

format::FormattedValue FormatConfig::makeValue(Decimal value, Decimal error) const
{
    return format::FormattedValue{std::move(value), std::move(error), significantFigures, rounding};
}

//-------------------------------------------------------------------------

std::string FormatConfig::render(const format::FormattedValue& value) const
{
    return value.formatted(pattern, units, multiplier, notation);
}

//-------------------------------------------------------------------------

void FormatConfig::applyOverrides(const FormatOverrides& overrides)
{
    if (overrides.templateName && overrides.pattern) {
        throw InvalidArgument{fmt::format(
            "{}: a template name and a pattern cannot both be given",
            std::source_location::current().function_name())};
    }

    if (overrides.significantFigures) {
        significantFigures = util::validateSignificantFigures(*overrides.significantFigures);
    }
    if (overrides.rounding) {
        rounding = roundingPolicyFromString(*overrides.rounding);
    }
    if (overrides.templateName) {
        pattern = format::builtinTemplate(*overrides.templateName);
    }
    if (overrides.pattern) {
        pattern = *overrides.pattern;
    }
    if (overrides.units) {
        units = *overrides.units;
    }
    if (overrides.multiplier) {
        multiplier = rounding::validateMultiplier(Decimal::fromString(*overrides.multiplier));
    }
    if (overrides.notation) {
        notation.mode = rounding::notationModeFromString(*overrides.notation);
    }
}

//-------------------------------------------------------------------------

FormatConfig FormatConfig::fromXML(pugi::xml_node node)
{
    FormatConfig config;

    pugi::xml_attribute attr;

    if (attr = node.attribute("significantFigures"); !attr.empty()) {
        config.significantFigures =
            util::validateSignificantFigures(util::parseInteger(attr.as_string()));
    }

    if (attr = node.attribute("rounding"); !attr.empty()) {
        config.rounding = roundingPolicyFromString(attr.as_string());
    }
    else {
        log::logger().debug(
            "missing attribute 'rounding', falling back to '{}'",
            magic_enum::enum_name(config.rounding));
    }

    if (attr = node.attribute("pattern"); !attr.empty()) {
        config.pattern = attr.as_string();
    }
    else if (attr = node.attribute("template"); !attr.empty()) {
        config.pattern = format::builtinTemplate(attr.as_string());
    }

    config.units = node.attribute("units").as_string();

    if (attr = node.attribute("multiplier"); !attr.empty()) {
        config.multiplier = rounding::validateMultiplier(Decimal::fromString(attr.as_string()));
    }

    if (pugi::xml_node notationNode = node.child("Notation")) {
        config.notation = rounding::NotationPolicy::fromXML(notationNode);
    }

    return config;
}

//-------------------------------------------------------------------------

FormatConfig FormatConfig::fromFile(const fs::path& path)
{
    pugi::xml_document doc;
    const pugi::xml_parse_result result = doc.load_file(path.c_str());
    if (!result) {
        throw InvalidArgument{fmt::format(
            "{}: failed to parse {}: {} at offset {}",
            std::source_location::current().function_name(),
            path,
            result.description(),
            result.offset)};
    }
    const pugi::xml_node node = doc.child("FValue");
    if (!node) {
        throw InvalidArgument{fmt::format(
            "{}: missing root element 'FValue' in {}",
            std::source_location::current().function_name(),
            path)};
    }
    log::logger().debug("loading configuration from {}", path);
    return fromXML(node);
}

//-------------------------------------------------------------------------

}  // namespace fvalue::config

//-------------------------------------------------------------------------
