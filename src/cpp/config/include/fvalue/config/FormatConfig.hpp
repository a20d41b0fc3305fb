/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "fvalue/format/FormattedValue.hpp"

#include <pugixml.hpp>

#include <filesystem>
#include <optional>
#include <string>

//-------------------------------------------------------------------------

namespace fvalue::config
{

namespace fs = std::filesystem;

//-------------------------------------------------------------------------

// Values given on the command line, all as typed by the user.
struct FormatOverrides
{
    std::optional<int32_t> significantFigures;
    std::optional<std::string> rounding;
    std::optional<std::string> templateName;
    std::optional<std::string> pattern;
    std::optional<std::string> units;
    std::optional<std::string> multiplier;
    std::optional<std::string> notation;
};

//-------------------------------------------------------------------------

/**
 * Formatting defaults, read from an <FValue> element:
 *
 *   <FValue significantFigures="2" rounding="ROUND_HALF_UP"
 *           template="natural" units="m" multiplier="1e-3">
 *       <Notation mode="AUTO" minFixedExponent="-4" maxTrailingZeros="0"/>
 *   </FValue>
 *
 * An explicit 'pattern' attribute takes precedence over 'template'.
 */
struct FormatConfig
{
    int32_t significantFigures{1};
    RoundingPolicy rounding{RoundingPolicy::ROUND_HALF_EVEN};
    std::string pattern{format::kSiunitxTemplate};
    std::string units;
    Decimal multiplier{1};
    rounding::NotationPolicy notation;

    [[nodiscard]] format::FormattedValue makeValue(Decimal value, Decimal error = {}) const;
    [[nodiscard]] std::string render(const format::FormattedValue& value) const;

    // Replaces every field that has an override. A template name and a
    // pattern are mutually exclusive.
    void applyOverrides(const FormatOverrides& overrides);

    [[nodiscard]] static FormatConfig fromXML(pugi::xml_node node);
    [[nodiscard]] static FormatConfig fromFile(const fs::path& path);
};

//-------------------------------------------------------------------------

}  // namespace fvalue::config

//-------------------------------------------------------------------------
