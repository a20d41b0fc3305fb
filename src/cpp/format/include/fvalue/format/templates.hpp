/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <source_location>
#include <span>
#include <string_view>

//-------------------------------------------------------------------------

namespace fvalue::format
{

//-------------------------------------------------------------------------

// Replacement fields: {0} value, {1} error, {2} exponent, {3} units.
inline constexpr std::string_view kSiunitxTemplate{R"(\SI{{{0} \pm {1}e{2}}}{{{3}}})"};
inline constexpr std::string_view kSiunitxValueTemplate{R"(\SI{{{0}e{2}}}{{{3}}})"};
inline constexpr std::string_view kSiunitxErrorTemplate{R"(\SI{{{1}e{2}}}{{{3}}})"};
inline constexpr std::string_view kNumTemplate{R"(\num{{{0} \pm {1}e{2}}})"};
inline constexpr std::string_view kNumValueTemplate{R"(\num{{{0}e{2}}})"};
inline constexpr std::string_view kNumErrorTemplate{R"(\num{{{1}e{2}}})"};
inline constexpr std::string_view kNaturalTemplate{"({0} ± {1}) x 10^{2} {3}"};
inline constexpr std::string_view kPlainTemplate{"{0} ± {1}"};

struct NamedTemplate
{
    std::string_view name;
    std::string_view pattern;
};

[[nodiscard]] std::span<const NamedTemplate> builtinTemplates() noexcept;

[[nodiscard]] std::string_view builtinTemplate(
    std::string_view name, std::source_location sl = std::source_location::current());

//-------------------------------------------------------------------------

}  // namespace fvalue::format

//-------------------------------------------------------------------------
