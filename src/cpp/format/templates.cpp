/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "fvalue/format/templates.hpp"

#include "fvalue/util/InvalidArgument.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>

//-------------------------------------------------------------------------

namespace fvalue::format
{

//-------------------------------------------------------------------------

namespace
{

constexpr std::array kBuiltinTemplates{
    NamedTemplate{"siunitx", kSiunitxTemplate},
    NamedTemplate{"siunitx-value", kSiunitxValueTemplate},
    NamedTemplate{"siunitx-error", kSiunitxErrorTemplate},
    NamedTemplate{"num", kNumTemplate},
    NamedTemplate{"num-value", kNumValueTemplate},
    NamedTemplate{"num-error", kNumErrorTemplate},
    NamedTemplate{"natural", kNaturalTemplate},
    NamedTemplate{"plain", kPlainTemplate}};

}  // namespace

//-------------------------------------------------------------------------

std::span<const NamedTemplate> builtinTemplates() noexcept
{
    return kBuiltinTemplates;
}

//-------------------------------------------------------------------------

std::string_view builtinTemplate(std::string_view name, std::source_location sl)
{
    const auto it = std::ranges::find(kBuiltinTemplates, name, &NamedTemplate::name);
    if (it == kBuiltinTemplates.end()) {
        throw InvalidArgument{fmt::format(
            "{}: no built-in template named '{}'", sl.function_name(), name)};
    }
    return it->pattern;
}

//-------------------------------------------------------------------------

}  // namespace fvalue::format

//-------------------------------------------------------------------------
