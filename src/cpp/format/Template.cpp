/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "fvalue/format/Template.hpp"

#include "fvalue/util/InvalidArgument.hpp"

#include <fmt/format.h>

#include <source_location>

//-------------------------------------------------------------------------

namespace fvalue::format
{

//-------------------------------------------------------------------------

Template::Template(const char* pattern)
{
    if (pattern == nullptr) {
        throw InvalidArgument{fmt::format(
            "{}: null template pattern", std::source_location::current().function_name())};
    }
    m_template = StringTemplate{pattern};
}

//-------------------------------------------------------------------------

Template::Template(FunctionTemplate fn)
{
    if (!fn.fn) {
        throw InvalidArgument{fmt::format(
            "{}: empty template function", std::source_location::current().function_name())};
    }
    m_template = std::move(fn);
}

//-------------------------------------------------------------------------

std::string Template::render(const rounding::RoundingResult& result, std::string_view units) const
{
    return std::visit(
        [&](auto&& tmpl) -> std::string {
            using T = std::remove_cvref_t<decltype(tmpl)>;
            if constexpr (std::same_as<T, FunctionTemplate>) {
                return tmpl.fn(result.value, result.error, result.exponent, units);
            }
            else {
                try {
                    return fmt::vformat(
                        tmpl.pattern,
                        fmt::make_format_args(result.value, result.error, result.exponent, units));
                }
                catch (const fmt::format_error& e) {
                    throw InvalidArgument{fmt::format(
                        "{}: invalid template '{}', only the fields {{0}} to {{3}} exist: {}",
                        std::source_location::current().function_name(),
                        tmpl.pattern,
                        e.what())};
                }
            }
        },
        m_template);
}

//-------------------------------------------------------------------------

}  // namespace fvalue::format

//-------------------------------------------------------------------------
