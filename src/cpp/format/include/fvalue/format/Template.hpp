/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "fvalue/rounding/Notation.hpp"

#include <concepts>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

//-------------------------------------------------------------------------

namespace fvalue::format
{

//-------------------------------------------------------------------------

using TemplateFunction = std::function<std::string(
    std::string_view value, std::string_view error, std::string_view exponent, std::string_view units)>;

struct StringTemplate
{
    std::string pattern;
};

struct FunctionTemplate
{
    TemplateFunction fn;
};

//-------------------------------------------------------------------------

/**
 * Output template, either an fmt pattern with the positional fields
 * {0} value, {1} error, {2} exponent and {3} units, or a callable taking the
 * same four strings. Patterns are validated when rendered.
 */
class Template
{
public:
    Template(const char* pattern);
    Template(std::string_view pattern) : m_template{StringTemplate{std::string{pattern}}} {}
    Template(std::string pattern) : m_template{StringTemplate{std::move(pattern)}} {}

    template<typename Fn>
    requires std::is_invocable_r_v<
        std::string, Fn, std::string_view, std::string_view, std::string_view, std::string_view>
    Template(Fn fn) : Template{FunctionTemplate{TemplateFunction{std::move(fn)}}}
    {}

    Template(FunctionTemplate fn);

    [[nodiscard]] bool isFunction() const noexcept
    {
        return std::holds_alternative<FunctionTemplate>(m_template);
    }

    [[nodiscard]] std::string render(
        const rounding::RoundingResult& result, std::string_view units) const;

private:
    std::variant<StringTemplate, FunctionTemplate> m_template;
};

//-------------------------------------------------------------------------

}  // namespace fvalue::format

//-------------------------------------------------------------------------
