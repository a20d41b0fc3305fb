/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "fvalue/util/validation.hpp"

#include "fvalue/util/InvalidArgument.hpp"

#include <fmt/format.h>

#include <charconv>
#include <system_error>

//-------------------------------------------------------------------------

namespace fvalue::util
{

int32_t validateSignificantFigures(int32_t significantFigures, std::source_location sl)
{
    if (significantFigures < 1) {
        throw InvalidArgument{fmt::format(
            "{}: the significant figures in the error should be positive, not {}",
            sl.function_name(),
            significantFigures)};
    }
    if (significantFigures > kMaxSignificantFigures) {
        throw InvalidArgument{fmt::format(
            "{}: at most {} significant figures are supported, requested {}",
            sl.function_name(),
            kMaxSignificantFigures,
            significantFigures)};
    }
    return significantFigures;
}

//-------------------------------------------------------------------------

int32_t parseInteger(std::string_view str, std::source_location sl)
{
    // from_chars rejects a leading '+'.
    const std::string_view digits = str.starts_with('+') ? str.substr(1) : str;
    int32_t value{};
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size() || str.starts_with("+-")) {
        throw InvalidArgument{fmt::format(
            "{}: '{}' is not an integer in range", sl.function_name(), str)};
    }
    return value;
}

}  // namespace fvalue::util

//-------------------------------------------------------------------------
