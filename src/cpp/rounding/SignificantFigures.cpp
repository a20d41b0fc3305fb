/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "fvalue/rounding/SignificantFigures.hpp"

#include "fvalue/util/InvalidArgument.hpp"
#include "fvalue/util/logging.hpp"
#include "fvalue/util/validation.hpp"

//-------------------------------------------------------------------------

namespace fvalue::rounding
{

//-------------------------------------------------------------------------

namespace
{

// Rounds reference at its own significant-figure position, moving one decade
// up if the rounding carried.
std::pair<Decimal, int32_t> roundReference(
    const Decimal& reference, int32_t significantFigures, RoundingPolicy policy, bool& carried)
{
    int32_t position = roundingPosition(reference, significantFigures);
    Decimal rounded = reference.quantize(position, policy);
    carried = !reference.isZero() && rounded.adjusted() > reference.adjusted();
    if (carried) {
        log::logger().debug(
            "carry while rounding {} at 10^{}, retrying at 10^{}", reference, position, position + 1);
        rounded = reference.quantize(++position, policy);
    }
    return {std::move(rounded), position};
}

}  // namespace

//-------------------------------------------------------------------------

int32_t roundingPosition(const Decimal& reference, int32_t significantFigures)
{
    return reference.adjusted() - (util::validateSignificantFigures(significantFigures) - 1);
}

//-------------------------------------------------------------------------

RoundedPair roundToSignificantFigures(
    const Decimal& value,
    const Decimal& error,
    int32_t significantFigures,
    RoundingPolicy policy,
    std::source_location sl)
{
    if (error < Decimal{}) {
        throw InvalidArgument{fmt::format(
            "{}: the error on a value should be non-negative, not {}", sl.function_name(), error)};
    }
    util::validateSignificantFigures(significantFigures, sl);
    validateRoundingPolicy(policy, sl);

    bool carried{};

    if (error.isZero()) {
        auto [roundedValue, position] =
            roundReference(value, significantFigures, policy, carried);
        log::logger().trace(
            "zero error, rounded {} to {} significant figures: {}",
            value,
            significantFigures,
            roundedValue);
        return RoundedPair{
            .value = std::move(roundedValue),
            .error = Decimal{}.quantize(position, policy),
            .position = position,
            .carried = carried};
    }

    auto [roundedError, position] = roundReference(error, significantFigures, policy, carried);
    Decimal roundedValue = value.quantize(position, policy);
    log::logger().trace(
        "rounded {} ± {} at 10^{}: {} ± {}", value, error, position, roundedValue, roundedError);

    return RoundedPair{
        .value = std::move(roundedValue),
        .error = std::move(roundedError),
        .position = position,
        .carried = carried};
}

//-------------------------------------------------------------------------

const Decimal& validateMultiplier(const Decimal& multiplier, std::source_location sl)
{
    if (multiplier <= Decimal{}) {
        throw InvalidArgument{fmt::format(
            "{}: the multiplier should be positive, not {}", sl.function_name(), multiplier)};
    }
    return multiplier;
}

//-------------------------------------------------------------------------

}  // namespace fvalue::rounding

//-------------------------------------------------------------------------
