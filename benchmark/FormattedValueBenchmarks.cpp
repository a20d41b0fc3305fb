/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include <benchmark/benchmark.h>

#include "fvalue/decimal/Decimal.hpp"
#include "fvalue/format/FormattedValue.hpp"
#include "fvalue/rounding/Notation.hpp"

//-------------------------------------------------------------------------

using namespace fvalue;

//-------------------------------------------------------------------------

static void BM_DecimalFromDouble(benchmark::State& state)
{
    double value = 0.1;
    for (auto _ : state) {
        benchmark::DoNotOptimize(Decimal{value});
        value += 1e-3;
    }
}

BENCHMARK(BM_DecimalFromDouble);

//-------------------------------------------------------------------------

static void BM_Round(benchmark::State& state)
{
    const auto value = Decimal::fromString("10973731.768160");
    const auto error = Decimal::fromString("0.000021");
    const auto sigFigs = static_cast<int32_t>(state.range(0));
    for (auto _ : state) {
        benchmark::DoNotOptimize(
            rounding::round(value, error, sigFigs, RoundingPolicy::ROUND_HALF_EVEN));
    }
}

BENCHMARK(BM_Round)->Arg(1)->Arg(2)->Arg(10);

//-------------------------------------------------------------------------

static void BM_FormatSiunitx(benchmark::State& state)
{
    const format::FormattedValue fv{0.000002671, 0.000000452, 1};
    for (auto _ : state) {
        benchmark::DoNotOptimize(fv.formatted(format::kSiunitxTemplate, R"(\second)"));
    }
}

BENCHMARK(BM_FormatSiunitx);

//-------------------------------------------------------------------------
