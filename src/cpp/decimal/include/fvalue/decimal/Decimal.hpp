/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "fvalue/decimal/RoundingPolicy.hpp"
#include "fvalue/decimal/decimal64.hpp"

#include <boost/multiprecision/cpp_int.hpp>
#include <fmt/format.h>

#include <cmath>
#include <compare>
#include <concepts>
#include <cstdint>
#include <limits>
#include <ostream>
#include <source_location>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace fvalue
{

//-------------------------------------------------------------------------

/**
 * Exact decimal number of the form (-1)^sign * coefficient * 10^exponent.
 *
 * The coefficient has arbitrary precision, so every binary floating-point
 * value and every decimal64 value converts without loss. The exponent is
 * kept as given, i.e. 1.0 and 1.00 are equal but render differently.
 */
class Decimal
{
public:
    using Coefficient = boost::multiprecision::cpp_int;

    static constexpr int32_t kMaxExponent = 1'000'000;

    Decimal() noexcept = default;

    template<std::integral T>
    requires (!std::same_as<T, bool>)
    Decimal(T value)
    {
        if constexpr (std::is_signed_v<T>) {
            m_negative = value < 0;
        }
        m_coefficient = value;
        if (m_negative) {
            m_coefficient = -m_coefficient;
        }
    }

    template<std::floating_point T>
    requires (std::numeric_limits<T>::radix == 2 && std::numeric_limits<T>::digits <= 64)
    Decimal(T value, std::source_location sl = std::source_location::current())
    {
        if (!std::isfinite(value)) {
            throwNonFinite(sl);
        }
        static constexpr int kDigits = std::numeric_limits<T>::digits;
        int binaryExponent{};
        const T fraction = std::frexp(std::fabs(value), &binaryExponent);
        *this = fromBinary(
            std::signbit(value),
            static_cast<uint64_t>(std::ldexp(fraction, kDigits)),
            binaryExponent - kDigits);
    }

    Decimal(decimal_t value, std::source_location sl = std::source_location::current());

    [[nodiscard]] static Decimal fromString(
        std::string_view str, std::source_location sl = std::source_location::current());

    [[nodiscard]] bool isNegative() const noexcept { return m_negative; }
    [[nodiscard]] bool isZero() const noexcept { return m_coefficient.is_zero(); }
    [[nodiscard]] const Coefficient& coefficient() const noexcept { return m_coefficient; }
    [[nodiscard]] int32_t exponent() const noexcept { return m_exponent; }

    // Number of digits in the coefficient, 1 for zero.
    [[nodiscard]] int32_t digits() const;

    // Exponent of the most significant digit, floor(log10(|x|)). For zero the
    // exponent itself is returned.
    [[nodiscard]] int32_t adjusted() const;

    [[nodiscard]] Decimal abs() const;
    [[nodiscard]] Decimal operator-() const;

    /**
     * Rounds to a multiple of 10^exponent using the given policy. The result
     * always carries exactly that exponent, coarser or finer than the input.
     */
    [[nodiscard]] Decimal quantize(int32_t exponent, RoundingPolicy policy) const;

    // Exact multiplication by 10^n.
    [[nodiscard]] Decimal scaleb(int32_t n) const;

    // Fixed-point notation without an exponent, e.g. "0.0000027" or "660".
    [[nodiscard]] std::string toString() const;

    friend Decimal operator*(const Decimal& lhs, const Decimal& rhs);

    [[nodiscard]] bool operator==(const Decimal& other) const;
    [[nodiscard]] std::strong_ordering operator<=>(const Decimal& other) const;

    friend std::ostream& operator<<(std::ostream& os, const Decimal& val);

private:
    Decimal(bool negative, Coefficient coefficient, int32_t exponent) noexcept;

    [[nodiscard]] static Decimal fromBinary(
        bool negative, uint64_t mantissa, int32_t binaryExponent);

    [[noreturn]] static void throwNonFinite(std::source_location sl);

    [[nodiscard]] std::strong_ordering compareMagnitude(const Decimal& other) const;

    bool m_negative{};
    Coefficient m_coefficient{};
    int32_t m_exponent{};
};

//-------------------------------------------------------------------------

}  // namespace fvalue

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<fvalue::Decimal>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const fvalue::Decimal& val, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", val.toString());
    }
};

//-------------------------------------------------------------------------
