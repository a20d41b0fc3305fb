/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "fvalue/decimal/Decimal.hpp"

#include "fvalue/util/InvalidArgument.hpp"

#include <bsls_types.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>

//-------------------------------------------------------------------------

namespace fvalue
{

//-------------------------------------------------------------------------

namespace
{

Decimal::Coefficient pow10(uint32_t n)
{
    return boost::multiprecision::pow(Decimal::Coefficient{10}, n);
}

Remainder classifyRemainder(const Decimal::Coefficient& remainder, const Decimal::Coefficient& unit)
{
    if (remainder.is_zero()) {
        return Remainder::ZERO;
    }
    const Decimal::Coefficient twice = remainder * 2;
    if (twice < unit) return Remainder::BELOW_HALF;
    if (twice == unit) return Remainder::HALF;
    return Remainder::ABOVE_HALF;
}

}  // namespace

//-------------------------------------------------------------------------

Decimal::Decimal(bool negative, Coefficient coefficient, int32_t exponent) noexcept
    : m_negative{negative}, m_coefficient{std::move(coefficient)}, m_exponent{exponent}
{}

//-------------------------------------------------------------------------

Decimal::Decimal(decimal_t value, std::source_location sl)
{
    int sign{};
    BloombergLP::bsls::Types::Uint64 significand{};
    int exponent{};
    const int cls = BloombergLP::bdldfp::DecimalUtil::decompose(
        &sign, &significand, &exponent, value);
    if (cls == FP_NAN || cls == FP_INFINITE) {
        throwNonFinite(sl);
    }
    m_negative = sign < 0;
    m_coefficient = significand;
    m_exponent = exponent;
}

//-------------------------------------------------------------------------

Decimal Decimal::fromString(std::string_view str, std::source_location sl)
{
    auto fail = [&](std::string_view reason) {
        return InvalidArgument{fmt::format(
            "{}: cannot convert '{}' to a decimal: {}", sl.function_name(), str, reason)};
    };

    auto it = str.begin();
    const auto endIt = str.end();

    bool negative = false;
    if (it != endIt && (*it == '+' || *it == '-')) {
        negative = *it == '-';
        ++it;
    }

    std::string digits;
    int32_t fractionDigits = 0;
    bool seenPoint = false;
    for (; it != endIt; ++it) {
        if (std::isdigit(static_cast<unsigned char>(*it))) {
            digits.push_back(*it);
            if (seenPoint) {
                ++fractionDigits;
            }
        }
        else if (*it == '.' && !seenPoint) {
            seenPoint = true;
        }
        else {
            break;
        }
    }
    if (digits.empty()) {
        throw fail("no digits");
    }

    int32_t exponent = 0;
    if (it != endIt) {
        if (*it != 'e' && *it != 'E') {
            throw fail(fmt::format("unexpected character '{}'", *it));
        }
        ++it;
        if (it != endIt && *it == '+') {
            ++it;
            if (it != endIt && *it == '-') {
                throw fail("malformed exponent");
            }
        }
        const char* first = str.data() + (it - str.begin());
        const char* last = str.data() + str.size();
        const auto [ptr, ec] = std::from_chars(first, last, exponent);
        if (ec == std::errc::result_out_of_range) {
            throw fail("exponent out of range");
        }
        if (ec != std::errc{} || ptr != last) {
            throw fail("malformed exponent");
        }
    }
    if (exponent > kMaxExponent || exponent < -kMaxExponent || fractionDigits > kMaxExponent) {
        throw fail("exponent out of range");
    }

    // Leading zeros would make the coefficient parse as octal.
    const auto firstNonZero = digits.find_first_not_of('0');
    const Coefficient coefficient = firstNonZero == std::string::npos
        ? Coefficient{0}
        : Coefficient{digits.substr(firstNonZero).c_str()};

    return Decimal{negative, coefficient, exponent - fractionDigits};
}

//-------------------------------------------------------------------------

int32_t Decimal::digits() const
{
    return static_cast<int32_t>(m_coefficient.str().size());
}

//-------------------------------------------------------------------------

int32_t Decimal::adjusted() const
{
    return isZero() ? m_exponent : m_exponent + digits() - 1;
}

//-------------------------------------------------------------------------

Decimal Decimal::abs() const
{
    return Decimal{false, m_coefficient, m_exponent};
}

//-------------------------------------------------------------------------

Decimal Decimal::operator-() const
{
    return Decimal{!m_negative, m_coefficient, m_exponent};
}

//-------------------------------------------------------------------------

Decimal Decimal::quantize(int32_t exponent, RoundingPolicy policy) const
{
    if (exponent <= m_exponent) {
        return Decimal{
            m_negative,
            m_coefficient * pow10(static_cast<uint32_t>(m_exponent - exponent)),
            exponent};
    }

    const auto shift = static_cast<uint32_t>(exponent - m_exponent);
    Coefficient quotient;
    Remainder remainder;
    if (shift > static_cast<uint32_t>(digits())) {
        // Everything is discarded and lies below half a unit.
        quotient = 0;
        remainder = isZero() ? Remainder::ZERO : Remainder::BELOW_HALF;
    }
    else {
        const Coefficient unit = pow10(shift);
        quotient = m_coefficient / unit;
        remainder = classifyRemainder(m_coefficient % unit, unit);
    }

    const RoundingContext ctx{
        .lastKeptDigit = static_cast<Coefficient>(quotient % 10).convert_to<uint32_t>(),
        .remainder = remainder,
        .negative = m_negative};
    if (roundsAwayFromZero(policy, ctx)) {
        ++quotient;
    }

    return Decimal{m_negative, std::move(quotient), exponent};
}

//-------------------------------------------------------------------------

Decimal Decimal::scaleb(int32_t n) const
{
    return Decimal{m_negative, m_coefficient, m_exponent + n};
}

//-------------------------------------------------------------------------

std::string Decimal::toString() const
{
    std::string ret = m_negative ? "-" : "";

    if (m_exponent >= 0) {
        ret += m_coefficient.str();
        if (!isZero()) {
            ret.append(static_cast<size_t>(m_exponent), '0');
        }
        return ret;
    }

    std::string digits = m_coefficient.str();
    const auto fractionDigits = static_cast<size_t>(-static_cast<int64_t>(m_exponent));
    if (digits.size() <= fractionDigits) {
        digits.insert(0, fractionDigits - digits.size() + 1, '0');
    }
    digits.insert(digits.size() - fractionDigits, 1, '.');
    return ret + digits;
}

//-------------------------------------------------------------------------

Decimal operator*(const Decimal& lhs, const Decimal& rhs)
{
    return Decimal{
        lhs.m_negative != rhs.m_negative,
        lhs.m_coefficient * rhs.m_coefficient,
        lhs.m_exponent + rhs.m_exponent};
}

//-------------------------------------------------------------------------

bool Decimal::operator==(const Decimal& other) const
{
    return (*this <=> other) == std::strong_ordering::equal;
}

//-------------------------------------------------------------------------

std::strong_ordering Decimal::operator<=>(const Decimal& other) const
{
    if (isZero() && other.isZero()) {
        return std::strong_ordering::equal;
    }
    const bool lhsNegative = m_negative && !isZero();
    const bool rhsNegative = other.m_negative && !other.isZero();
    if (lhsNegative != rhsNegative) {
        return lhsNegative ? std::strong_ordering::less : std::strong_ordering::greater;
    }
    const auto magnitude = compareMagnitude(other);
    return lhsNegative ? 0 <=> magnitude : magnitude;
}

//-------------------------------------------------------------------------

std::strong_ordering Decimal::compareMagnitude(const Decimal& other) const
{
    if (isZero()) return std::strong_ordering::less;
    if (other.isZero()) return std::strong_ordering::greater;
    if (const auto cmp = adjusted() <=> other.adjusted(); cmp != 0) {
        return cmp;
    }
    // Equal adjusted exponents keep the alignment shift below the digit count.
    const int32_t common = std::min(m_exponent, other.m_exponent);
    const Coefficient lhs = m_coefficient * pow10(static_cast<uint32_t>(m_exponent - common));
    const Coefficient rhs =
        other.m_coefficient * pow10(static_cast<uint32_t>(other.m_exponent - common));
    if (lhs < rhs) return std::strong_ordering::less;
    if (lhs > rhs) return std::strong_ordering::greater;
    return std::strong_ordering::equal;
}

//-------------------------------------------------------------------------

std::ostream& operator<<(std::ostream& os, const Decimal& val)
{
    return os << val.toString();
}

//-------------------------------------------------------------------------

Decimal Decimal::fromBinary(bool negative, uint64_t mantissa, int32_t binaryExponent)
{
    while (mantissa != 0 && mantissa % 2 == 0 && binaryExponent < 0) {
        mantissa /= 2;
        ++binaryExponent;
    }
    if (mantissa == 0) {
        return Decimal{negative, Coefficient{0}, 0};
    }
    if (binaryExponent >= 0) {
        return Decimal{negative, Coefficient{mantissa} << binaryExponent, 0};
    }
    // m * 2^-k == m * 5^k * 10^-k
    const auto k = static_cast<uint32_t>(-binaryExponent);
    return Decimal{
        negative,
        Coefficient{mantissa} * boost::multiprecision::pow(Coefficient{5}, k),
        binaryExponent};
}

//-------------------------------------------------------------------------

void Decimal::throwNonFinite(std::source_location sl)
{
    throw InvalidArgument{fmt::format(
        "{}: non-finite numbers have no exact decimal representation",
        sl.function_name())};
}

//-------------------------------------------------------------------------

}  // namespace fvalue

//-------------------------------------------------------------------------
