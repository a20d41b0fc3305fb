/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <bdldfp_decimal.h>
#include <bdldfp_decimalutil.h>

//-------------------------------------------------------------------------

#define FVALUE_DEC(lit) BDLDFP_DECIMAL_DD(lit)

//-------------------------------------------------------------------------

namespace fvalue
{

// IEEE 754 decimal64, accepted as an exact decimal input.
using decimal_t = BloombergLP::bdldfp::Decimal64;

}  // namespace fvalue

//-------------------------------------------------------------------------
