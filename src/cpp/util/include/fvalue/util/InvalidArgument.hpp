/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <stdexcept>
#include <string>

//-------------------------------------------------------------------------

namespace fvalue
{

class InvalidArgument : public std::invalid_argument
{
public:
    InvalidArgument(const std::string& message) : std::invalid_argument(message) {}
    InvalidArgument(const InvalidArgument& exception) = default;
    InvalidArgument(InvalidArgument&& exception) = default;
};

}  // namespace fvalue

//-------------------------------------------------------------------------
