/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "fvalue/util/logging.hpp"

#include "fvalue/util/InvalidArgument.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <string>

//-------------------------------------------------------------------------

namespace fvalue::log
{

//-------------------------------------------------------------------------

namespace
{

std::unique_ptr<spdlog::logger> makeLogger()
{
    auto logger = std::make_unique<spdlog::logger>(
        "fvalue", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    logger->set_level(kDefaultLevel);
    logger->set_pattern("[%n] [%l] %v");
    return logger;
}

}  // namespace

//-------------------------------------------------------------------------

spdlog::logger& logger()
{
    static const std::unique_ptr<spdlog::logger> s_logger = makeLogger();
    return *s_logger;
}

//-------------------------------------------------------------------------

void setLevel(spdlog::level::level_enum level)
{
    logger().set_level(level);
}

//-------------------------------------------------------------------------

spdlog::level::level_enum levelFromString(std::string_view name, std::source_location sl)
{
    std::string lowered{name};
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    const auto level = spdlog::level::from_str(lowered);
    if (level == spdlog::level::off && lowered != "off") {
        throw InvalidArgument{fmt::format("{}: unknown log level '{}'", sl.function_name(), name)};
    }
    return level;
}

//-------------------------------------------------------------------------

}  // namespace fvalue::log

//-------------------------------------------------------------------------
