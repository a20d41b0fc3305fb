/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "fvalue/config/FormatConfig.hpp"
#include "fvalue/util/InvalidArgument.hpp"
#include "fvalue/util/logging.hpp"

#include <CLI/CLI.hpp>
#include <fmt/format.h>

#include <cstdlib>
#include <string>

//-------------------------------------------------------------------------

namespace fs = std::filesystem;

using namespace fvalue;

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    CLI::App app{"fvalue: value ± error formatting"};

    std::string value;
    app.add_option("-v,--value", value, "Measured value, read as an exact decimal");

    std::string error{"0"};
    app.add_option("-e,--error", error, "Uncertainty on the value")
        ->capture_default_str();

    fs::path configFile;
    app.add_option("-f,--config-file", configFile, "XML configuration file")
        ->check(CLI::ExistingFile);

    config::FormatOverrides overrides;

    app.add_option(
        "-s,--significant-figures",
        overrides.significantFigures,
        "Significant figures kept on the error");
    app.add_option("-r,--rounding", overrides.rounding, "Rounding policy, e.g. ROUND_HALF_EVEN");

    auto* patternGroup = app.add_option_group("Template");
    patternGroup->add_option("-t,--template", overrides.templateName, "Built-in template name");
    patternGroup->add_option(
        "-p,--pattern",
        overrides.pattern,
        "Template pattern with fields {0} value, {1} error, {2} exponent, {3} units");
    patternGroup->require_option(0, 1);

    app.add_option("-u,--units", overrides.units, "Units passed to the template");
    app.add_option(
        "-m,--multiplier", overrides.multiplier, "Positive factor applied before rounding");
    app.add_option("-n,--notation", overrides.notation, "Notation mode: auto, fixed or scientific");

    bool listTemplates{};
    app.add_flag("--list-templates", listTemplates, "Print the built-in templates and exit");

    std::string logLevel{"warn"};
    app.add_option("--log-level", logLevel, "Log level")
        ->capture_default_str()
        ->check(CLI::IsMember(
            {"trace", "debug", "info", "warn", "error", "critical", "off"}, CLI::ignore_case));

    CLI11_PARSE(app, argc, argv);

    log::setLevel(log::levelFromString(logLevel));

    if (listTemplates) {
        for (const auto& [name, tmpl] : format::builtinTemplates()) {
            fmt::print("{:<16}{}\n", name, tmpl);
        }
        return EXIT_SUCCESS;
    }

    if (value.empty()) {
        fmt::print(stderr, "{}", app.help());
        return EXIT_FAILURE;
    }

    try {
        auto formatConfig = configFile.empty() ? config::FormatConfig{}
                                               : config::FormatConfig::fromFile(configFile);

        formatConfig.applyOverrides(overrides);

        const auto formattedValue =
            formatConfig.makeValue(Decimal::fromString(value), Decimal::fromString(error));
        fmt::print("{}\n", formatConfig.render(formattedValue));
    }
    catch (const InvalidArgument& e) {
        log::logger().error("{}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

//-------------------------------------------------------------------------
