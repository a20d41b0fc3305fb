/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "fvalue/config/FormatConfig.hpp"
#include "fvalue/util/InvalidArgument.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <pugixml.hpp>

#include <filesystem>

//-------------------------------------------------------------------------

using namespace fvalue;
using namespace fvalue::config;

using namespace testing;

namespace fs = std::filesystem;

//-------------------------------------------------------------------------

namespace
{

const auto kTestDataPath = fs::path{__FILE__}.parent_path().parent_path() / "data";

FormatConfig configFromString(const char* xml)
{
    pugi::xml_document doc;
    const pugi::xml_parse_result result = doc.load_string(xml);
    EXPECT_TRUE(result) << result.description();
    return FormatConfig::fromXML(doc.child("FValue"));
}

}  // namespace

//-------------------------------------------------------------------------

TEST(FormatConfigTest, FromXML)
{
    const auto config = configFromString(R"(
        <FValue significantFigures="2" rounding="ROUND_HALF_UP" template="natural"
                units="m" multiplier="1e-3">
            <Notation mode="FIXED"/>
        </FValue>)");

    EXPECT_EQ(config.significantFigures, 2);
    EXPECT_EQ(config.rounding, RoundingPolicy::ROUND_HALF_UP);
    EXPECT_EQ(config.pattern, format::kNaturalTemplate);
    EXPECT_EQ(config.units, "m");
    EXPECT_EQ(config.multiplier, Decimal::fromString("0.001"));
    EXPECT_EQ(config.notation.mode, rounding::NotationMode::FIXED);

    const auto value =
        config.makeValue(Decimal::fromString("1234.5"), Decimal::fromString("25"));
    EXPECT_EQ(config.render(value), "(1.235 ± 0.025) x 10^0 m");
}

//-------------------------------------------------------------------------

TEST(FormatConfigTest, Defaults)
{
    const auto config = configFromString("<FValue/>");

    EXPECT_EQ(config.significantFigures, 1);
    EXPECT_EQ(config.rounding, RoundingPolicy::ROUND_HALF_EVEN);
    EXPECT_EQ(config.pattern, format::kSiunitxTemplate);
    EXPECT_THAT(config.units, IsEmpty());
    EXPECT_EQ(config.multiplier, 1);
    EXPECT_EQ(config.notation, rounding::NotationPolicy{});

    EXPECT_EQ(config.render(config.makeValue(10, 0.1)), R"(\SI{10.0 \pm 0.1e0}{})");
}

//-------------------------------------------------------------------------

TEST(FormatConfigTest, PatternTakesPrecedenceOverTemplate)
{
    const auto config =
        configFromString(R"(<FValue template="natural" pattern="{0}({1})"/>)");
    EXPECT_EQ(config.pattern, "{0}({1})");
    EXPECT_EQ(config.render(config.makeValue(656, 10)), "66(1)");
}

//-------------------------------------------------------------------------

struct InvalidConfigTest : TestWithParam<const char*> {};

TEST_P(InvalidConfigTest, Throws)
{
    EXPECT_THROW(static_cast<void>(configFromString(GetParam())), InvalidArgument);
}

INSTANTIATE_TEST_SUITE_P(
    FormatConfigTests,
    InvalidConfigTest,
    Values(
        R"(<FValue rounding="ROUND_SIDEWAYS"/>)",
        R"(<FValue template="latex"/>)",
        R"(<FValue significantFigures="0"/>)",
        R"(<FValue significantFigures="101"/>)",
        R"(<FValue significantFigures="2.5"/>)",
        R"(<FValue significantFigures="x"/>)",
        R"(<FValue significantFigures=""/>)",
        R"(<FValue significantFigures="99999999999"/>)",
        R"(<FValue multiplier="-1"/>)",
        R"(<FValue multiplier="0"/>)",
        R"(<FValue multiplier="abc"/>)",
        R"(<FValue><Notation mode="ENGINEERING"/></FValue>)",
        R"(<FValue><Notation minFixedExponent="abc"/></FValue>)",
        R"(<FValue><Notation minFixedExponent="-4.5"/></FValue>)",
        R"(<FValue><Notation maxTrailingZeros="abc"/></FValue>)",
        R"(<FValue><Notation maxTrailingZeros="+-1"/></FValue>)"));

//-------------------------------------------------------------------------

TEST(FormatConfigTest, NotationThresholdsFromXML)
{
    const auto config = configFromString(
        R"(<FValue><Notation minFixedExponent="-7" maxTrailingZeros="+2"/></FValue>)");
    EXPECT_EQ(config.notation.mode, rounding::NotationMode::AUTO);
    EXPECT_EQ(config.notation.minFixedExponent, -7);
    EXPECT_EQ(config.notation.maxTrailingZeros, 2);
}

//-------------------------------------------------------------------------

TEST(FormatConfigTest, OverridesReplaceFileValues)
{
    auto config = FormatConfig::fromFile(kTestDataPath / "FormatConfig.xml");
    config.applyOverrides(FormatOverrides{
        .significantFigures = 1,
        .rounding = "ROUND_DOWN",
        .pattern = "{0} +- {1}",
        .multiplier = "1",
        .notation = "auto"});

    EXPECT_EQ(config.significantFigures, 1);
    EXPECT_EQ(config.rounding, RoundingPolicy::ROUND_DOWN);
    EXPECT_EQ(config.pattern, "{0} +- {1}");
    EXPECT_EQ(config.units, "m");
    EXPECT_EQ(config.multiplier, 1);
    EXPECT_EQ(config.notation.mode, rounding::NotationMode::AUTO);
    EXPECT_EQ(config.render(config.makeValue(Decimal::fromString("1.29"), 0.19)), "1.2 +- 0.1");
}

//-------------------------------------------------------------------------

TEST(FormatConfigTest, EmptyOverridesKeepValues)
{
    auto config = FormatConfig::fromFile(kTestDataPath / "FormatConfig.xml");
    config.applyOverrides({});
    EXPECT_EQ(config.significantFigures, 2);
    EXPECT_EQ(config.pattern, format::kNaturalTemplate);
    EXPECT_EQ(config.multiplier, Decimal::fromString("1e-3"));
    EXPECT_EQ(config.notation.mode, rounding::NotationMode::FIXED);
}

//-------------------------------------------------------------------------

TEST(FormatConfigTest, InvalidOverridesThrow)
{
    FormatConfig config;
    EXPECT_THROW(
        config.applyOverrides({.templateName = "natural", .pattern = "{0}"}), InvalidArgument);
    EXPECT_THROW(config.applyOverrides({.significantFigures = 0}), InvalidArgument);
    EXPECT_THROW(config.applyOverrides({.rounding = "ROUND_SIDEWAYS"}), InvalidArgument);
    EXPECT_THROW(config.applyOverrides({.templateName = "latex"}), InvalidArgument);
    EXPECT_THROW(config.applyOverrides({.multiplier = "-2"}), InvalidArgument);
    EXPECT_THROW(config.applyOverrides({.notation = "engineering"}), InvalidArgument);

    EXPECT_NO_THROW(config.applyOverrides({.templateName = "num"}));
    EXPECT_EQ(config.pattern, format::kNumTemplate);
}

//-------------------------------------------------------------------------

TEST(FormatConfigTest, FromFile)
{
    const auto config = FormatConfig::fromFile(kTestDataPath / "FormatConfig.xml");
    EXPECT_EQ(config.significantFigures, 2);
    EXPECT_EQ(config.rounding, RoundingPolicy::ROUND_HALF_UP);
    EXPECT_EQ(
        config.render(config.makeValue(Decimal::fromString("1234.5"), 25)),
        "(1.235 ± 0.025) x 10^0 m");
}

//-------------------------------------------------------------------------

TEST(FormatConfigTest, FromFileFailures)
{
    EXPECT_THROW(
        static_cast<void>(FormatConfig::fromFile(kTestDataPath / "FormatConfigMalformed.xml")),
        InvalidArgument);
    EXPECT_THROW(
        static_cast<void>(FormatConfig::fromFile(kTestDataPath / "FormatConfigWrongRoot.xml")),
        InvalidArgument);
    EXPECT_THROW(
        static_cast<void>(FormatConfig::fromFile(kTestDataPath / "Nonexistent.xml")),
        InvalidArgument);
}

//-------------------------------------------------------------------------
