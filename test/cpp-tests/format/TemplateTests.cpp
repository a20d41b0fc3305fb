/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "fvalue/format/Template.hpp"
#include "fvalue/format/templates.hpp"
#include "fvalue/util/InvalidArgument.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <set>

//-------------------------------------------------------------------------

using namespace fvalue;
using namespace fvalue::format;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

const rounding::RoundingResult kResult{
    .value = "66", .error = "1", .exponent = "1", .decimalPlaces = 0};

}  // namespace

//-------------------------------------------------------------------------

struct BuiltinTemplateTestParams
{
    std::string_view pattern;
    std::string_view refString;
};

void PrintTo(const BuiltinTemplateTestParams& params, std::ostream* os)
{
    *os << fmt::format("{{.pattern = {}, .refString = {}}}", params.pattern, params.refString);
}

struct BuiltinTemplateTest : TestWithParam<BuiltinTemplateTestParams> {};

TEST_P(BuiltinTemplateTest, WorksCorrectly)
{
    const auto [pattern, refString] = GetParam();
    EXPECT_THAT(Template{pattern}.render(kResult, R"(\meter)"), StrEq(refString));
}

INSTANTIATE_TEST_SUITE_P(
    TemplateTests,
    BuiltinTemplateTest,
    Values(
        BuiltinTemplateTestParams{kSiunitxTemplate, R"(\SI{66 \pm 1e1}{\meter})"},
        BuiltinTemplateTestParams{kSiunitxValueTemplate, R"(\SI{66e1}{\meter})"},
        BuiltinTemplateTestParams{kSiunitxErrorTemplate, R"(\SI{1e1}{\meter})"},
        BuiltinTemplateTestParams{kNumTemplate, R"(\num{66 \pm 1e1})"},
        BuiltinTemplateTestParams{kNumValueTemplate, R"(\num{66e1})"},
        BuiltinTemplateTestParams{kNumErrorTemplate, R"(\num{1e1})"},
        BuiltinTemplateTestParams{kNaturalTemplate, R"((66 ± 1) x 10^1 \meter)"},
        BuiltinTemplateTestParams{kPlainTemplate, "66 ± 1"}));

//-------------------------------------------------------------------------

TEST(TemplateTest, EscapedBraces)
{
    EXPECT_EQ(Template{"{{{0}}}"}.render(kResult, ""), "{66}");
}

//-------------------------------------------------------------------------

TEST(TemplateTest, FieldOutOfRangeThrows)
{
    EXPECT_THROW(static_cast<void>(Template{"{4}"}.render(kResult, "")), InvalidArgument);
    EXPECT_THROW(static_cast<void>(Template{"{0} {"}.render(kResult, "")), InvalidArgument);
}

//-------------------------------------------------------------------------

TEST(TemplateTest, Function)
{
    const Template tmpl{[](std::string_view value,
                           std::string_view error,
                           std::string_view exponent,
                           std::string_view units) {
        return fmt::format("{}+-{} [{}] {}", value, error, exponent, units);
    }};
    EXPECT_TRUE(tmpl.isFunction());
    EXPECT_EQ(tmpl.render(kResult, "m"), "66+-1 [1] m");
    EXPECT_FALSE(Template{kNaturalTemplate}.isFunction());
}

//-------------------------------------------------------------------------

TEST(TemplateTest, EmptyFunctionThrows)
{
    EXPECT_THROW(Template{TemplateFunction{}}, InvalidArgument);
}

//-------------------------------------------------------------------------

TEST(TemplateTest, NullPatternThrows)
{
    EXPECT_THROW(Template{static_cast<const char*>(nullptr)}, InvalidArgument);
}

//-------------------------------------------------------------------------

TEST(TemplateTest, BuiltinLookup)
{
    EXPECT_EQ(builtinTemplate("natural"), kNaturalTemplate);
    EXPECT_EQ(builtinTemplate("siunitx"), kSiunitxTemplate);
    EXPECT_THROW(static_cast<void>(builtinTemplate("nope")), InvalidArgument);

    std::set<std::string_view> names;
    for (const auto& [name, pattern] : builtinTemplates()) {
        names.insert(name);
    }
    EXPECT_EQ(names.size(), builtinTemplates().size());
    EXPECT_THAT(
        names, IsSupersetOf({"siunitx", "siunitx-value", "siunitx-error", "num", "num-value", "num-error", "natural"}));
}

//-------------------------------------------------------------------------
