//
// Created by gregorian-rayne on 02/09/26.
//

#include "covscope/result.hpp"
#include "covscope/types.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace covscope
{
    TEST(ResultTest, SuccessCarriesOutcome) {
        ParseOutcome outcome;
        outcome.line = Counter{2, 8};

        const auto result = Result<ParseOutcome>::success(outcome);

        ASSERT_TRUE(result.is_ok());
        EXPECT_FALSE(result.is_err());
        EXPECT_EQ(result.value().line, (Counter{2, 8}));
    }

    TEST(ResultTest, FailureCarriesError) {
        const auto result = Result<ParseOutcome>::failure(
            Error::parse_error("Malformed coverage report", "a.xml")
        );

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
        EXPECT_EQ(result.error().context().value_or(""), "a.xml");
    }

    TEST(ResultTest, WrongAccessorThrows) {
        const auto ok = Result<int>::success(1);
        const auto failed = Result<int>::failure(Error::not_found("no report"));

        EXPECT_THROW(static_cast<void>(ok.error()), std::logic_error);
        EXPECT_THROW(static_cast<void>(failed.value()), std::logic_error);
    }

    TEST(ResultTest, ValueCanBeMovedOut) {
        auto result = Result<std::vector<std::string>>::success({"com.x.A", "com.x.B"});

        const auto names = std::move(result).value();

        EXPECT_EQ(names.size(), 2u);
    }

    TEST(ResultTest, WithContextAppendsToError) {
        auto result = Result<int>::failure(Error::parse_error("Coverage value out of range [0, 1]", "line_coverage"));

        const auto located = std::move(result).with_context("baseline.json");

        ASSERT_TRUE(located.is_err());
        EXPECT_EQ(located.error().context().value_or(""), "line_coverage; baseline.json");
    }

    TEST(ResultTest, WithContextKeepsSuccess) {
        auto result = Result<int>::success(7);

        const auto same = std::move(result).with_context("covscope.toml");

        ASSERT_TRUE(same.is_ok());
        EXPECT_EQ(same.value(), 7);
    }

    TEST(VoidResultTest, SuccessAndFailure) {
        const auto saved = Result<void>::success();
        const auto rejected = Result<void>::failure(Error::config_error("locator.standards_file must not be empty"));

        EXPECT_TRUE(saved.is_ok());
        EXPECT_THROW(static_cast<void>(saved.error()), std::logic_error);
        ASSERT_TRUE(rejected.is_err());
        EXPECT_EQ(rejected.error().code(), ErrorCode::ConfigError);
    }

}  // namespace covscope
