//
// Created by gregorian-rayne on 02/15/26.
//

#include "covscope/aggregator/comparison.hpp"

#include <gtest/gtest.h>

namespace covscope::aggregator
{
    namespace {
        CoverageSummary summary(double line, double branch, std::vector<std::string> worst) {
            return CoverageSummary::success(CoverageMetrics{line, branch, std::move(worst)});
        }
    }

    TEST(CompareSummariesTest, DeltasAreCurrentMinusBaseline) {
        const auto result = compare_summaries(
            summary(0.50, 0.25, {}),
            summary(0.75, 0.125, {})
        );

        ASSERT_TRUE(result.is_ok());
        EXPECT_DOUBLE_EQ(result.value().line_delta, 0.25);
        EXPECT_DOUBLE_EQ(result.value().branch_delta, -0.125);
    }

    TEST(CompareSummariesTest, WorstListChanges) {
        const auto result = compare_summaries(
            summary(0.5, 0.5, {"a.A", "a.B", "a.C"}),
            summary(0.6, 0.5, {"a.D", "a.B", "a.E"})
        );

        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().improved_classes, (std::vector<std::string>{"a.A", "a.C"}));
        EXPECT_EQ(result.value().new_worst_classes, (std::vector<std::string>{"a.D", "a.E"}));
    }

    TEST(CompareSummariesTest, IdenticalSummariesHaveNoChange) {
        const auto s = summary(0.8, 0.6, {"x.Y"});

        const auto result = compare_summaries(s, s);

        ASSERT_TRUE(result.is_ok());
        EXPECT_DOUBLE_EQ(result.value().line_delta, 0.0);
        EXPECT_DOUBLE_EQ(result.value().branch_delta, 0.0);
        EXPECT_TRUE(result.value().improved_classes.empty());
        EXPECT_TRUE(result.value().new_worst_classes.empty());
    }

    TEST(CompareSummariesTest, FailureSummaryIsRejected) {
        const auto failed = CoverageSummary::failure("No coverage reports found");

        const auto as_baseline = compare_summaries(failed, summary(0.5, 0.5, {}));
        const auto as_current = compare_summaries(summary(0.5, 0.5, {}), failed);

        ASSERT_TRUE(as_baseline.is_err());
        EXPECT_EQ(as_baseline.error().code(), ErrorCode::InvalidArgument);
        ASSERT_TRUE(as_current.is_err());
        EXPECT_EQ(as_current.error().code(), ErrorCode::InvalidArgument);
    }

}  // namespace covscope::aggregator
