//
// Created by gregorian-rayne on 02/13/26.
//

#include "covscope/aggregator/aggregator.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>

using namespace covscope;
using namespace covscope::aggregator;

namespace {

    ClassCoverageRecord record(std::string name, const std::uint64_t missed, const std::uint64_t covered) {
        return ClassCoverageRecord{std::move(name), Counter{missed, covered}};
    }

    ParseOutcome outcome(
        const std::string& source,
        const Counter line,
        const Counter branch,
        std::vector<ClassCoverageRecord> classes = {}
    ) {
        ParseOutcome o;
        o.source = source;
        o.line = line;
        o.branch = branch;
        o.included_classes = classes.size();
        o.classes = std::move(classes);
        return o;
    }

    /**
     * Parser that serves canned outcomes keyed by file name.
     */
    class FakeParser : public parsers::IReportParser {
    public:
        std::map<std::string, ParseOutcome> outcomes;
        std::map<std::string, Error> errors;
        std::set<std::string> throwing;

        [[nodiscard]] std::string_view name() const noexcept override { return "fake"; }

        [[nodiscard]] std::vector<std::string> supported_extensions() const override {
            return {".xml"};
        }

        [[nodiscard]] bool can_parse(const fs::path&) const override { return true; }

        [[nodiscard]] Result<ParseOutcome> parse_file(
            const fs::path& path,
            const scope::ScopeFilter&
        ) const override {
            const auto key = path.string();
            if (throwing.contains(key)) {
                throw std::runtime_error("boom");
            }
            if (const auto it = errors.find(key); it != errors.end()) {
                return Result<ParseOutcome>::failure(it->second);
            }
            if (const auto it = outcomes.find(key); it != outcomes.end()) {
                return Result<ParseOutcome>::success(it->second);
            }
            return Result<ParseOutcome>::failure(Error::not_found("no such report", key));
        }

        [[nodiscard]] Result<ParseOutcome> parse_content(
            std::string_view,
            const scope::ScopeFilter&,
            const fs::path& source_hint
        ) const override {
            return Result<ParseOutcome>::failure(Error::not_found("unsupported", source_hint.string()));
        }
    };

    class AggregatorTest : public ::testing::Test {
    protected:
        std::ostringstream out;
        std::ostringstream err;
        Logger logger{out, err, Verbosity::Normal};
        scope::ScopeFilter filter{ScopeQuery{}};
        FakeParser parser;
    };

}  // namespace

// ============================================================================
// merge_outcomes / rank_worst_classes / compute_metrics
// ============================================================================

TEST(MergeOutcomesTest, SumsCountersAndConcatenatesClasses) {
    std::vector<ParseOutcome> outcomes{
        outcome("a.xml", {2, 8}, {1, 3}, {record("a.A", 2, 8)}),
        outcome("b.xml", {5, 5}, {0, 0}, {record("b.B", 5, 5)}),
    };
    outcomes[1].excluded_classes = 4;

    const auto merged = merge_outcomes(outcomes);

    EXPECT_EQ(merged.line, (Counter{7, 13}));
    EXPECT_EQ(merged.branch, (Counter{1, 3}));
    EXPECT_EQ(merged.included_classes, 2u);
    EXPECT_EQ(merged.excluded_classes, 4u);
    ASSERT_EQ(merged.classes.size(), 2u);
    EXPECT_EQ(merged.classes[0].name, "a.A");
    EXPECT_EQ(merged.classes[1].name, "b.B");
}

TEST(MergeOutcomesTest, DuplicateClassesAcrossFilesAreKept) {
    const auto merged = merge_outcomes({
        outcome("a.xml", {1, 1}, {}, {record("x.Shared", 1, 1)}),
        outcome("b.xml", {0, 2}, {}, {record("x.Shared", 0, 2)}),
    });

    EXPECT_EQ(merged.classes.size(), 2u);
}

TEST(MergeOutcomesTest, Empty) {
    const auto merged = merge_outcomes({});

    EXPECT_FALSE(merged.line.has_data());
    EXPECT_TRUE(merged.classes.empty());
}

TEST(RankWorstClassesTest, AscendingByCoverage) {
    const auto worst = rank_worst_classes({
        record("c.High", 1, 9),
        record("c.Low", 9, 1),
        record("c.Mid", 5, 5),
    });

    EXPECT_EQ(worst, (std::vector<std::string>{"c.Low", "c.Mid", "c.High"}));
}

TEST(RankWorstClassesTest, TiesBrokenByName) {
    const auto worst = rank_worst_classes({
        record("z.Zed", 1, 1),
        record("a.Alpha", 2, 2),
        record("m.Mid", 0, 4),
    });

    EXPECT_EQ(worst, (std::vector<std::string>{"a.Alpha", "z.Zed", "m.Mid"}));
}

TEST(RankWorstClassesTest, TruncatedToLimit) {
    std::vector<ClassCoverageRecord> classes;
    for (int i = 0; i < 30; ++i) {
        classes.push_back(record("p.C" + std::to_string(100 + i), 30 - i, i));
    }

    const auto worst = rank_worst_classes(classes);

    ASSERT_EQ(worst.size(), MAX_WORST_CLASSES);
    EXPECT_EQ(worst.front(), "p.C100");
    EXPECT_EQ(worst.back(), "p.C119");
    EXPECT_EQ(rank_worst_classes(classes, 3).size(), 3u);
}

TEST(ComputeMetricsTest, RatiosFromCounters) {
    MergedCoverage merged;
    merged.line = Counter{2, 8};
    merged.branch = Counter{1, 3};
    merged.classes = {record("x.A", 2, 8)};

    const auto metrics = compute_metrics(merged);

    EXPECT_DOUBLE_EQ(metrics.line_coverage, 0.8);
    EXPECT_DOUBLE_EQ(metrics.branch_coverage, 0.75);
    EXPECT_EQ(metrics.worst_classes, (std::vector<std::string>{"x.A"}));
}

TEST(ComputeMetricsTest, ZeroDenominatorsGiveZero) {
    const auto metrics = compute_metrics(MergedCoverage{});

    EXPECT_DOUBLE_EQ(metrics.line_coverage, 0.0);
    EXPECT_DOUBLE_EQ(metrics.branch_coverage, 0.0);
    EXPECT_TRUE(metrics.worst_classes.empty());
}

// ============================================================================
// Aggregator
// ============================================================================

TEST_F(AggregatorTest, EmptyFileListFails) {
    const Aggregator aggregator(parser, filter, logger);

    const auto summary = aggregator.aggregate({});

    ASSERT_FALSE(summary.is_success());
    EXPECT_EQ(summary.error(), "No coverage reports to aggregate");
}

TEST_F(AggregatorTest, MergesAllFiles) {
    parser.outcomes["a.xml"] = outcome("a.xml", {2, 8}, {1, 3}, {record("x.A", 2, 8)});
    parser.outcomes["b.xml"] = outcome("b.xml", {8, 2}, {3, 1}, {record("x.B", 8, 2)});
    const Aggregator aggregator(parser, filter, logger, AggregationOptions{2});

    const auto summary = aggregator.aggregate({"a.xml", "b.xml"});

    ASSERT_TRUE(summary.is_success());
    EXPECT_DOUBLE_EQ(summary.metrics().line_coverage, 0.5);
    EXPECT_DOUBLE_EQ(summary.metrics().branch_coverage, 0.5);
    EXPECT_EQ(summary.metrics().worst_classes, (std::vector<std::string>{"x.B", "x.A"}));
}

TEST_F(AggregatorTest, OrderOfFilesDoesNotMatter) {
    parser.outcomes["a.xml"] = outcome("a.xml", {1, 3}, {0, 1}, {record("x.A", 1, 3)});
    parser.outcomes["b.xml"] = outcome("b.xml", {3, 1}, {2, 2}, {record("x.B", 3, 1)});
    parser.outcomes["c.xml"] = outcome("c.xml", {0, 5}, {1, 0}, {record("x.C", 0, 5)});
    const Aggregator aggregator(parser, filter, logger);

    const auto forward = aggregator.aggregate({"a.xml", "b.xml", "c.xml"});
    const auto backward = aggregator.aggregate({"c.xml", "b.xml", "a.xml"});

    ASSERT_TRUE(forward.is_success());
    ASSERT_TRUE(backward.is_success());
    EXPECT_DOUBLE_EQ(forward.metrics().line_coverage, backward.metrics().line_coverage);
    EXPECT_DOUBLE_EQ(forward.metrics().branch_coverage, backward.metrics().branch_coverage);
    EXPECT_EQ(forward.metrics().worst_classes, backward.metrics().worst_classes);
}

TEST_F(AggregatorTest, FailedFileIsSkippedWithWarning) {
    parser.outcomes["good.xml"] = outcome("good.xml", {1, 1}, {0, 0}, {record("x.A", 1, 1)});
    parser.errors.emplace("bad.xml", Error::parse_error("Malformed coverage report", "bad.xml"));
    const Aggregator aggregator(parser, filter, logger);

    const auto summary = aggregator.aggregate({"bad.xml", "good.xml"});

    ASSERT_TRUE(summary.is_success());
    EXPECT_DOUBLE_EQ(summary.metrics().line_coverage, 0.5);
    EXPECT_NE(err.str().find("warning: Skipping bad.xml"), std::string::npos);
}

TEST_F(AggregatorTest, AllFilesFailing) {
    parser.errors.emplace("a.xml", Error::parse_error("Malformed coverage report", "a.xml"));
    parser.errors.emplace("b.xml", Error::parse_error("Malformed coverage report", "b.xml"));
    const Aggregator aggregator(parser, filter, logger);

    const auto summary = aggregator.aggregate({"a.xml", "b.xml"});

    ASSERT_FALSE(summary.is_success());
    EXPECT_EQ(summary.error().rfind("All 2 coverage report(s) failed to parse", 0), 0u);
    EXPECT_NE(summary.error().find("a.xml"), std::string::npos);
}

TEST_F(AggregatorTest, ThrowingParserBecomesFailure) {
    parser.throwing.insert("a.xml");
    const Aggregator aggregator(parser, filter, logger);

    const auto results = aggregator.parse_all({"a.xml"});

    ASSERT_EQ(results.size(), 1u);
    ASSERT_TRUE(results[0].is_err());
    EXPECT_EQ(results[0].error().code(), ErrorCode::InternalError);
}

TEST_F(AggregatorTest, ParseAllKeepsInputOrder) {
    std::vector<fs::path> files;
    for (int i = 0; i < 16; ++i) {
        const auto name = "r" + std::to_string(i) + ".xml";
        parser.outcomes[name] = outcome(name, {static_cast<std::uint64_t>(i), 1}, {});
        files.emplace_back(name);
    }
    const Aggregator aggregator(parser, filter, logger, AggregationOptions{4});

    const auto results = aggregator.parse_all(files);

    ASSERT_EQ(results.size(), files.size());
    for (std::size_t i = 0; i < files.size(); ++i) {
        ASSERT_TRUE(results[i].is_ok());
        EXPECT_EQ(results[i].value().source.string(), files[i].string());
    }
}
