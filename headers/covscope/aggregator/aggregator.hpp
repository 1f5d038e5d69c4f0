//
// Created by gregorian-rayne on 02/13/26.
//

#ifndef COVSCOPE_AGGREGATOR_HPP
#define COVSCOPE_AGGREGATOR_HPP

/**
 * @file aggregator.hpp
 * @brief Fan-out/fan-in aggregation of per-file coverage outcomes.
 *
 * Every report file is parsed on its own worker. After all workers have
 * finished, the successful outcomes are summed, failed files are logged and
 * skipped, and the worst classes are ranked.
 */

#include "covscope/types.hpp"
#include "covscope/result.hpp"
#include "covscope/logging.hpp"
#include "covscope/parsers/report_parser.hpp"
#include "covscope/scope/scope_filter.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace covscope::aggregator {

    namespace fs = std::filesystem;

    /**
     * Sum of a set of ParseOutcomes.
     */
    struct MergedCoverage {
        Counter line;
        Counter branch;
        std::vector<ClassCoverageRecord> classes;
        std::size_t included_classes = 0;
        std::size_t excluded_classes = 0;
    };

    /**
     * Adds outcomes together. Class records are concatenated in input order;
     * a class present in several files appears once per file.
     */
    [[nodiscard]] MergedCoverage merge_outcomes(const std::vector<ParseOutcome>& outcomes);

    /**
     * Orders classes by ascending line coverage (ties by name) and keeps the
     * first `limit` names.
     */
    [[nodiscard]] std::vector<std::string> rank_worst_classes(
        std::vector<ClassCoverageRecord> classes,
        std::size_t limit = MAX_WORST_CLASSES
    );

    /**
     * Converts merged counters into final metrics.
     */
    [[nodiscard]] CoverageMetrics compute_metrics(const MergedCoverage& merged);

    class Aggregator {
    public:
        Aggregator(
            const parsers::IReportParser& parser,
            const scope::ScopeFilter& filter,
            Logger& logger,
            AggregationOptions options = {}
        );

        /**
         * Parses every file in parallel and returns one result per file, in
         * input order. Never throws for per-file problems.
         */
        [[nodiscard]] std::vector<Result<ParseOutcome>> parse_all(const std::vector<fs::path>& files) const;

        /**
         * Parses and merges the given report files.
         *
         * @return A failure summary if `files` is empty or no file parsed,
         *         otherwise the merged metrics.
         */
        [[nodiscard]] CoverageSummary aggregate(const std::vector<fs::path>& files) const;

    private:
        [[nodiscard]] Result<ParseOutcome> parse_one(const fs::path& file) const;

        const parsers::IReportParser& parser_;
        const scope::ScopeFilter& filter_;
        Logger& logger_;
        AggregationOptions options_;
    };

}  // namespace covscope::aggregator

#endif //COVSCOPE_AGGREGATOR_HPP
