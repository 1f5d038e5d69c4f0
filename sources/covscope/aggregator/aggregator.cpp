//
// Created by gregorian-rayne on 02/13/26.
//

#include "covscope/aggregator/aggregator.hpp"
#include "covscope/utils/parallel.hpp"

#include <algorithm>

namespace covscope::aggregator {

    MergedCoverage merge_outcomes(const std::vector<ParseOutcome>& outcomes) {
        MergedCoverage merged;
        for (const auto& outcome : outcomes) {
            merged.line += outcome.line;
            merged.branch += outcome.branch;
            merged.included_classes += outcome.included_classes;
            merged.excluded_classes += outcome.excluded_classes;
            merged.classes.insert(merged.classes.end(), outcome.classes.begin(), outcome.classes.end());
        }
        return merged;
    }

    std::vector<std::string> rank_worst_classes(
        std::vector<ClassCoverageRecord> classes,
        const std::size_t limit
    ) {
        std::ranges::stable_sort(classes, [](const ClassCoverageRecord& a, const ClassCoverageRecord& b) {
            const double ra = a.ratio();
            const double rb = b.ratio();
            if (ra != rb) {
                return ra < rb;
            }
            return a.name < b.name;
        });

        const std::size_t count = std::min(limit, classes.size());
        std::vector<std::string> names;
        names.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            names.push_back(std::move(classes[i].name));
        }
        return names;
    }

    CoverageMetrics compute_metrics(const MergedCoverage& merged) {
        CoverageMetrics metrics;
        metrics.line_coverage = merged.line.ratio();
        metrics.branch_coverage = merged.branch.ratio();
        metrics.worst_classes = rank_worst_classes(merged.classes);
        return metrics;
    }

    Aggregator::Aggregator(
        const parsers::IReportParser& parser,
        const scope::ScopeFilter& filter,
        Logger& logger,
        const AggregationOptions options
    )
        : parser_(parser)
        , filter_(filter)
        , logger_(logger)
        , options_(options) {
    }

    Result<ParseOutcome> Aggregator::parse_one(const fs::path& file) const {
        try {
            return parser_.parse_file(file, filter_);
        } catch (const std::exception& e) {
            return Result<ParseOutcome>::failure(
                Error::internal_error(std::string("Parser threw: ") + e.what(), file.string())
            );
        }
    }

    std::vector<Result<ParseOutcome>> Aggregator::parse_all(const std::vector<fs::path>& files) const {
        if (files.empty()) {
            return {};
        }

        const unsigned int workers = parallel::worker_count(options_.max_threads, files.size());
        logger_.debug("Parsing " + std::to_string(files.size()) + " report(s) on " +
                      std::to_string(workers) + " worker(s)");

        return parallel::map(files, [this](const fs::path& file) {
            return parse_one(file);
        }, workers);
    }

    CoverageSummary Aggregator::aggregate(const std::vector<fs::path>& files) const {
        if (files.empty()) {
            return CoverageSummary::failure("No coverage reports to aggregate");
        }

        auto results = parse_all(files);

        std::vector<ParseOutcome> outcomes;
        outcomes.reserve(results.size());
        std::vector<Error> failures;

        for (std::size_t i = 0; i < results.size(); ++i) {
            if (results[i].is_err()) {
                logger_.warning("Skipping " + files[i].string() + ": " + results[i].error().to_string());
                failures.push_back(results[i].error());
                continue;
            }
            auto outcome = std::move(results[i]).value();
            logger_.debug(outcome.source.string() + ": " +
                          std::to_string(outcome.included_classes) + " class(es) in scope, " +
                          std::to_string(outcome.excluded_classes) + " excluded");
            outcomes.push_back(std::move(outcome));
        }

        if (outcomes.empty()) {
            std::string message = "All " + std::to_string(files.size()) +
                                  " coverage report(s) failed to parse";
            if (!failures.empty()) {
                message += ": " + failures.front().message();
                if (failures.front().has_context()) {
                    message += " (" + *failures.front().context() + ")";
                }
            }
            return CoverageSummary::failure(std::move(message));
        }

        if (!failures.empty()) {
            logger_.verbose(std::to_string(failures.size()) + " of " + std::to_string(files.size()) +
                            " report(s) skipped");
        }

        const auto merged = merge_outcomes(outcomes);
        logger_.verbose("Merged " + std::to_string(outcomes.size()) + " report(s): " +
                        std::to_string(merged.included_classes) + " class(es) in scope");
        return CoverageSummary::success(compute_metrics(merged));
    }

}  // namespace covscope::aggregator
