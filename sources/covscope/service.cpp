//
// Created by gregorian-rayne on 02/14/26.
//

#include "covscope/service.hpp"
#include "covscope/aggregator/aggregator.hpp"
#include "covscope/locator/report_locator.hpp"
#include "covscope/parsers/jacoco_parser.hpp"
#include "covscope/scope/scope_filter.hpp"

#include <algorithm>

namespace covscope {

    namespace {

        CoverageSummary run(
            const fs::path& project_root,
            const ScopeQuery& query,
            const core::Config& config,
            Logger& logger
        ) {
            auto filter = scope::ScopeFilter::create(
                query,
                config.filter.extra_exclusions,
                config.filter.use_builtin_exclusions
            );
            if (filter.is_err()) {
                return CoverageSummary::failure(filter.error().to_string());
            }

            const locator::ReportLocator report_locator(config.locator, logger);
            auto located = report_locator.locate(project_root, query);
            if (located.is_err()) {
                return CoverageSummary::failure(
                    located.error().message() + ": " + project_root.string()
                );
            }

            const auto& reports = located.value();
            if (reports.empty()) {
                return CoverageSummary::failure(
                    "No coverage reports found under " + project_root.string() +
                    ". Checked " + config.locator.standards_file + " and standard paths."
                );
            }
            logger.verbose(std::string("Resolved ") + std::to_string(reports.files.size()) +
                           " report(s) via " + locator::tier_to_string(reports.tier) + " tier");

            const parsers::JacocoXmlParser parser;
            AggregationOptions options;
            options.max_threads = static_cast<std::size_t>(std::max(config.aggregation.max_threads, 0));

            const aggregator::Aggregator aggregator(parser, filter.value(), logger, options);
            return aggregator.aggregate(reports.files);
        }

    }  // namespace

    CoverageSummary read_coverage_report(
        const fs::path& project_root,
        const ScopeQuery& query,
        const core::Config& config,
        Logger& logger
    ) noexcept {
        try {
            return run(project_root, query, config, logger);
        } catch (const std::exception& e) {
            return CoverageSummary::failure(std::string("Coverage analysis failed: ") + e.what());
        }
    }

    CoverageSummary read_coverage_report(
        const fs::path& project_root,
        const std::string_view target_classes
    ) noexcept {
        try {
            auto logger = Logger::null();
            const auto query = ScopeQuery::from_lists({}, {}, target_classes);
            return read_coverage_report(project_root, query, core::Config::defaults(), logger);
        } catch (const std::exception& e) {
            return CoverageSummary::failure(std::string("Coverage analysis failed: ") + e.what());
        }
    }

}  // namespace covscope
