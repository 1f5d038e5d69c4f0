//
// Created by gregorian-rayne on 02/15/26.
//

#include "covscope/aggregator/comparison.hpp"

#include <unordered_set>

namespace covscope::aggregator {

    namespace {

        std::vector<std::string> missing_from(
            const std::vector<std::string>& source,
            const std::vector<std::string>& other
        ) {
            const std::unordered_set<std::string> lookup(other.begin(), other.end());
            std::vector<std::string> result;
            for (const auto& name : source) {
                if (!lookup.contains(name)) {
                    result.push_back(name);
                }
            }
            return result;
        }

    }  // namespace

    Result<CoverageDelta> compare_summaries(
        const CoverageSummary& baseline,
        const CoverageSummary& current
    ) {
        if (!baseline.is_success()) {
            return Result<CoverageDelta>::failure(
                Error::invalid_argument("Baseline summary is a failure", baseline.error())
            );
        }
        if (!current.is_success()) {
            return Result<CoverageDelta>::failure(
                Error::invalid_argument("Current summary is a failure", current.error())
            );
        }

        const auto& before = baseline.metrics();
        const auto& after = current.metrics();

        CoverageDelta delta;
        delta.line_delta = after.line_coverage - before.line_coverage;
        delta.branch_delta = after.branch_coverage - before.branch_coverage;
        delta.improved_classes = missing_from(before.worst_classes, after.worst_classes);
        delta.new_worst_classes = missing_from(after.worst_classes, before.worst_classes);
        return Result<CoverageDelta>::success(std::move(delta));
    }

}  // namespace covscope::aggregator
