//
// Created by gregorian-rayne on 02/14/26.
//

#ifndef COVSCOPE_SERVICE_HPP
#define COVSCOPE_SERVICE_HPP

/**
 * @file service.hpp
 * @brief Entry point tying discovery, filtering, parsing and aggregation.
 */

#include "covscope/types.hpp"
#include "covscope/logging.hpp"
#include "covscope/core/config.hpp"

#include <filesystem>
#include <string_view>

namespace covscope {

    namespace fs = std::filesystem;

    /**
     * Computes scope-local coverage for a project.
     *
     * Every problem (missing root, bad exclusion pattern, no reports, every
     * report unparsable) is returned as a failure summary; nothing is thrown.
     *
     * @param project_root Directory containing the project.
     * @param query Modules steer discovery; packages and classes narrow the
     *        classes that are counted.
     * @param config Locator, filter and aggregation settings.
     * @param logger Receives progress and per-file diagnostics.
     */
    [[nodiscard]] CoverageSummary read_coverage_report(
        const fs::path& project_root,
        const ScopeQuery& query,
        const core::Config& config,
        Logger& logger
    ) noexcept;

    /**
     * Same as above with default configuration and no logging.
     *
     * @param target_classes Comma-separated simple or qualified class names.
     */
    [[nodiscard]] CoverageSummary read_coverage_report(
        const fs::path& project_root,
        std::string_view target_classes = {}
    ) noexcept;

}  // namespace covscope

#endif //COVSCOPE_SERVICE_HPP
