//
// Created by gregorian-rayne on 02/11/26.
//

#ifndef COVSCOPE_REPORT_LOCATOR_HPP
#define COVSCOPE_REPORT_LOCATOR_HPP

/**
 * @file report_locator.hpp
 * @brief Discovery of coverage report files under a project root.
 *
 * Resolution tiers, first success wins:
 * 1. Override: a "Report Path:" / "Jacoco ... Report:" directive in the
 *    standards document, if the path it names exists.
 * 2. Module: <root>/<module>/<module_report_suffix> for every target module
 *    whose report exists.
 * 3. RootConventional: the first existing path of root_report_paths.
 * 4. RecursiveSearch: every file named report_file_name under the root.
 */

#include "covscope/types.hpp"
#include "covscope/result.hpp"
#include "covscope/logging.hpp"
#include "covscope/core/config.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace covscope::locator {

    namespace fs = std::filesystem;

    /**
     * Tier that produced a set of report files.
     */
    enum class LocatorTier {
        None,
        Override,
        Module,
        RootConventional,
        RecursiveSearch
    };

    const char* tier_to_string(LocatorTier tier) noexcept;

    /**
     * Located report files, absolute and de-duplicated, in priority order.
     */
    struct LocatedReports {
        LocatorTier tier = LocatorTier::None;
        std::vector<fs::path> files;

        [[nodiscard]] bool empty() const noexcept { return files.empty(); }
    };

    /**
     * Extracts the report path directive from standards document text.
     *
     * Matches "(?:Report Path|Jacoco.*Report):\s*(\S+)" case-insensitively
     * and strips surrounding backticks or quotes.
     *
     * @return The raw path text, or nullopt if no directive is present.
     */
    [[nodiscard]] std::optional<std::string> find_report_path_directive(std::string_view content);

    class ReportLocator {
    public:
        ReportLocator(core::LocatorConfig settings, Logger& logger);

        /**
         * Resolves the report files for a query.
         *
         * @param project_root Directory to search.
         * @param query Only target_modules is consulted.
         * @return The located files (possibly empty), or NotFound if the root
         *         is not a directory.
         */
        [[nodiscard]] Result<LocatedReports> locate(
            const fs::path& project_root,
            const ScopeQuery& query
        ) const;

        [[nodiscard]] const core::LocatorConfig& settings() const noexcept { return settings_; }

    private:
        [[nodiscard]] std::optional<fs::path> resolve_override(const fs::path& root) const;
        [[nodiscard]] std::vector<fs::path> resolve_modules(const fs::path& root, const ScopeQuery& query) const;
        [[nodiscard]] std::optional<fs::path> resolve_root_conventional(const fs::path& root) const;
        [[nodiscard]] std::vector<fs::path> resolve_recursive(const fs::path& root) const;

        core::LocatorConfig settings_;
        Logger& logger_;
    };

}  // namespace covscope::locator

#endif //COVSCOPE_REPORT_LOCATOR_HPP
