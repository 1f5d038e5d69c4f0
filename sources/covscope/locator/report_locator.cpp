//
// Created by gregorian-rayne on 02/11/26.
//

#include "covscope/locator/report_locator.hpp"
#include "covscope/utils/file_utils.hpp"
#include "covscope/utils/string_utils.hpp"

#include <algorithm>
#include <regex>
#include <unordered_set>

namespace covscope::locator
{
    namespace {

        std::vector<fs::path> normalize_unique(const std::vector<fs::path>& paths) {
            std::vector<fs::path> result;
            std::unordered_set<std::string> seen;
            result.reserve(paths.size());

            for (const auto& path : paths) {
                auto normalized = file_utils::normalize(path);
                if (seen.insert(normalized.string()).second) {
                    result.push_back(std::move(normalized));
                }
            }
            return result;
        }

    }  // namespace

    const char* tier_to_string(const LocatorTier tier) noexcept {
        switch (tier) {
            case LocatorTier::None:             return "none";
            case LocatorTier::Override:         return "override";
            case LocatorTier::Module:           return "module";
            case LocatorTier::RootConventional: return "root";
            case LocatorTier::RecursiveSearch:  return "search";
        }
        return "none";
    }

    std::optional<std::string> find_report_path_directive(const std::string_view content) {
        static const std::regex directive(
            R"((?:Report Path|Jacoco.*Report):\s*(\S+))",
            std::regex::ECMAScript | std::regex::icase
        );

        std::match_results<std::string_view::const_iterator> match;
        if (!std::regex_search(content.begin(), content.end(), match, directive)) {
            return std::nullopt;
        }

        const std::string raw = match[1].str();
        const auto value = string_utils::unquote(string_utils::trim(raw));
        if (value.empty()) {
            return std::nullopt;
        }
        return std::string(value);
    }

    ReportLocator::ReportLocator(core::LocatorConfig settings, Logger& logger)
        : settings_(std::move(settings))
        , logger_(logger) {
    }

    Result<LocatedReports> ReportLocator::locate(
        const fs::path& project_root,
        const ScopeQuery& query
    ) const {
        if (!file_utils::is_directory(project_root)) {
            return Result<LocatedReports>::failure(
                Error::not_found("Project root is not a directory", project_root.string())
            );
        }

        const auto root = file_utils::normalize(project_root);
        LocatedReports located;

        if (auto custom = resolve_override(root)) {
            logger_.verbose("Using report path from " + settings_.standards_file + ": " + custom->string());
            located.tier = LocatorTier::Override;
            located.files = normalize_unique({*custom});
            return Result<LocatedReports>::success(std::move(located));
        }

        if (!query.target_modules.empty()) {
            if (auto module_reports = resolve_modules(root, query); !module_reports.empty()) {
                logger_.verbose("Using " + std::to_string(module_reports.size()) + " module report(s)");
                located.tier = LocatorTier::Module;
                located.files = normalize_unique(module_reports);
                return Result<LocatedReports>::success(std::move(located));
            }
            logger_.verbose("No target module has a report; falling back to root locations");
        }

        if (auto aggregate = resolve_root_conventional(root)) {
            logger_.verbose("Using aggregate report: " + aggregate->string());
            located.tier = LocatorTier::RootConventional;
            located.files = normalize_unique({*aggregate});
            return Result<LocatedReports>::success(std::move(located));
        }

        if (auto found = resolve_recursive(root); !found.empty()) {
            logger_.verbose("Found " + std::to_string(found.size()) + " report(s) named " +
                            settings_.report_file_name);
            located.tier = LocatorTier::RecursiveSearch;
            located.files = normalize_unique(found);
        }

        return Result<LocatedReports>::success(std::move(located));
    }

    std::optional<fs::path> ReportLocator::resolve_override(const fs::path& root) const {
        const auto standards = root / settings_.standards_file;
        if (!file_utils::is_regular_file(standards)) {
            return std::nullopt;
        }

        auto content = file_utils::read_file(standards);
        if (content.is_err()) {
            logger_.warning("Cannot read " + standards.string() + ": " + content.error().to_string());
            return std::nullopt;
        }

        const auto directive = find_report_path_directive(content.value());
        if (!directive) {
            return std::nullopt;
        }

        auto custom = root / *directive;
        if (!file_utils::is_regular_file(custom)) {
            logger_.verbose("Report path in " + settings_.standards_file + " does not exist: " + custom.string());
            return std::nullopt;
        }
        return custom;
    }

    std::vector<fs::path> ReportLocator::resolve_modules(const fs::path& root, const ScopeQuery& query) const {
        std::vector<fs::path> reports;
        for (const auto& module : query.target_modules) {
            auto candidate = root / module / settings_.module_report_suffix;
            if (file_utils::is_regular_file(candidate)) {
                reports.push_back(std::move(candidate));
            } else {
                logger_.debug("No report for module " + module + " at " + candidate.string());
            }
        }
        return reports;
    }

    std::optional<fs::path> ReportLocator::resolve_root_conventional(const fs::path& root) const {
        for (const auto& relative : settings_.root_report_paths) {
            if (auto candidate = root / relative; file_utils::is_regular_file(candidate)) {
                return candidate;
            }
        }
        return std::nullopt;
    }

    std::vector<fs::path> ReportLocator::resolve_recursive(const fs::path& root) const {
        auto found = file_utils::find_files_named(root, settings_.report_file_name);
        if (found.is_err()) {
            logger_.warning("Report search failed: " + found.error().to_string());
            return {};
        }
        return std::move(found).value();
    }

}  // namespace covscope::locator
