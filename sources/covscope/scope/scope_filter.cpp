//
// Created by gregorian-rayne on 02/11/26.
//

#include "covscope/scope/scope_filter.hpp"
#include "covscope/utils/string_utils.hpp"

#include <algorithm>

namespace covscope::scope
{
    namespace {

        constexpr auto REGEX_FLAGS = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

        std::vector<std::regex> compile_builtins() {
            std::vector<std::regex> compiled;
            compiled.reserve(builtin_exclusions().size());
            for (const auto& exclusion : builtin_exclusions()) {
                compiled.emplace_back(exclusion.pattern, REGEX_FLAGS);
            }
            return compiled;
        }

    }  // namespace

    const std::vector<ExclusionPattern>& builtin_exclusions() {
        static const std::vector<ExclusionPattern> patterns = {
            {"generated", R"((^|\.)generated(\.|$))"},
            {"dto", R"((^|\.)dtos?(\.|$))"},
            {"model", R"((^|\.)models?(\.|$))"},
            {"exception", R"((^|\.)exceptions?(\.|$))"},
        };
        return patterns;
    }

    ScopeFilter::ScopeFilter(ScopeQuery query)
        : ScopeFilter(std::move(query), compile_builtins()) {
    }

    ScopeFilter::ScopeFilter(ScopeQuery query, std::vector<std::regex> exclusions)
        : query_(std::move(query))
        , exclusions_(std::move(exclusions)) {
    }

    Result<ScopeFilter> ScopeFilter::create(
        ScopeQuery query,
        const std::vector<std::string>& extra_exclusions,
        const bool use_builtin_exclusions
    ) {
        std::vector<std::regex> exclusions;
        if (use_builtin_exclusions) {
            exclusions = compile_builtins();
        }

        for (const auto& pattern : extra_exclusions) {
            try {
                exclusions.emplace_back(pattern, REGEX_FLAGS);
            } catch (const std::regex_error& e) {
                return Result<ScopeFilter>::failure(
                    Error::config_error("Invalid exclusion pattern: " + pattern, e.what())
                );
            }
        }

        return Result<ScopeFilter>::success(ScopeFilter(std::move(query), std::move(exclusions)));
    }

    bool ScopeFilter::matches_exclusion(const std::string_view class_name) const {
        return std::ranges::any_of(exclusions_, [class_name](const std::regex& re) {
            return std::regex_search(class_name.begin(), class_name.end(), re);
        });
    }

    bool ScopeFilter::matches_targets(const std::string_view class_name) const {
        const bool package_match = std::ranges::any_of(query_.target_packages, [class_name](const std::string& pkg) {
            return string_utils::starts_with(class_name, pkg);
        });
        if (package_match) {
            return true;
        }

        return std::ranges::any_of(query_.target_classes, [class_name](const std::string& target) {
            if (class_name == target) {
                return true;
            }
            // Simple names match the last segment of a qualified name
            return class_name.size() > target.size() &&
                   string_utils::ends_with(class_name, target) &&
                   class_name[class_name.size() - target.size() - 1] == '.';
        });
    }

    bool ScopeFilter::is_included(const std::string_view class_name) const {
        if (matches_exclusion(class_name)) {
            return false;
        }
        if (!query_.has_class_scope()) {
            return true;
        }
        return matches_targets(class_name);
    }

    bool is_in_scope(const std::string_view class_name, const ScopeQuery& query) {
        return ScopeFilter(query).is_included(class_name);
    }

}  // namespace covscope::scope
