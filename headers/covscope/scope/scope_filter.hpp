//
// Created by gregorian-rayne on 02/11/26.
//

#ifndef COVSCOPE_SCOPE_FILTER_HPP
#define COVSCOPE_SCOPE_FILTER_HPP

/**
 * @file scope_filter.hpp
 * @brief Include/exclude decision for one fully qualified class name.
 *
 * Rules, first match wins:
 * 1. A class matching any exclusion pattern is excluded, even when it is
 *    listed in target_classes.
 * 2. With no package and no class targets, every class is included.
 * 3. Otherwise a class is included only if it starts with a target package,
 *    or equals a target class, or ends with "." + a target class.
 *
 * target_modules is ignored here; it only steers report discovery.
 */

#include "covscope/types.hpp"
#include "covscope/result.hpp"

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace covscope::scope {

    /**
     * A named exclusion regex.
     */
    struct ExclusionPattern {
        std::string marker;   ///< e.g. "generated"
        std::string pattern;  ///< ECMAScript regex, matched case-insensitively
    };

    /**
     * Patterns for generated code, DTO, model and exception packages.
     */
    const std::vector<ExclusionPattern>& builtin_exclusions();

    /**
     * Immutable, thread-safe class filter for one ScopeQuery.
     */
    class ScopeFilter {
    public:
        /**
         * Filter with the built-in exclusions only.
         */
        explicit ScopeFilter(ScopeQuery query);

        /**
         * Filter with optional built-ins plus caller supplied patterns.
         *
         * @return ConfigError if an extra pattern does not compile.
         */
        static Result<ScopeFilter> create(
            ScopeQuery query,
            const std::vector<std::string>& extra_exclusions,
            bool use_builtin_exclusions = true
        );

        /**
         * Decides whether a dot-separated class name is in scope.
         */
        [[nodiscard]] bool is_included(std::string_view class_name) const;

        /**
         * True if any exclusion pattern matches (rule 1 alone).
         */
        [[nodiscard]] bool matches_exclusion(std::string_view class_name) const;

        [[nodiscard]] const ScopeQuery& query() const noexcept { return query_; }

        [[nodiscard]] std::size_t exclusion_count() const noexcept { return exclusions_.size(); }

    private:
        ScopeFilter(ScopeQuery query, std::vector<std::regex> exclusions);

        [[nodiscard]] bool matches_targets(std::string_view class_name) const;

        ScopeQuery query_;
        std::vector<std::regex> exclusions_;
    };

    /**
     * One-shot form of ScopeFilter(query).is_included(class_name).
     */
    [[nodiscard]] bool is_in_scope(std::string_view class_name, const ScopeQuery& query);

}  // namespace covscope::scope

#endif //COVSCOPE_SCOPE_FILTER_HPP
