//
// Created by gregorian-rayne on 02/14/26.
//

#ifndef COVSCOPE_SUMMARY_JSON_HPP
#define COVSCOPE_SUMMARY_JSON_HPP

/**
 * @file summary_json.hpp
 * @brief JSON form of CoverageSummary.
 *
 * Wire shape (fixed for both variants):
 * @code
 *   {
 *     "success": true,
 *     "error": null,
 *     "line_coverage": 0.82,
 *     "branch_coverage": 0.64,
 *     "worst_classes": ["com.x.Foo", "com.x.Bar"]
 *   }
 * @endcode
 * A failure carries the message in "error", zero coverage and an empty list.
 */

#include "covscope/types.hpp"
#include "covscope/result.hpp"
#include "covscope/error.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace covscope::exporters {

    namespace fs = std::filesystem;
    using json = nlohmann::json;

    [[nodiscard]] json to_json(const CoverageSummary& summary);

    /**
     * Rebuilds a summary from its JSON form.
     *
     * @return The summary, or ParseError if a field is missing, mistyped or
     *         a coverage value lies outside [0, 1].
     */
    [[nodiscard]] Result<CoverageSummary> summary_from_json(const json& data);

    [[nodiscard]] std::string to_json_string(const CoverageSummary& summary, int indent = 2);

    [[nodiscard]] Result<void> save_summary(const fs::path& path, const CoverageSummary& summary);

    [[nodiscard]] Result<CoverageSummary> load_summary(const fs::path& path);

    [[nodiscard]] json to_json(const CoverageDelta& delta);

}  // namespace covscope::exporters

#endif //COVSCOPE_SUMMARY_JSON_HPP
