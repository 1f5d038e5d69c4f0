//
// Created by gregorian-rayne on 02/12/26.
//

#ifndef COVSCOPE_REPORT_PARSER_HPP
#define COVSCOPE_REPORT_PARSER_HPP

/**
 * @file report_parser.hpp
 * @brief Coverage report parser interface.
 *
 * A parser turns one report into a ParseOutcome, consulting a ScopeFilter
 * for every class it meets so that out-of-scope classes never reach the
 * counters.
 */

#include "covscope/result.hpp"
#include "covscope/error.hpp"
#include "covscope/types.hpp"
#include "covscope/scope/scope_filter.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace covscope::parsers {

    namespace fs = std::filesystem;

    /**
     * Base interface for report parsers.
     *
     * Implementations must be stateless and thread-safe: the aggregator calls
     * parse_file() for many files concurrently on one instance.
     */
    class IReportParser {
    public:
        virtual ~IReportParser() = default;

        /**
         * Returns the parser name (e.g., "JaCoCo XML").
         */
        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        /**
         * Returns file extensions this parser can handle (e.g., {".xml"}).
         */
        [[nodiscard]] virtual std::vector<std::string> supported_extensions() const = 0;

        /**
         * Checks if this parser might handle the file, based on its path.
         */
        [[nodiscard]] virtual bool can_parse(const fs::path& path) const = 0;

        /**
         * Parses one report file.
         *
         * @param path Path to the report.
         * @param filter Scope filter applied to every class.
         * @return The per-file outcome, or NotFound/IoError/ParseError.
         */
        [[nodiscard]] virtual Result<ParseOutcome> parse_file(
            const fs::path& path,
            const scope::ScopeFilter& filter
        ) const = 0;

        /**
         * Parses report content held in memory.
         *
         * @param content The report document.
         * @param filter Scope filter applied to every class.
         * @param source_hint Recorded as ParseOutcome::source.
         */
        [[nodiscard]] virtual Result<ParseOutcome> parse_content(
            std::string_view content,
            const scope::ScopeFilter& filter,
            const fs::path& source_hint
        ) const = 0;
    };

}  // namespace covscope::parsers

#endif //COVSCOPE_REPORT_PARSER_HPP
