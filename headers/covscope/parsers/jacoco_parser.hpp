//
// Created by gregorian-rayne on 02/12/26.
//

#ifndef COVSCOPE_JACOCO_PARSER_HPP
#define COVSCOPE_JACOCO_PARSER_HPP

/**
 * @file jacoco_parser.hpp
 * @brief Streaming parser for JaCoCo XML reports.
 *
 * The document is read forward-only with libxml2's xmlTextReader, so memory
 * stays proportional to one class element. Relevant structure:
 *
 *   <report>
 *     <package name="com/x">
 *       <class name="com/x/Foo">
 *         <method ...><counter .../></method>
 *         <counter type="LINE" missed="2" covered="8"/>
 *         <counter type="BRANCH" missed="1" covered="3"/>
 *       </class>
 *     </package>
 *   </report>
 *
 * Only counters that are direct children of <class> are read. The external
 * report.dtd is never loaded.
 */

#include "covscope/parsers/report_parser.hpp"

namespace covscope::parsers {

    class JacocoXmlParser : public IReportParser {
    public:
        /**
         * Initializes libxml2. Construct before starting worker threads.
         */
        JacocoXmlParser();

        [[nodiscard]] std::string_view name() const noexcept override {
            return "JaCoCo XML";
        }

        [[nodiscard]] std::vector<std::string> supported_extensions() const override {
            return {".xml"};
        }

        [[nodiscard]] bool can_parse(const fs::path& path) const override;

        [[nodiscard]] Result<ParseOutcome> parse_file(
            const fs::path& path,
            const scope::ScopeFilter& filter
        ) const override;

        [[nodiscard]] Result<ParseOutcome> parse_content(
            std::string_view content,
            const scope::ScopeFilter& filter,
            const fs::path& source_hint
        ) const override;
    };

}  // namespace covscope::parsers

#endif //COVSCOPE_JACOCO_PARSER_HPP
