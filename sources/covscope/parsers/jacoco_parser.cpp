//
// Created by gregorian-rayne on 02/12/26.
//

#include "covscope/parsers/jacoco_parser.hpp"
#include "covscope/utils/file_utils.hpp"
#include "covscope/utils/string_utils.hpp"

#include <libxml/parser.h>
#include <libxml/xmlreader.h>

#include <charconv>
#include <climits>
#include <cstring>
#include <fstream>
#include <memory>
#include <optional>

namespace covscope::parsers {

    namespace {

        constexpr std::string_view REPORT_ELEMENT = "report";
        constexpr std::string_view CLASS_ELEMENT = "class";
        constexpr std::string_view COUNTER_ELEMENT = "counter";
        constexpr std::string_view LINE_COUNTER = "LINE";
        constexpr std::string_view BRANCH_COUNTER = "BRANCH";

        // Network access off; DTD loading stays off because DTDLOAD is not set.
        constexpr int READER_OPTIONS = XML_PARSE_NONET | XML_PARSE_NOBLANKS;

        struct ReaderDeleter {
            void operator()(xmlTextReaderPtr reader) const noexcept {
                xmlFreeTextReader(reader);
            }
        };

        using ReaderPtr = std::unique_ptr<xmlTextReader, ReaderDeleter>;

        /**
         * First error reported by libxml2 for one document.
         */
        struct ErrorState {
            std::string message;
            int line = 0;

            [[nodiscard]] bool has_error() const noexcept { return !message.empty(); }
        };

        void on_reader_error(
            void* arg,
            const char* msg,
            const xmlParserSeverities severity,
            const xmlTextReaderLocatorPtr locator
        ) {
            if (severity != XML_PARSER_SEVERITY_ERROR &&
                severity != XML_PARSER_SEVERITY_VALIDITY_ERROR) {
                return;
            }
            auto* state = static_cast<ErrorState*>(arg);
            if (state->has_error()) {
                return;
            }
            state->message = msg != nullptr ? std::string(string_utils::trim(msg)) : "unknown XML error";
            if (locator != nullptr) {
                state->line = xmlTextReaderLocatorLineNumber(locator);
            }
        }

        std::string_view local_name(xmlTextReaderPtr reader) {
            const xmlChar* name = xmlTextReaderConstLocalName(reader);
            if (name == nullptr) {
                return {};
            }
            return reinterpret_cast<const char*>(name);
        }

        std::optional<std::string> attribute(xmlTextReaderPtr reader, const char* attr) {
            xmlChar* value = xmlTextReaderGetAttribute(reader, reinterpret_cast<const xmlChar*>(attr));
            if (value == nullptr) {
                return std::nullopt;
            }
            std::string result(reinterpret_cast<const char*>(value));
            xmlFree(value);
            return result;
        }

        bool is_element(xmlTextReaderPtr reader, const std::string_view name) {
            return xmlTextReaderNodeType(reader) == XML_READER_TYPE_ELEMENT && local_name(reader) == name;
        }

        Result<std::uint64_t> parse_count(
            xmlTextReaderPtr reader,
            const char* attr,
            const std::string& class_name
        ) {
            const auto text = attribute(reader, attr);
            if (!text) {
                return Result<std::uint64_t>::failure(
                    Error::parse_error("Counter is missing attribute '" + std::string(attr) + "'", class_name)
                );
            }

            std::uint64_t value = 0;
            const char* first = text->data();
            const char* last = text->data() + text->size();
            const auto [ptr, ec] = std::from_chars(first, last, value);
            if (ec != std::errc{} || ptr != last || text->empty()) {
                return Result<std::uint64_t>::failure(
                    Error::parse_error(
                        "Invalid counter value " + std::string(attr) + "=\"" + *text + "\"",
                        class_name
                    )
                );
            }
            return Result<std::uint64_t>::success(value);
        }

        Result<Counter> parse_counter(xmlTextReaderPtr reader, const std::string& class_name) {
            auto missed = parse_count(reader, "missed", class_name);
            if (missed.is_err()) {
                return Result<Counter>::failure(missed.error());
            }
            auto covered = parse_count(reader, "covered", class_name);
            if (covered.is_err()) {
                return Result<Counter>::failure(covered.error());
            }
            return Result<Counter>::success(Counter{missed.value(), covered.value()});
        }

        /**
         * Line and branch counters of one class.
         */
        struct ClassCounters {
            Counter line;
            Counter branch;
            bool has_line = false;
            bool has_branch = false;
        };

        /**
         * Reads the direct counter children of the current <class> element.
         * On success the reader is left on the class end tag.
         */
        Result<ClassCounters> read_class_counters(
            xmlTextReaderPtr reader,
            const std::string& class_name
        ) {
            ClassCounters counters;
            if (xmlTextReaderIsEmptyElement(reader) == 1) {
                return Result<ClassCounters>::success(counters);
            }

            const int class_depth = xmlTextReaderDepth(reader);
            int ret = 0;
            while ((ret = xmlTextReaderRead(reader)) == 1) {
                const int depth = xmlTextReaderDepth(reader);
                const int type = xmlTextReaderNodeType(reader);

                if (type == XML_READER_TYPE_END_ELEMENT && depth == class_depth) {
                    return Result<ClassCounters>::success(counters);
                }
                if (type != XML_READER_TYPE_ELEMENT || depth != class_depth + 1 ||
                    local_name(reader) != COUNTER_ELEMENT) {
                    continue;
                }

                const auto kind = attribute(reader, "type").value_or("");
                const bool wants_line = kind == LINE_COUNTER && !counters.has_line;
                const bool wants_branch = kind == BRANCH_COUNTER && !counters.has_branch;
                if (!wants_line && !wants_branch) {
                    continue;
                }

                auto counter = parse_counter(reader, class_name);
                if (counter.is_err()) {
                    return Result<ClassCounters>::failure(counter.error());
                }
                if (wants_line) {
                    counters.line = counter.value();
                    counters.has_line = true;
                } else {
                    counters.branch = counter.value();
                    counters.has_branch = true;
                }
            }

            if (ret < 0) {
                return Result<ClassCounters>::failure(Error::parse_error("Malformed XML", class_name));
            }
            return Result<ClassCounters>::failure(
                Error::parse_error("Unexpected end of document inside class", class_name)
            );
        }

        Error xml_failure(const ErrorState& state, const fs::path& source) {
            std::string message = "Malformed coverage report";
            if (state.has_error()) {
                message += ": " + state.message;
                if (state.line > 0) {
                    message += " (line " + std::to_string(state.line) + ")";
                }
            }
            return Error::parse_error(std::move(message), source.string());
        }

        Result<ParseOutcome> read_report(
            xmlTextReaderPtr reader,
            ErrorState& errors,
            const scope::ScopeFilter& filter,
            const fs::path& source
        ) {
            ParseOutcome outcome;
            outcome.source = source;
            bool seen_root = false;

            int ret = xmlTextReaderRead(reader);
            while (ret == 1) {
                if (xmlTextReaderNodeType(reader) != XML_READER_TYPE_ELEMENT) {
                    ret = xmlTextReaderRead(reader);
                    continue;
                }

                if (!seen_root) {
                    seen_root = true;
                    if (local_name(reader) != REPORT_ELEMENT) {
                        return Result<ParseOutcome>::failure(Error::parse_error(
                            "Not a JaCoCo report: root element is <" + std::string(local_name(reader)) + ">",
                            source.string()
                        ));
                    }
                }

                if (!is_element(reader, CLASS_ELEMENT)) {
                    ret = xmlTextReaderRead(reader);
                    continue;
                }

                const auto raw_name = attribute(reader, "name");
                if (!raw_name || raw_name->empty()) {
                    return Result<ParseOutcome>::failure(
                        Error::parse_error("Class element without a name", source.string())
                    );
                }
                const std::string class_name = string_utils::replace_char(*raw_name, '/', '.');

                if (!filter.is_included(class_name)) {
                    ++outcome.excluded_classes;
                    // Skips the whole subtree; the reader lands on the following node.
                    ret = xmlTextReaderNext(reader);
                    continue;
                }

                auto counters = read_class_counters(reader, class_name);
                if (counters.is_err()) {
                    if (errors.has_error()) {
                        return Result<ParseOutcome>::failure(xml_failure(errors, source));
                    }
                    return Result<ParseOutcome>::failure(
                        counters.error().with_context(source.string())
                    );
                }

                ++outcome.included_classes;
                const auto& found = counters.value();
                outcome.line += found.line;
                outcome.branch += found.branch;
                if (found.line.total() > 0) {
                    outcome.classes.push_back(ClassCoverageRecord{class_name, found.line});
                }

                ret = xmlTextReaderRead(reader);
            }

            if (ret < 0 || errors.has_error()) {
                return Result<ParseOutcome>::failure(xml_failure(errors, source));
            }
            if (!seen_root) {
                return Result<ParseOutcome>::failure(
                    Error::parse_error("Coverage report has no root element", source.string())
                );
            }
            return Result<ParseOutcome>::success(std::move(outcome));
        }

    }  // namespace

    JacocoXmlParser::JacocoXmlParser() {
        xmlInitParser();
    }

    bool JacocoXmlParser::can_parse(const fs::path& path) const {
        return string_utils::to_lower(path.extension().string()) == ".xml";
    }

    Result<ParseOutcome> JacocoXmlParser::parse_file(
        const fs::path& path,
        const scope::ScopeFilter& filter
    ) const {
        if (!file_utils::is_regular_file(path)) {
            return Result<ParseOutcome>::failure(
                Error::not_found("Coverage report not found", path.string())
            );
        }
        if (std::ifstream stream(path, std::ios::binary); !stream) {
            return Result<ParseOutcome>::failure(
                Error::io_error("Failed to open coverage report", path.string())
            );
        }

        const std::string file_name = path.string();
        ReaderPtr reader(xmlReaderForFile(file_name.c_str(), nullptr, READER_OPTIONS));
        if (!reader) {
            return Result<ParseOutcome>::failure(
                Error::io_error("Failed to open coverage report", file_name)
            );
        }

        ErrorState errors;
        xmlTextReaderSetErrorHandler(reader.get(), on_reader_error, &errors);
        return read_report(reader.get(), errors, filter, path);
    }

    Result<ParseOutcome> JacocoXmlParser::parse_content(
        const std::string_view content,
        const scope::ScopeFilter& filter,
        const fs::path& source_hint
    ) const {
        if (content.size() > static_cast<std::size_t>(INT_MAX)) {
            return Result<ParseOutcome>::failure(
                Error::invalid_argument("Coverage report too large for in-memory parsing", source_hint.string())
            );
        }

        const std::string url = source_hint.string();
        ReaderPtr reader(xmlReaderForMemory(
            content.data(),
            static_cast<int>(content.size()),
            url.empty() ? nullptr : url.c_str(),
            nullptr,
            READER_OPTIONS
        ));
        if (!reader) {
            return Result<ParseOutcome>::failure(
                Error::parse_error("Failed to create XML reader", url)
            );
        }

        ErrorState errors;
        xmlTextReaderSetErrorHandler(reader.get(), on_reader_error, &errors);
        return read_report(reader.get(), errors, filter, source_hint);
    }

}  // namespace covscope::parsers
