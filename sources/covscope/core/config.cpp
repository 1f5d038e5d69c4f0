//
// Created by gregorian-rayne on 02/10/26.
//

#include "covscope/core/config.hpp"
#include "covscope/utils/file_utils.hpp"
#include "covscope/utils/string_utils.hpp"

#include <toml++/toml.h>

#include <limits>
#include <regex>
#include <sstream>

namespace covscope::core
{
    namespace {

        std::vector<std::string> read_string_array(const toml::node_view<toml::node> node) {
            std::vector<std::string> values;
            if (const auto* array = node.as_array()) {
                for (const auto& element : *array) {
                    if (auto value = element.value<std::string>()) {
                        values.push_back(std::move(*value));
                    }
                }
            }
            return values;
        }

        toml::array make_string_array(const std::vector<std::string>& values) {
            toml::array array;
            for (const auto& value : values) {
                array.push_back(value);
            }
            return array;
        }

    }  // namespace

    const char* to_string(const OutputFormat format) noexcept {
        switch (format) {
            case OutputFormat::Text: return "text";
            case OutputFormat::Json: return "json";
        }
        return "text";
    }

    Result<OutputFormat> output_format_from_string(const std::string_view str) {
        const auto lower = string_utils::to_lower(string_utils::trim(str));
        if (lower == "text") return Result<OutputFormat>::success(OutputFormat::Text);
        if (lower == "json") return Result<OutputFormat>::success(OutputFormat::Json);
        return Result<OutputFormat>::failure(
            Error::config_error("Unknown output format", std::string(str))
        );
    }

    Config Config::defaults() {
        return Config{};
    }

    Result<Config> Config::load_from_file(const fs::path& path) {
        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<Config>::failure(content.error());
        }

        return load_from_string(content.value()).with_context(path.string());
    }

    Result<Config> Config::load_from_string(const std::string_view content) {
        Config config;

        try {
            auto tbl = toml::parse(content);

            if (auto locator = tbl["locator"]; locator.is_table()) {
                if (auto v = locator["standards_file"].value<std::string>())
                    config.locator.standards_file = *v;
                if (locator["root_report_paths"].is_array())
                    config.locator.root_report_paths = read_string_array(locator["root_report_paths"]);
                if (auto v = locator["module_report_suffix"].value<std::string>())
                    config.locator.module_report_suffix = *v;
                if (auto v = locator["report_file_name"].value<std::string>())
                    config.locator.report_file_name = *v;
            }

            if (auto filter = tbl["filter"]; filter.is_table()) {
                if (auto v = filter["use_builtin_exclusions"].value<bool>())
                    config.filter.use_builtin_exclusions = *v;
                if (filter["extra_exclusions"].is_array())
                    config.filter.extra_exclusions = read_string_array(filter["extra_exclusions"]);
            }

            if (auto aggregation = tbl["aggregation"]; aggregation.is_table()) {
                if (auto v = aggregation["max_threads"].value<int64_t>()) {
                    if (*v < std::numeric_limits<int>::min() || *v > std::numeric_limits<int>::max()) {
                        return Result<Config>::failure(
                            Error::config_error("aggregation.max_threads is out of range", std::to_string(*v))
                        );
                    }
                    config.aggregation.max_threads = static_cast<int>(*v);
                }
            }

            if (auto output = tbl["output"]; output.is_table()) {
                if (auto v = output["format"].value<std::string>()) {
                    auto format = output_format_from_string(*v);
                    if (format.is_err()) {
                        return Result<Config>::failure(format.error());
                    }
                    config.output.format = format.value();
                }
            }

            if (auto logging = tbl["logging"]; logging.is_table()) {
                if (auto v = logging["level"].value<std::string>()) {
                    auto level = verbosity_from_string(*v);
                    if (level.is_err()) {
                        return Result<Config>::failure(level.error());
                    }
                    config.logging.level = level.value();
                }
            }
        } catch (const toml::parse_error& err) {
            std::ostringstream where;
            where << "line " << err.source().begin.line << ", column " << err.source().begin.column;
            return Result<Config>::failure(
                Error::config_error("Invalid TOML: " + std::string(err.description()), where.str())
            );
        }

        if (auto valid = config.validate(); valid.is_err()) {
            return Result<Config>::failure(valid.error());
        }

        return Result<Config>::success(std::move(config));
    }

    Result<Config> Config::load_for_project(const fs::path& project_root) {
        const auto path = project_root / PROJECT_CONFIG_FILE;
        if (!file_utils::is_regular_file(path)) {
            return Result<Config>::success(defaults());
        }
        return load_from_file(path);
    }

    Result<void> Config::validate() const {
        if (string_utils::trim(locator.standards_file).empty()) {
            return Result<void>::failure(Error::config_error("locator.standards_file must not be empty"));
        }
        if (string_utils::trim(locator.module_report_suffix).empty()) {
            return Result<void>::failure(Error::config_error("locator.module_report_suffix must not be empty"));
        }
        if (string_utils::trim(locator.report_file_name).empty()) {
            return Result<void>::failure(Error::config_error("locator.report_file_name must not be empty"));
        }
        for (const auto& path : locator.root_report_paths) {
            if (string_utils::trim(path).empty()) {
                return Result<void>::failure(Error::config_error("locator.root_report_paths contains an empty entry"));
            }
        }
        if (aggregation.max_threads < 0) {
            return Result<void>::failure(
                Error::config_error("aggregation.max_threads must be >= 0", std::to_string(aggregation.max_threads))
            );
        }
        for (const auto& pattern : filter.extra_exclusions) {
            try {
                std::regex compiled(pattern, std::regex::ECMAScript | std::regex::icase);
                (void)compiled;
            } catch (const std::regex_error& e) {
                return Result<void>::failure(
                    Error::config_error("Invalid exclusion pattern: " + pattern, e.what())
                );
            }
        }
        return Result<void>::success();
    }

    std::string Config::to_string() const {
        toml::table tbl;

        tbl.insert_or_assign("locator", toml::table{
            {"standards_file", locator.standards_file},
            {"root_report_paths", make_string_array(locator.root_report_paths)},
            {"module_report_suffix", locator.module_report_suffix},
            {"report_file_name", locator.report_file_name},
        });

        tbl.insert_or_assign("filter", toml::table{
            {"use_builtin_exclusions", filter.use_builtin_exclusions},
            {"extra_exclusions", make_string_array(filter.extra_exclusions)},
        });

        tbl.insert_or_assign("aggregation", toml::table{
            {"max_threads", static_cast<int64_t>(aggregation.max_threads)},
        });

        tbl.insert_or_assign("output", toml::table{
            {"format", std::string(core::to_string(output.format))},
        });

        tbl.insert_or_assign("logging", toml::table{
            {"level", std::string(verbosity_to_string(logging.level))},
        });

        std::ostringstream ss;
        ss << tbl;
        return ss.str();
    }

}  // namespace covscope::core
