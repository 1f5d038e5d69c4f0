//
// Created by gregorian-rayne on 02/10/26.
//

#ifndef COVSCOPE_CONFIG_HPP
#define COVSCOPE_CONFIG_HPP

/**
 * @file config.hpp
 * @brief covscope configuration (TOML).
 *
 * Every key is optional; missing keys keep the defaults below. Example:
 * @code
 *     [locator]
 *     standards_file = "TESTING_STANDARDS.md"
 *     report_file_name = "jacocoTestReport.xml"
 *
 *     [filter]
 *     extra_exclusions = ["(^|\\.)config(\\.|$)"]
 *
 *     [aggregation]
 *     max_threads = 4
 * @endcode
 */

#include "covscope/result.hpp"
#include "covscope/error.hpp"
#include "covscope/logging.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace covscope::core {

    namespace fs = std::filesystem;

    /// Name of the per-project configuration file looked up at the root.
    inline constexpr auto PROJECT_CONFIG_FILE = "covscope.toml";

    enum class OutputFormat {
        Text,
        Json
    };

    struct LocatorConfig {
        std::string standards_file = "TESTING_STANDARDS.md";

        /// Aggregate report locations under the root, highest priority first.
        /// The root project's own test report is not an aggregate and is left
        /// to the recursive search.
        std::vector<std::string> root_report_paths = {
            "build/reports/jacoco/root/jacocoRootReport.xml",
            "build/reports/jacoco/jacocoRootReport/jacocoRootReport.xml"
        };

        /// Report location relative to a module directory
        std::string module_report_suffix = "build/reports/jacoco/test/jacocoTestReport.xml";

        /// File name matched by the recursive search
        std::string report_file_name = "jacocoTestReport.xml";
    };

    struct FilterConfig {
        bool use_builtin_exclusions = true;
        std::vector<std::string> extra_exclusions;
    };

    struct AggregationConfig {
        int max_threads = 0;  ///< 0 = hardware concurrency
    };

    struct OutputConfig {
        OutputFormat format = OutputFormat::Text;
    };

    struct LoggingConfig {
        Verbosity level = Verbosity::Normal;
    };

    class Config {
    public:
        Config() = default;

        LocatorConfig locator;
        FilterConfig filter;
        AggregationConfig aggregation;
        OutputConfig output;
        LoggingConfig logging;

        /**
         * Load configuration from a TOML file.
         *
         * @return The parsed and validated config, or NotFound/ConfigError.
         */
        static Result<Config> load_from_file(const fs::path& path);

        /**
         * Load configuration from TOML text.
         *
         * @return The parsed and validated config, or ConfigError.
         */
        static Result<Config> load_from_string(std::string_view content);

        /**
         * Loads <root>/covscope.toml when it exists, defaults otherwise.
         */
        static Result<Config> load_for_project(const fs::path& project_root);

        static Config defaults();

        /**
         * Checks for empty names, negative thread counts and exclusion
         * patterns that do not compile.
         */
        [[nodiscard]] Result<void> validate() const;

        /**
         * Serializes the configuration back to TOML.
         */
        [[nodiscard]] std::string to_string() const;
    };

    const char* to_string(OutputFormat format) noexcept;
    Result<OutputFormat> output_format_from_string(std::string_view str);

}  // namespace covscope::core

#endif //COVSCOPE_CONFIG_HPP
