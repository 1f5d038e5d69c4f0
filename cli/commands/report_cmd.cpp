//
// Created by gregorian-rayne on 02/16/26.
//

#include "covscope/cli/commands/command.hpp"
#include "covscope/cli/formatter.hpp"

#include "covscope/covscope.hpp"

#include <iostream>
#include <sstream>

namespace covscope::cli
{
    /**
     * Report command - computes scope-local coverage for a project.
     */
    class ReportCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "report";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Summarize line and branch coverage for a project, module, package or class set";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: covscope report <project-root> [OPTIONS]\n"
                   "\n"
                   "Locates the project's JaCoCo XML reports, keeps the classes in scope\n"
                   "and prints line/branch coverage plus the 20 worst covered classes.\n"
                   "\n"
                   "Examples:\n"
                   "  covscope report .\n"
                   "  covscope report . --modules core,api\n"
                   "  covscope report . --classes UserService,AuthController --json\n"
                   "  covscope report . --save coverage.json\n"
                   "  covscope report . --baseline coverage.json";
        }

        [[nodiscard]] std::vector<OptionSpec> options() const override {
            return {
                {"modules", 'm', "LIST", "Comma-separated module directories"},
                {"packages", 'p', "LIST", "Comma-separated package prefixes"},
                {"classes", 'c', "LIST", "Comma-separated simple or qualified class names"},
                {"config", 0, "FILE", "Configuration file (default: <root>/covscope.toml)"},
                {"output", 'o', "FILE", "Write output to a file instead of stdout"},
                {"jobs", 'j', "N", "Parallel parse workers (0 = auto)"},
                {"save", 0, "FILE", "Also write the JSON summary to a file"},
                {"baseline", 'b', "FILE", "Compare against a saved JSON summary"},
            };
        }

        [[nodiscard]] std::string validate(const CommandLine& line) const override {
            if (line.positional.empty()) {
                return "Usage: covscope report <project-root>";
            }
            if (line.has("jobs")) {
                const auto jobs = line.get_int("jobs");
                if (!jobs || *jobs < 0) {
                    return "--jobs must be a non-negative integer";
                }
            }
            return "";
        }

        [[nodiscard]] int execute(const CommandLine& line) override {
            if (line.flags.help) {
                print_help(std::cout);
                return 0;
            }

            apply_common_flags(line.flags);

            const fs::path project_root = line.positional[0];
            auto config_result = load_config(line, project_root);
            if (config_result.is_err()) {
                print_error(config_result.error().to_string());
                return 1;
            }
            auto config = std::move(config_result).value();
            if (const auto jobs = line.get_int("jobs")) {
                config.aggregation.max_threads = *jobs;
            }

            const auto query = ScopeQuery::from_lists(
                line.get_or("modules", ""),
                line.get_or("packages", ""),
                line.get_or("classes", "")
            );

            auto logger = Logger::console(verbosity());
            const auto summary = read_coverage_report(project_root, query, config, logger);

            if (const auto save_path = line.get("save")) {
                if (auto saved = exporters::save_summary(*save_path, summary); saved.is_err()) {
                    print_error("Failed to save summary: " + saved.error().to_string());
                    return 1;
                }
                print_verbose("Summary saved to " + *save_path);
            }

            std::optional<CoverageDelta> delta;
            if (const auto baseline_path = line.get("baseline")) {
                auto baseline = exporters::load_summary(*baseline_path);
                if (baseline.is_err()) {
                    print_error("Failed to load baseline: " + baseline.error().to_string());
                    return 1;
                }
                if (summary.is_success()) {
                    auto compared = aggregator::compare_summaries(baseline.value(), summary);
                    if (compared.is_err()) {
                        print_error(compared.error().to_string());
                        return 1;
                    }
                    delta = std::move(compared).value();
                }
            }

            std::ostringstream rendered;
            const auto output_path = line.get("output");
            if (output_path) {
                colors::set_enabled(false);
            }

            if (is_json()) {
                if (delta) {
                    exporters::json j;
                    j["summary"] = exporters::to_json(summary);
                    j["delta"] = exporters::to_json(*delta);
                    rendered << j.dump(2) << "\n";
                } else {
                    rendered << exporters::to_json_string(summary) << "\n";
                }
            } else {
                const SummaryPrinter printer(rendered);
                printer.print_summary(summary);
                if (delta) {
                    rendered << "\n";
                    printer.print_delta(*delta);
                }
            }

            if (output_path) {
                if (auto written = file_utils::write_file(*output_path, rendered.str()); written.is_err()) {
                    print_error(written.error().to_string());
                    return 1;
                }
                print_verbose("Report written to " + *output_path);
            } else {
                std::cout << rendered.str();
            }

            return summary.is_success() ? 0 : 1;
        }
    };

    std::unique_ptr<Command> make_report_command() {
        return std::make_unique<ReportCommand>();
    }
}  // namespace covscope::cli
