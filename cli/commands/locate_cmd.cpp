//
// Created by gregorian-rayne on 02/16/26.
//

#include "covscope/cli/commands/command.hpp"
#include "covscope/cli/formatter.hpp"

#include "covscope/covscope.hpp"
#include "covscope/locator/report_locator.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

namespace covscope::cli
{
    /**
     * Locate command - shows which report files a report run would read.
     */
    class LocateCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "locate";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Show the coverage report files resolved for a project";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: covscope locate <project-root> [OPTIONS]\n"
                   "\n"
                   "Examples:\n"
                   "  covscope locate .\n"
                   "  covscope locate . --modules core,api";
        }

        [[nodiscard]] std::vector<OptionSpec> options() const override {
            return {
                {"modules", 'm', "LIST", "Comma-separated module directories"},
                {"config", 0, "FILE", "Configuration file (default: <root>/covscope.toml)"},
            };
        }

        [[nodiscard]] std::string validate(const CommandLine& line) const override {
            if (line.positional.empty()) {
                return "Usage: covscope locate <project-root>";
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
            auto config = load_config(line, project_root);
            if (config.is_err()) {
                print_error(config.error().to_string());
                return 1;
            }

            const auto query = ScopeQuery::from_lists(line.get_or("modules", ""), "", "");
            auto logger = Logger::console(verbosity());
            const locator::ReportLocator report_locator(config.value().locator, logger);

            auto located = report_locator.locate(project_root, query);
            if (located.is_err()) {
                print_error(located.error().to_string());
                return 1;
            }

            const auto& reports = located.value();
            if (is_json()) {
                nlohmann::json j;
                j["tier"] = locator::tier_to_string(reports.tier);
                j["files"] = nlohmann::json::array();
                for (const auto& file : reports.files) {
                    j["files"].push_back(file.string());
                }
                std::cout << j.dump(2) << "\n";
            } else if (reports.empty()) {
                print_error("No coverage reports found under " + project_root.string());
            } else {
                SummaryPrinter(std::cout).print_located(reports);
            }

            return reports.empty() ? 1 : 0;
        }
    };

    std::unique_ptr<Command> make_locate_command() {
        return std::make_unique<LocateCommand>();
    }
}  // namespace covscope::cli
