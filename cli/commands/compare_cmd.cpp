//
// Created by gregorian-rayne on 02/16/26.
//

#include "covscope/cli/commands/command.hpp"
#include "covscope/cli/formatter.hpp"

#include "covscope/covscope.hpp"

#include <iostream>

namespace covscope::cli
{
    /**
     * Compare command - compares two saved coverage summaries.
     */
    class CompareCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "compare";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Compare two saved coverage summaries";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: covscope compare <baseline.json> <current.json> [OPTIONS]\n"
                   "\n"
                   "Both files are JSON summaries written by 'covscope report --save'.\n"
                   "\n"
                   "Examples:\n"
                   "  covscope compare before.json after.json\n"
                   "  covscope compare before.json after.json --json";
        }

        [[nodiscard]] std::string validate(const CommandLine& line) const override {
            if (line.positional.size() < 2) {
                return "Usage: covscope compare <baseline.json> <current.json>";
            }
            return "";
        }

        [[nodiscard]] int execute(const CommandLine& line) override {
            if (line.flags.help) {
                print_help(std::cout);
                return 0;
            }

            apply_common_flags(line.flags);

            const fs::path baseline_path = line.positional[0];
            const fs::path current_path = line.positional[1];

            auto baseline = exporters::load_summary(baseline_path);
            if (baseline.is_err()) {
                print_error("Failed to load baseline: " + baseline.error().to_string());
                return 1;
            }
            auto current = exporters::load_summary(current_path);
            if (current.is_err()) {
                print_error("Failed to load current summary: " + current.error().to_string());
                return 1;
            }

            auto delta = aggregator::compare_summaries(baseline.value(), current.value());
            if (delta.is_err()) {
                print_error("Comparison failed: " + delta.error().to_string());
                return 1;
            }

            if (is_json()) {
                std::cout << exporters::to_json(delta.value()).dump(2) << "\n";
            } else {
                std::cout << baseline_path.string() << " -> " << current_path.string() << "\n\n";
                SummaryPrinter(std::cout).print_delta(delta.value());
            }
            return 0;
        }
    };

    std::unique_ptr<Command> make_compare_command() {
        return std::make_unique<CompareCommand>();
    }
}  // namespace covscope::cli
