//
// Created by gregorian-rayne on 02/16/26.
//

#include "covscope/cli/commands/command.hpp"
#include "covscope/version.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <exception>
#include <memory>
#include <string>
#include <vector>

namespace {

    using CommandList = std::vector<std::unique_ptr<covscope::cli::Command>>;

    /// In the order they are listed by `covscope help`.
    CommandList make_commands() {
        CommandList commands;
        commands.push_back(covscope::cli::make_report_command());
        commands.push_back(covscope::cli::make_compare_command());
        commands.push_back(covscope::cli::make_locate_command());
        return commands;
    }

    void print_help(const CommandList& commands) {
        std::cout << covscope::PROJECT_NAME << " " << covscope::VERSION_STRING << "\n\n";
        std::cout << "Usage: covscope <command> [OPTIONS]\n\n";
        std::cout << "Commands:\n";
        for (const auto& cmd : commands) {
            std::cout << "  " << std::left << std::setw(12) << cmd->name() << cmd->description() << "\n";
        }
        std::cout << "  " << std::left << std::setw(12) << "help" << "Show this help message\n";
        std::cout << "  " << std::left << std::setw(12) << "version" << "Show version information\n";
        std::cout << "\nRun 'covscope <command> --help' for command options.\n";
    }

    void print_version() {
        std::cout << covscope::PROJECT_SHORT_NAME << " " << covscope::VERSION_STRING << "\n";
    }

}  // namespace

int main(const int argc, char** argv) {
    try {
        const auto commands = make_commands();

        if (argc < 2) {
            print_help(commands);
            return 1;
        }

        const std::string command_name = argv[1];
        if (command_name == "help" || command_name == "--help" || command_name == "-h") {
            print_help(commands);
            return 0;
        }
        if (command_name == "version" || command_name == "--version") {
            print_version();
            return 0;
        }

        const auto it = std::ranges::find_if(commands, [&](const auto& cmd) {
            return cmd->name() == command_name;
        });
        if (it == commands.end()) {
            std::cerr << "error: Unknown command: " << command_name << "\n";
            std::cerr << "Run 'covscope help' for a list of commands.\n";
            return 1;
        }

        const std::vector<std::string> args(argv + 2, argv + argc);
        auto& command = **it;
        const auto parsed = covscope::cli::parse_command_line(args, command.options());
        if (parsed.is_err()) {
            std::cerr << "error: " << parsed.error().message() << "\n";
            return 1;
        }

        const auto& line = parsed.value();
        if (!line.flags.help) {
            if (const auto problem = command.validate(line); !problem.empty()) {
                std::cerr << "error: " << problem << "\n";
                return 1;
            }
        }

        return command.execute(line);

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
