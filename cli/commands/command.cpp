//
// Created by gregorian-rayne on 02/16/26.
//

#include "covscope/cli/commands/command.hpp"

#include <algorithm>
#include <charconv>
#include <iomanip>
#include <iostream>
#include <iterator>

namespace covscope::cli
{
    namespace {

        struct Switch {
            std::string_view name;
            char short_name;
            bool CommonFlags::* member;
            std::string_view description;
        };

        constexpr Switch kSwitches[] = {
            {"help", 'h', &CommonFlags::help, "Show this help message"},
            {"verbose", 'v', &CommonFlags::verbose, "Enable verbose output"},
            {"quiet", 'q', &CommonFlags::quiet, "Only show errors"},
            {"json", 0, &CommonFlags::json, "Output in JSON format"},
        };

        const Switch* find_switch(const std::string_view name) {
            const auto it = std::ranges::find(kSwitches, name, &Switch::name);
            return it == std::end(kSwitches) ? nullptr : it;
        }

        const Switch* find_switch(const char short_name) {
            const auto it = std::ranges::find(kSwitches, short_name, &Switch::short_name);
            return it == std::end(kSwitches) ? nullptr : it;
        }

        const OptionSpec* find_option(const std::vector<OptionSpec>& options, const std::string& name) {
            const auto it = std::ranges::find(options, name, &OptionSpec::name);
            return it == options.end() ? nullptr : &*it;
        }

        const OptionSpec* find_option(const std::vector<OptionSpec>& options, const char short_name) {
            const auto it = std::ranges::find(options, short_name, &OptionSpec::short_name);
            return it == options.end() ? nullptr : &*it;
        }

        Result<CommandLine> unknown_option(const std::string& shown) {
            return Result<CommandLine>::failure(Error::invalid_argument("Unknown option: " + shown));
        }

        Result<CommandLine> missing_value(const std::string& shown) {
            return Result<CommandLine>::failure(Error::invalid_argument("Option " + shown + " requires a value"));
        }

        void print_option_line(std::ostream& out, const char short_name, const std::string_view name,
                               const std::string_view value_name, const std::string_view description) {
            std::string label = short_name != 0 ? std::string{'-', short_name, ',', ' '} : std::string(4, ' ');
            label.append("--").append(name);
            if (!value_name.empty()) {
                label.append(" ").append(value_name);
            }
            out << "  " << std::left << std::setw(26) << label << description << "\n";
        }

    }  // namespace

    std::optional<std::string> CommandLine::get(const std::string& name) const {
        if (const auto it = values.find(name); it != values.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    std::string CommandLine::get_or(const std::string& name, const std::string& fallback) const {
        const auto it = values.find(name);
        return it != values.end() ? it->second : fallback;
    }

    std::optional<int> CommandLine::get_int(const std::string& name) const {
        const auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }

        const std::string& text = it->second;
        int parsed = 0;
        const char* last = text.data() + text.size();
        if (const auto [ptr, ec] = std::from_chars(text.data(), last, parsed); ec != std::errc{} || ptr != last) {
            return std::nullopt;
        }
        return parsed;
    }

    Result<CommandLine> parse_command_line(
        const std::vector<std::string>& args,
        const std::vector<OptionSpec>& options
    ) {
        CommandLine line;

        for (std::size_t i = 0; i < args.size(); ++i) {
            const std::string& token = args[i];

            if (token == "--") {
                line.positional.insert(line.positional.end(), args.begin() + static_cast<std::ptrdiff_t>(i + 1), args.end());
                break;
            }
            if (token.size() < 2 || token[0] != '-') {
                if (!token.empty()) {
                    line.positional.push_back(token);
                }
                continue;
            }

            if (token[1] == '-') {
                std::string name = token.substr(2);
                std::optional<std::string> attached;
                if (const auto eq = name.find('='); eq != std::string::npos) {
                    attached = name.substr(eq + 1);
                    name.resize(eq);
                }

                if (const Switch* sw = find_switch(name)) {
                    line.flags.*(sw->member) = true;
                    continue;
                }
                const OptionSpec* spec = find_option(options, name);
                if (spec == nullptr) {
                    return unknown_option("--" + name);
                }

                std::string value = attached ? *attached : std::string();
                if (!attached && i + 1 < args.size()) {
                    value = args[++i];
                }
                if (value.empty()) {
                    return missing_value("--" + name);
                }
                line.values[spec->name] = std::move(value);
                continue;
            }

            // Bundled switches; a value-taking letter consumes the rest of the token.
            for (std::size_t j = 1; j < token.size(); ++j) {
                const char c = token[j];
                if (const Switch* sw = find_switch(c)) {
                    line.flags.*(sw->member) = true;
                    continue;
                }
                const OptionSpec* spec = find_option(options, c);
                if (spec == nullptr) {
                    return unknown_option(std::string{'-', c});
                }

                std::string value = token.substr(j + 1);
                if (value.empty() && i + 1 < args.size()) {
                    value = args[++i];
                }
                if (value.empty()) {
                    return missing_value(std::string{'-', c});
                }
                line.values[spec->name] = std::move(value);
                break;
            }
        }

        return Result<CommandLine>::success(std::move(line));
    }

    std::string Command::validate(const CommandLine&) const {
        return "";
    }

    void Command::print_help(std::ostream& out) const {
        out << description() << "\n\n" << usage() << "\n\nOptions:\n";
        for (const auto& option : options()) {
            print_option_line(out, option.short_name, option.name, option.value_name, option.description);
        }
        for (const auto& sw : kSwitches) {
            print_option_line(out, sw.short_name, sw.name, "", sw.description);
        }
    }

    void Command::apply_common_flags(const CommonFlags& flags) {
        if (flags.verbose) {
            verbosity_ = Verbosity::Verbose;
            verbosity_from_flags_ = true;
        } else if (flags.quiet) {
            verbosity_ = Verbosity::Quiet;
            verbosity_from_flags_ = true;
        }

        if (flags.json) {
            output_format_ = core::OutputFormat::Json;
            format_from_flags_ = true;
        }
    }

    Result<core::Config> Command::load_config(const CommandLine& line, const fs::path& project_root) {
        auto config = line.has("config")
            ? core::Config::load_from_file(line.get_or("config", ""))
            : core::Config::load_for_project(project_root);
        if (config.is_err()) {
            return config;
        }

        if (!verbosity_from_flags_) {
            verbosity_ = config.value().logging.level;
        }
        if (!format_from_flags_) {
            output_format_ = config.value().output.format;
        }
        return config;
    }

    void Command::print_error(const std::string_view msg) {
        std::cerr << "error: " << msg << "\n";
    }

    void Command::print_verbose(const std::string_view msg) const {
        if (verbosity_ >= Verbosity::Verbose) {
            std::cout << msg << "\n";
        }
    }

}  // namespace covscope::cli
