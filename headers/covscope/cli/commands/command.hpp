//
// Created by gregorian-rayne on 02/16/26.
//

#ifndef COVSCOPE_COMMAND_HPP
#define COVSCOPE_COMMAND_HPP

/**
 * @file command.hpp
 * @brief The report, locate and compare subcommands of the covscope tool.
 *
 * Every command takes positional paths plus `--name VALUE` options. The only
 * switches are the ones shared by all commands (--help, --verbose, --quiet,
 * --json), so an option spec never needs a flag/value distinction.
 */

#include "covscope/logging.hpp"
#include "covscope/result.hpp"
#include "covscope/core/config.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace covscope::cli
{
    namespace fs = std::filesystem;

    /**
     * A value-taking option of one command, e.g. `--modules LIST` / `-m LIST`.
     */
    struct OptionSpec {
        std::string name;
        char short_name = 0;
        std::string value_name;
        std::string description;
    };

    /**
     * Switches accepted by every command.
     */
    struct CommonFlags {
        bool help = false;
        bool verbose = false;
        bool quiet = false;
        bool json = false;
    };

    /**
     * Tokenized arguments of one command invocation.
     */
    struct CommandLine {
        CommonFlags flags;
        std::vector<std::string> positional;
        std::map<std::string, std::string> values;

        [[nodiscard]] bool has(const std::string& name) const { return values.contains(name); }
        [[nodiscard]] std::optional<std::string> get(const std::string& name) const;
        [[nodiscard]] std::string get_or(const std::string& name, const std::string& fallback) const;

        /// Empty when the option is absent or not a whole decimal integer.
        [[nodiscard]] std::optional<int> get_int(const std::string& name) const;
    };

    /**
     * Splits the arguments following the command name.
     *
     * `--name VALUE`, `--name=VALUE`, `-n VALUE` and `-nVALUE` set an option;
     * single-letter switches may be bundled (`-vq`). After `--` every
     * remaining token is positional.
     *
     * @return InvalidArgument for an unknown option or a missing value.
     */
    [[nodiscard]] Result<CommandLine> parse_command_line(
        const std::vector<std::string>& args,
        const std::vector<OptionSpec>& options
    );

    /**
     * Base class of the covscope subcommands.
     */
    class Command {
    public:
        virtual ~Command() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;
        [[nodiscard]] virtual std::string_view description() const noexcept = 0;

        /// Usage line followed by examples.
        [[nodiscard]] virtual std::string usage() const = 0;

        [[nodiscard]] virtual std::vector<OptionSpec> options() const { return {}; }

        /**
         * Checks positional arguments and option values before execute().
         *
         * @return Error message if invalid, empty if valid.
         */
        [[nodiscard]] virtual std::string validate(const CommandLine& line) const;

        /// @return Process exit code.
        [[nodiscard]] virtual int execute(const CommandLine& line) = 0;

        void print_help(std::ostream& out) const;

    protected:
        /**
         * Applies --verbose, --quiet and --json.
         */
        void apply_common_flags(const CommonFlags& flags);

        /**
         * Loads --config if given, otherwise <root>/covscope.toml or defaults.
         * Config values for verbosity and format apply unless a command-line
         * flag already chose them.
         */
        [[nodiscard]] Result<core::Config> load_config(const CommandLine& line, const fs::path& project_root);

        static void print_error(std::string_view msg);
        void print_verbose(std::string_view msg) const;

        [[nodiscard]] Verbosity verbosity() const { return verbosity_; }
        [[nodiscard]] bool is_json() const { return output_format_ == core::OutputFormat::Json; }

    private:
        Verbosity verbosity_ = Verbosity::Normal;
        core::OutputFormat output_format_ = core::OutputFormat::Text;
        bool verbosity_from_flags_ = false;
        bool format_from_flags_ = false;
    };

    [[nodiscard]] std::unique_ptr<Command> make_report_command();
    [[nodiscard]] std::unique_ptr<Command> make_locate_command();
    [[nodiscard]] std::unique_ptr<Command> make_compare_command();

}  // namespace covscope::cli

#endif //COVSCOPE_COMMAND_HPP
