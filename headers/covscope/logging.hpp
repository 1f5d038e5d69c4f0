//
// Created by gregorian-rayne on 02/10/26.
//

#ifndef COVSCOPE_LOGGING_HPP
#define COVSCOPE_LOGGING_HPP

/**
 * @file logging.hpp
 * @brief Verbosity-gated diagnostic output.
 *
 * A Logger is created by the caller and passed by reference to the locator,
 * the aggregator and the service entry point. Output format:
 * - error:   "error: <msg>"   (error stream, always)
 * - warning: "warning: <msg>" (error stream, unless Quiet)
 * - info:    "<msg>"          (output stream, unless Quiet)
 * - verbose: "<msg>"          (output stream, Verbose and above)
 * - debug:   "[DEBUG] <msg>"  (output stream, Debug only)
 */

#include "covscope/result.hpp"

#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace covscope {

    /**
     * Output verbosity level.
     */
    enum class Verbosity {
        Quiet,      // Only errors
        Normal,     // Standard output
        Verbose,    // Extra details
        Debug       // All information
    };

    const char* verbosity_to_string(Verbosity v) noexcept;

    /**
     * Parses "quiet", "normal", "verbose" or "debug" (case-insensitive).
     */
    Result<Verbosity, Error> verbosity_from_string(std::string_view str);

    class Logger {
    public:
        /**
         * @param out Stream for info, verbose and debug messages.
         * @param err Stream for warnings and errors.
         * @param verbosity Initial level.
         */
        Logger(std::ostream& out, std::ostream& err, Verbosity verbosity = Verbosity::Normal);

        /**
         * Logger writing to std::cout and std::cerr.
         */
        static Logger console(Verbosity verbosity = Verbosity::Normal);

        /**
         * Logger that discards everything.
         */
        static Logger null();

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;
        Logger(Logger&& other) noexcept;

        void set_verbosity(Verbosity v) noexcept { verbosity_ = v; }
        [[nodiscard]] Verbosity verbosity() const noexcept { return verbosity_; }
        [[nodiscard]] bool is_verbose() const noexcept { return verbosity_ >= Verbosity::Verbose; }

        void error(std::string_view msg);
        void warning(std::string_view msg);
        void info(std::string_view msg);
        void verbose(std::string_view msg);
        void debug(std::string_view msg);

    private:
        void write(std::ostream* stream, std::string_view prefix, std::string_view msg);

        std::ostream* out_;
        std::ostream* err_;
        Verbosity verbosity_;
        std::mutex mutex_;
    };

}  // namespace covscope

#endif //COVSCOPE_LOGGING_HPP
