//
// Created by gregorian-rayne on 02/10/26.
//

#include "covscope/logging.hpp"
#include "covscope/utils/string_utils.hpp"

#include <iostream>

namespace covscope
{
    const char* verbosity_to_string(const Verbosity v) noexcept {
        switch (v) {
            case Verbosity::Quiet:   return "quiet";
            case Verbosity::Normal:  return "normal";
            case Verbosity::Verbose: return "verbose";
            case Verbosity::Debug:   return "debug";
        }
        return "normal";
    }

    Result<Verbosity, Error> verbosity_from_string(const std::string_view str) {
        const auto lower = string_utils::to_lower(string_utils::trim(str));
        if (lower == "quiet") return Result<Verbosity, Error>::success(Verbosity::Quiet);
        if (lower == "normal") return Result<Verbosity, Error>::success(Verbosity::Normal);
        if (lower == "verbose") return Result<Verbosity, Error>::success(Verbosity::Verbose);
        if (lower == "debug") return Result<Verbosity, Error>::success(Verbosity::Debug);
        return Result<Verbosity, Error>::failure(
            Error::config_error("Unknown logging level", std::string(str))
        );
    }

    Logger::Logger(std::ostream& out, std::ostream& err, const Verbosity verbosity)
        : out_(&out)
        , err_(&err)
        , verbosity_(verbosity) {
    }

    Logger::Logger(Logger&& other) noexcept
        : out_(other.out_)
        , err_(other.err_)
        , verbosity_(other.verbosity_) {
    }

    Logger Logger::console(const Verbosity verbosity) {
        return {std::cout, std::cerr, verbosity};
    }

    Logger Logger::null() {
        Logger logger(std::cout, std::cerr, Verbosity::Quiet);
        logger.out_ = nullptr;
        logger.err_ = nullptr;
        return logger;
    }

    void Logger::write(std::ostream* stream, const std::string_view prefix, const std::string_view msg) {
        if (!stream) {
            return;
        }
        std::lock_guard lock(mutex_);
        *stream << prefix << msg << "\n";
    }

    void Logger::error(const std::string_view msg) {
        write(err_, "error: ", msg);
    }

    void Logger::warning(const std::string_view msg) {
        if (verbosity_ != Verbosity::Quiet) {
            write(err_, "warning: ", msg);
        }
    }

    void Logger::info(const std::string_view msg) {
        if (verbosity_ != Verbosity::Quiet) {
            write(out_, "", msg);
        }
    }

    void Logger::verbose(const std::string_view msg) {
        if (verbosity_ >= Verbosity::Verbose) {
            write(out_, "", msg);
        }
    }

    void Logger::debug(const std::string_view msg) {
        if (verbosity_ >= Verbosity::Debug) {
            write(out_, "[DEBUG] ", msg);
        }
    }

}  // namespace covscope
