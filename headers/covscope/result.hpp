//
// Created by gregorian-rayne on 02/09/26.
//

#ifndef COVSCOPE_RESULT_HPP
#define COVSCOPE_RESULT_HPP

/**
 * @file result.hpp
 * @brief Value-or-Error return type of the coverage pipeline.
 *
 * Locating reports, parsing one report and loading configuration or a saved
 * summary all return a Result, so the caller decides whether a failure is
 * skipped (a single bad report) or terminal (no report at all).
 *
 * @code
 *     auto outcome = parser.parse_file(path, filter);
 *     if (outcome.is_err()) {
 *         logger.warning("Skipping " + path.string() + ": " + outcome.error().to_string());
 *         continue;
 *     }
 *     outcomes.push_back(std::move(outcome).value());
 * @endcode
 */

#include "covscope/error.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace covscope {

    /**
     * Holds either a T or an E, never both and never neither.
     */
    template<typename T, typename E = Error>
    class Result {
    public:
        static Result success(T value) {
            return Result(std::in_place_index<0>, std::move(value));
        }

        static Result failure(E error) {
            return Result(std::in_place_index<1>, std::move(error));
        }

        [[nodiscard]] bool is_ok() const noexcept { return data_.index() == 0; }
        [[nodiscard]] bool is_err() const noexcept { return data_.index() == 1; }

        /**
         * @throws std::logic_error on a failed Result.
         */
        const T& value() const& {
            require_ok();
            return std::get<0>(data_);
        }

        T& value() & {
            require_ok();
            return std::get<0>(data_);
        }

        T&& value() && {
            require_ok();
            return std::get<0>(std::move(data_));
        }

        /**
         * @throws std::logic_error on a successful Result.
         */
        const E& error() const& {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
            return std::get<1>(data_);
        }

        /**
         * Appends `context` to the error of a failed Result (typically the
         * file being read). A successful Result passes through unchanged.
         */
        Result with_context(const std::string& context) && {
            if (is_err()) {
                return failure(std::get<1>(data_).with_context(context));
            }
            return std::move(*this);
        }

    private:
        template<std::size_t I, typename V>
        Result(std::in_place_index_t<I> index, V&& v) : data_(index, std::forward<V>(v)) {}

        void require_ok() const {
            if (is_err()) {
                throw std::logic_error("Result::value() called on error result");
            }
        }

        std::variant<T, E> data_;
    };

    /**
     * Result of an operation with no value, e.g. validating or saving.
     */
    template<typename E>
    class Result<void, E> {
    public:
        static Result success() {
            return Result(std::nullopt);
        }

        static Result failure(E error) {
            return Result(std::move(error));
        }

        [[nodiscard]] bool is_ok() const noexcept { return !error_.has_value(); }
        [[nodiscard]] bool is_err() const noexcept { return error_.has_value(); }

        /**
         * @throws std::logic_error on a successful Result.
         */
        const E& error() const& {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
            return *error_;
        }

    private:
        explicit Result(std::optional<E> error) : error_(std::move(error)) {}

        std::optional<E> error_;
    };

}  // namespace covscope

#endif //COVSCOPE_RESULT_HPP
