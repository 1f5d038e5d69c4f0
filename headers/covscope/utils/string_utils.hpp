//
// Created by gregorian-rayne on 02/09/26.
//

#ifndef COVSCOPE_STRING_UTILS_HPP
#define COVSCOPE_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief String manipulation utilities.
 *
 * Trimming, splitting and matching helpers used by the scope filter, the
 * report locator and the command line front end.
 */

#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace covscope::string_utils {

    /**
     * Trims whitespace from the beginning of a string.
     */
    inline std::string_view trim_left(std::string_view s) noexcept {
        const auto it = std::ranges::find_if(s, [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(static_cast<std::size_t>(it - s.begin()));
    }

    /**
     * Trims whitespace from the end of a string.
     */
    inline std::string_view trim_right(std::string_view s) noexcept {
        const auto it = std::find_if(s.rbegin(), s.rend(), [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(0, static_cast<std::size_t>(s.rend() - it));
    }

    /**
     * Trims whitespace from both ends of a string.
     */
    inline std::string_view trim(const std::string_view s) noexcept {
        return trim_left(trim_right(s));
    }

    /**
     * Splits a string by a delimiter.
     *
     * @param s The string to split.
     * @param delimiter The character to split on.
     * @return A vector of string views representing the parts.
     */
    inline std::vector<std::string_view> split(std::string_view s, const char delimiter) {
        std::vector<std::string_view> result;
        std::size_t start = 0;
        std::size_t end = s.find(delimiter);

        while (end != std::string_view::npos) {
            result.push_back(s.substr(start, end - start));
            start = end + 1;
            end = s.find(delimiter, start);
        }

        result.push_back(s.substr(start));
        return result;
    }

    /**
     * Splits a comma-separated list, trimming entries and dropping empty ones.
     *
     * " a, b ,,c " yields {"a", "b", "c"}.
     */
    inline std::vector<std::string> split_list(const std::string_view s, const char delimiter = ',') {
        std::vector<std::string> result;
        for (const auto part : split(s, delimiter)) {
            if (const auto entry = trim(part); !entry.empty()) {
                result.emplace_back(entry);
            }
        }
        return result;
    }

    /**
     * Joins strings with a delimiter.
     */
    template<typename Container>
    std::string join(const Container& parts, const std::string_view delimiter) {
        if (parts.empty()) {
            return "";
        }

        std::ostringstream oss;
        auto it = parts.begin();
        oss << *it;
        ++it;

        for (; it != parts.end(); ++it) {
            oss << delimiter << *it;
        }

        return oss.str();
    }

    inline bool starts_with(const std::string_view s, const std::string_view prefix) noexcept {
        return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
    }

    inline bool ends_with(const std::string_view s, const std::string_view suffix) noexcept {
        return s.size() >= suffix.size() &&
               s.substr(s.size() - suffix.size()) == suffix;
    }

    inline bool contains(const std::string_view s, const std::string_view needle) noexcept {
        return s.find(needle) != std::string_view::npos;
    }

    /**
     * Converts a string to lowercase.
     */
    inline std::string to_lower(const std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    /**
     * Replaces every occurrence of one character, e.g. '/' to '.' in
     * JVM internal class names.
     */
    inline std::string replace_char(std::string_view s, const char from, const char to) {
        std::string result(s);
        std::ranges::replace(result, from, to);
        return result;
    }

    /**
     * Removes one layer of matching quotes or backticks around a value.
     */
    inline std::string_view unquote(std::string_view s) noexcept {
        if (s.size() >= 2) {
            const char first = s.front();
            if ((first == '`' || first == '"' || first == '\'') && s.back() == first) {
                return s.substr(1, s.size() - 2);
            }
        }
        return s;
    }

    /**
     * Formats a fraction in [0, 1] as a percentage with two decimals.
     *
     * 0.8 yields "80.00%".
     */
    inline std::string format_ratio(const double ratio) {
        std::ostringstream oss;
        oss.precision(2);
        oss << std::fixed << ratio * 100.0 << "%";
        return oss.str();
    }

}  // namespace covscope::string_utils

#endif //COVSCOPE_STRING_UTILS_HPP
