//
// Created by gregorian-rayne on 02/14/26.
//

#ifndef COVSCOPE_JSON_UTILS_HPP
#define COVSCOPE_JSON_UTILS_HPP

/**
 * @file json_utils.hpp
 * @brief nlohmann/json helpers returning Result<T, Error>.
 */

#include "covscope/result.hpp"
#include "covscope/error.hpp"
#include "covscope/utils/file_utils.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <filesystem>

namespace covscope::json_utils {

    namespace fs = std::filesystem;
    using json = nlohmann::json;

    /**
     * Parses a JSON string.
     *
     * @param content The JSON text.
     * @return The parsed document or a ParseError.
     */
    inline Result<json, Error> parse(const std::string_view content) {
        try {
            return Result<json, Error>::success(json::parse(content));
        } catch (const json::parse_error& e) {
            return Result<json, Error>::failure(
                Error::parse_error("JSON parse error", e.what())
            );
        }
    }

    /**
     * Reads and parses a JSON file.
     */
    inline Result<json, Error> read_file(const fs::path& path) {
        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<json, Error>::failure(content.error());
        }

        return parse(content.value()).with_context(path.string());
    }

    /**
     * Serializes a JSON document.
     *
     * @param indent Indentation level (-1 for compact output).
     */
    inline std::string to_string(const json& data, const int indent = -1) {
        return data.dump(indent);
    }

    /**
     * Writes a JSON document to a file, creating parent directories.
     */
    inline Result<void, Error> write_file(
        const fs::path& path,
        const json& data,
        const int indent = 2
    ) {
        std::string text;
        try {
            text = data.dump(indent);
        } catch (const json::type_error& e) {
            return Result<void, Error>::failure(
                Error::internal_error("JSON serialization error", e.what())
            );
        }
        text += '\n';
        return file_utils::write_file(path, text);
    }

    /**
     * Gets a typed value from a JSON object.
     *
     * @return The value, NotFound if the key is absent, or ParseError on a
     *         type mismatch.
     */
    template<typename T>
    Result<T, Error> get(const json& obj, const std::string& key) {
        if (!obj.is_object() || !obj.contains(key)) {
            return Result<T, Error>::failure(
                Error::not_found("JSON key not found", key)
            );
        }

        try {
            return Result<T, Error>::success(obj.at(key).get<T>());
        } catch (const json::type_error& e) {
            return Result<T, Error>::failure(
                Error::parse_error("JSON type mismatch", key + ": " + e.what())
            );
        }
    }

}  // namespace covscope::json_utils

#endif //COVSCOPE_JSON_UTILS_HPP
