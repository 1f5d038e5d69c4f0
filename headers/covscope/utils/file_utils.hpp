//
// Created by gregorian-rayne on 02/09/26.
//

#ifndef COVSCOPE_FILE_UTILS_HPP
#define COVSCOPE_FILE_UTILS_HPP

/**
 * @file file_utils.hpp
 * @brief File system utilities.
 *
 * All operations use Result<T, Error> for error handling and never throw
 * filesystem_error.
 */

#include "covscope/result.hpp"
#include "covscope/error.hpp"

#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace covscope::file_utils {

    namespace fs = std::filesystem;

    /**
     * Reads an entire file into a string.
     *
     * @param path Path to the file.
     * @return The file contents or an error.
     */
    inline Result<std::string, Error> read_file(const fs::path& path) {
        if (std::error_code ec; !fs::exists(path, ec)) {
            return Result<std::string, Error>::failure(
                Error::not_found("File not found", path.string())
            );
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to open file", path.string())
            );
        }

        std::ostringstream oss;
        oss << file.rdbuf();

        if (file.bad()) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to read file", path.string())
            );
        }

        return Result<std::string, Error>::success(oss.str());
    }

    /**
     * Writes a string to a file, creating parent directories.
     *
     * @param path Path to the file.
     * @param content Content to write.
     * @return Success or an error.
     */
    inline Result<void, Error> write_file(const fs::path& path, std::string_view content) {
        auto parent = path.parent_path();
        if (std::error_code ec; !parent.empty() && !fs::exists(parent, ec)) {
            fs::create_directories(parent, ec);
            if (ec) {
                return Result<void, Error>::failure(
                    Error::io_error("Failed to create directory", parent.string())
                );
            }
        }

        std::ofstream file(path, std::ios::binary);
        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to open file for writing", path.string())
            );
        }

        file.write(content.data(), static_cast<std::streamsize>(content.size()));

        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to write file", path.string())
            );
        }

        return Result<void, Error>::success();
    }

    /**
     * Checks for an existing regular file without throwing.
     */
    inline bool is_regular_file(const fs::path& path) noexcept {
        std::error_code ec;
        return fs::is_regular_file(path, ec);
    }

    /**
     * Checks for an existing directory without throwing.
     */
    inline bool is_directory(const fs::path& path) noexcept {
        std::error_code ec;
        return fs::is_directory(path, ec);
    }

    /**
     * Returns an absolute, lexically normalized form of the path.
     *
     * Falls back to the lexical form when the current directory cannot be
     * resolved.
     */
    inline fs::path normalize(const fs::path& path) {
        std::error_code ec;
        auto absolute = fs::absolute(path, ec);
        if (ec) {
            return path.lexically_normal();
        }
        return absolute.lexically_normal();
    }

    /**
     * Recursively finds regular files with the given file name.
     *
     * Directories that cannot be read are skipped. Results are sorted so
     * that the outcome does not depend on directory iteration order.
     *
     * @param dir Directory to search.
     * @param file_name Exact file name to match (e.g. "jacocoTestReport.xml").
     * @return Matching paths or an error if dir is not a directory.
     */
    inline Result<std::vector<fs::path>, Error> find_files_named(
        const fs::path& dir,
        const std::string_view file_name
    ) {
        std::error_code ec;

        if (!fs::exists(dir, ec)) {
            return Result<std::vector<fs::path>, Error>::failure(
                Error::not_found("Directory not found", dir.string())
            );
        }

        if (!fs::is_directory(dir, ec)) {
            return Result<std::vector<fs::path>, Error>::failure(
                Error::invalid_argument("Not a directory", dir.string())
            );
        }

        std::vector<fs::path> result;

        fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            return Result<std::vector<fs::path>, Error>::failure(
                Error::io_error("Failed to list directory", dir.string())
            );
        }

        for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
            if (ec) {
                // Iterator is invalid after a failed increment; keep what we have
                break;
            }
            std::error_code entry_ec;
            if (it->is_regular_file(entry_ec) && it->path().filename() == file_name) {
                result.push_back(it->path());
            }
        }

        std::ranges::sort(result);
        return Result<std::vector<fs::path>, Error>::success(std::move(result));
    }

}  // namespace covscope::file_utils

#endif //COVSCOPE_FILE_UTILS_HPP
