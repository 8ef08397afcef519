//
// Created by gregorian-rayne on 2/3/26.
//

#ifndef PINCH_FILE_UTILS_HPP
#define PINCH_FILE_UTILS_HPP

/**
 * @file file_utils.hpp
 * @brief Whole-file reads and writes returning Result<T, Error>.
 */

#include "pinch/result.hpp"
#include "pinch/error.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>

namespace pinch::file_utils {

    namespace fs = std::filesystem;

    /**
     * Reads a regular file into memory. Directories and missing paths are
     * NotFound.
     */
    inline Result<std::string, Error> read_file(const fs::path& path) {
        using R = Result<std::string, Error>;

        if (std::error_code ec; !fs::is_regular_file(path, ec)) {
            return R::failure(Error::not_found("File not found", path.string()));
        }
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return R::failure(Error::io_error("Failed to open file", path.string()));
        }
        std::string content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
        if (in.bad()) {
            return R::failure(Error::io_error("Failed to read file", path.string()));
        }
        return R::success(std::move(content));
    }

    /**
     * Replaces the file's content, creating missing parent directories.
     */
    inline Result<void, Error> write_file(const fs::path& path, const std::string_view content) {
        using R = Result<void, Error>;

        if (const auto parent = path.parent_path(); !parent.empty()) {
            std::error_code ec;
            fs::create_directories(parent, ec);
            if (ec) {
                return R::failure(Error::io_error("Failed to create directory", parent.string()));
            }
        }
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return R::failure(Error::io_error("Failed to open file for writing", path.string()));
        }
        out << content;
        out.flush();
        if (!out) {
            return R::failure(Error::io_error("Failed to write file", path.string()));
        }
        return R::success();
    }

    /**
     * True for dot-files and dot-directories ("." and ".." excluded).
     */
    inline bool is_hidden(const fs::path& path) {
        const auto name = path.filename().string();
        return name.size() > 1 && name.front() == '.' && name != "..";
    }

}  // namespace pinch::file_utils

#endif //PINCH_FILE_UTILS_HPP
