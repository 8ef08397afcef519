//
// Created by gregorian-rayne on 2/3/26.
//

#ifndef PINCH_PATH_UTILS_HPP
#define PINCH_PATH_UTILS_HPP

/**
 * @file path_utils.hpp
 * @brief Path helpers for scan-root relative identities.
 *
 * Node identifiers never embed absolute paths in stable-id mode, so every
 * record path goes through relative_to_root() before it reaches the
 * graph builder.
 */

#include <filesystem>
#include <string>

namespace pinch::path_utils {

    namespace fs = std::filesystem;

    /**
     * Normalizes a path by resolving . and .. components.
     *
     * Unlike fs::canonical(), this works on paths that don't exist
     * and doesn't resolve symlinks.
     */
    inline fs::path normalize(const fs::path& path) {
        fs::path result;

        for (const auto& component : path) {
            if (component == ".") {
                continue;
            }
            if (component == "..") {
                if (!result.empty() && result.filename() != "..") {
                    result = result.parent_path();
                } else {
                    result /= component;
                }
            } else {
                result /= component;
            }
        }

        return result.empty() ? "." : result;
    }

    inline std::string to_forward_slashes(const fs::path& path) {
        std::string result = path.string();
        for (char& c : result) {
            if (c == '\\') {
                c = '/';
            }
        }
        return result;
    }

    /**
     * Relative form of a record path used inside identifiers.
     *
     * Paths outside the scan root (workspace references) keep their
     * normalized "../" form; "." denotes the root itself.
     */
    inline std::string relative_to_root(const fs::path& path, const fs::path& root) {
        if (root.empty() || path.empty()) {
            return to_forward_slashes(normalize(path));
        }
        if (path.is_relative()) {
            return to_forward_slashes(normalize(path));
        }
        return to_forward_slashes(normalize(path).lexically_relative(normalize(root)).lexically_normal());
    }

    /**
     * Canonical key for a directory.
     *
     * Resolves symlinks for the existing prefix and lexically normalizes
     * the rest, so two spellings of one directory share a key.
     */
    inline std::string canonical_key(const fs::path& path) {
        std::error_code ec;
        auto absolute = fs::absolute(path, ec);
        if (ec) {
            absolute = path;
        }
        auto canonical = fs::weakly_canonical(absolute, ec);
        if (ec) {
            canonical = normalize(absolute);
        }
        auto key = to_forward_slashes(canonical.lexically_normal());
        while (key.size() > 1 && key.back() == '/') {
            key.pop_back();
        }
        return key;
    }

}  // namespace pinch::path_utils

#endif //PINCH_PATH_UTILS_HPP
