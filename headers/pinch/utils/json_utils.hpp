//
// Created by gregorian-rayne on 2/3/26.
//

#ifndef PINCH_JSON_UTILS_HPP
#define PINCH_JSON_UTILS_HPP

/**
 * @file json_utils.hpp
 * @brief nlohmann/json entry points that report through Result.
 *
 * nlohmann parse exceptions never escape this header.
 */

#include "pinch/result.hpp"
#include "pinch/error.hpp"
#include "pinch/utils/file_utils.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace pinch::json_utils {

    namespace fs = std::filesystem;
    using json = nlohmann::json;

    inline Result<json, Error> parse(const std::string_view content) {
        try {
            return Result<json, Error>::success(json::parse(content));
        } catch (const json::parse_error& e) {
            return Result<json, Error>::failure(Error::parse_error("JSON parse error", e.what()));
        }
    }

    /**
     * Reads and parses a JSON file. Parse errors carry the path as
     * context.
     */
    inline Result<json, Error> read_file(const fs::path& path) {
        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<json, Error>::failure(content.error());
        }
        auto parsed = parse(content.value());
        if (parsed.is_err()) {
            return Result<json, Error>::failure(parsed.error().with_context(path.string()));
        }
        return parsed;
    }

    /**
     * obj[key] converted to T, or fallback when obj is not an object, the
     * key is absent, or the value has another type.
     */
    template<typename T>
    T get_or(const json& obj, const std::string& key, const T& fallback) {
        if (!obj.is_object()) {
            return fallback;
        }
        const auto it = obj.find(key);
        if (it == obj.end()) {
            return fallback;
        }
        try {
            return it->template get<T>();
        } catch (const json::exception&) {
            return fallback;
        }
    }

}  // namespace pinch::json_utils

#endif //PINCH_JSON_UTILS_HPP
