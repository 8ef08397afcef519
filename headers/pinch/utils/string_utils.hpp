//
// Created by gregorian-rayne on 2/3/26.
//

#ifndef PINCH_STRING_UTILS_HPP
#define PINCH_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief String helpers used for name normalization and report output.
 */

#include <string>
#include <string_view>

namespace pinch::string_utils {

    inline constexpr std::string_view kWhitespace = " \t\n\r\f\v";

    inline std::string_view trim_left(const std::string_view s) noexcept {
        const auto first = s.find_first_not_of(kWhitespace);
        return first == std::string_view::npos ? std::string_view{} : s.substr(first);
    }

    inline std::string_view trim_right(const std::string_view s) noexcept {
        const auto last = s.find_last_not_of(kWhitespace);
        return last == std::string_view::npos ? std::string_view{} : s.substr(0, last + 1);
    }

    inline std::string_view trim(const std::string_view s) noexcept {
        return trim_left(trim_right(s));
    }

    /**
     * Concatenates parts with delimiter between neighbours.
     */
    template<typename Container>
    std::string join(const Container& parts, const std::string_view delimiter) {
        std::string out;
        bool first = true;
        for (const auto& part : parts) {
            if (!first) {
                out += delimiter;
            }
            out += part;
            first = false;
        }
        return out;
    }

    inline bool ends_with(const std::string_view s, const std::string_view suffix) noexcept {
        return s.ends_with(suffix);
    }

    /**
     * ASCII lowercase; other bytes pass through.
     */
    inline std::string to_lower(const std::string_view s) {
        std::string out(s);
        for (char& c : out) {
            if (c >= 'A' && c <= 'Z') {
                c = static_cast<char>(c - 'A' + 'a');
            }
        }
        return out;
    }

}  // namespace pinch::string_utils

#endif //PINCH_STRING_UTILS_HPP
