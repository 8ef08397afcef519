//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef PINCH_FORMATTER_HPP
#define PINCH_FORMATTER_HPP

/**
 * @file formatter.hpp
 * @brief Terminal rendering helpers for the text reports.
 */

#include "pinch/heuristics/config.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace pinch::cli
{
    /**
     * ANSI escapes. Only emitted when enabled() holds.
     */
    namespace colors {
        inline constexpr const char* RESET = "\033[0m";
        inline constexpr const char* BOLD = "\033[1m";
        inline constexpr const char* DIM = "\033[2m";
        inline constexpr const char* RED = "\033[31m";
        inline constexpr const char* GREEN = "\033[32m";
        inline constexpr const char* YELLOW = "\033[33m";
        inline constexpr const char* CYAN = "\033[36m";

        /**
         * True when colors were not disabled and stdout is a terminal.
         */
        bool enabled();

        void set_enabled(bool enable);

    }  // namespace colors

    struct Column {
        std::string header;
        std::size_t width = 0;    // 0 sizes the column to its widest cell
        bool right_align = false;
    };

    using Row = std::vector<std::string>;

    /**
     * Fixed-layout text table. Cells wider than a fixed column are cut
     * with "...".
     */
    class Table {
    public:
        explicit Table(std::vector<Column> columns);

        void add_row(Row row);

        void render(std::ostream& out) const;

    private:
        [[nodiscard]] std::vector<std::size_t> widths() const;

        std::vector<Column> columns_;
        std::vector<Row> rows_;
    };

    /**
     * 12345 -> "12,345".
     */
    [[nodiscard]] std::string format_count(std::size_t count);

    [[nodiscard]] std::string format_score(double score);

    [[nodiscard]] std::string bold(const std::string& text);

    [[nodiscard]] std::string colorize_risk(heuristics::RiskLevel risk);

    /**
     * Horizontal bar of value relative to max_value.
     */
    [[nodiscard]] std::string bar_graph(double value, double max_value, std::size_t width = 20);

}  // namespace pinch::cli

#endif //PINCH_FORMATTER_HPP
