//
// Created by gregorian-rayne on 2/9/26.
//

#include "pinch/cli/formatter.hpp"

#include <algorithm>
#include <cstdio>
#include <iomanip>
#include <sstream>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace pinch::cli
{
    namespace colors {

        namespace {
            bool g_enabled = true;
        }

        bool enabled() {
            static const bool terminal = isatty(fileno(stdout)) != 0;
            return g_enabled && terminal;
        }

        void set_enabled(const bool enable) {
            g_enabled = enable;
        }

    }  // namespace colors

    namespace {

        std::string paint(const std::string& text, const char* style) {
            return colors::enabled() ? std::string(style) + text + colors::RESET : text;
        }

        std::string repeat(const std::string_view unit, const std::size_t n) {
            std::string out;
            out.reserve(unit.size() * n);
            for (std::size_t i = 0; i < n; ++i) {
                out += unit;
            }
            return out;
        }

    }  // namespace

    // ============================================================================
    // Formatting
    // ============================================================================

    std::string format_count(const std::size_t count) {
        const std::string digits = std::to_string(count);
        std::string out;
        for (std::size_t i = 0; i < digits.size(); ++i) {
            if (i > 0 && (digits.size() - i) % 3 == 0) {
                out += ',';
            }
            out += digits[i];
        }
        return out;
    }

    std::string format_score(const double score) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << score;
        return ss.str();
    }

    std::string bold(const std::string& text) {
        return paint(text, colors::BOLD);
    }

    std::string colorize_risk(const heuristics::RiskLevel risk) {
        const std::string name = heuristics::to_string(risk);
        switch (risk) {
            case heuristics::RiskLevel::Critical: return paint(paint(name, colors::BOLD), colors::RED);
            case heuristics::RiskLevel::High:     return paint(name, colors::YELLOW);
            case heuristics::RiskLevel::Medium:   return paint(name, colors::CYAN);
            case heuristics::RiskLevel::Low:      return paint(name, colors::DIM);
        }
        return name;
    }

    std::string bar_graph(const double value, const double max_value, const std::size_t width) {
        const double ratio = max_value > 0.0 ? std::clamp(value / max_value, 0.0, 1.0) : 0.0;
        const auto filled = static_cast<std::size_t>(ratio * static_cast<double>(width));

        if (!colors::enabled()) {
            return std::string(filled, '#') + std::string(width - filled, '.');
        }
        const char* tone = ratio > 0.75 ? colors::RED : ratio > 0.5 ? colors::YELLOW : colors::GREEN;
        return paint(repeat("█", filled), tone) + paint(repeat("░", width - filled), colors::DIM);
    }

    // ============================================================================
    // Table
    // ============================================================================

    Table::Table(std::vector<Column> columns)
        : columns_(std::move(columns))
    {}

    void Table::add_row(Row row) {
        row.resize(std::max(row.size(), columns_.size()));
        rows_.push_back(std::move(row));
    }

    std::vector<std::size_t> Table::widths() const {
        std::vector<std::size_t> result;
        result.reserve(columns_.size());
        for (std::size_t i = 0; i < columns_.size(); ++i) {
            std::size_t width = columns_[i].width;
            if (width == 0) {
                width = columns_[i].header.size();
                for (const auto& row : rows_) {
                    width = std::max(width, row[i].size());
                }
            }
            result.push_back(width);
        }
        return result;
    }

    void Table::render(std::ostream& out) const {
        const auto width = widths();

        const auto emit = [&](const std::size_t i, std::string cell, const bool header) {
            if (cell.size() > width[i] && width[i] > 3) {
                cell = cell.substr(0, width[i] - 3) + "...";
            }
            if (i > 0) {
                out << "  ";
            }
            if (header && colors::enabled()) {
                out << colors::BOLD;
            }
            out << (columns_[i].right_align ? std::right : std::left)
                << std::setw(static_cast<int>(width[i])) << cell;
            if (header && colors::enabled()) {
                out << colors::RESET;
            }
        };

        for (std::size_t i = 0; i < columns_.size(); ++i) {
            emit(i, columns_[i].header, true);
        }
        out << "\n";
        for (std::size_t i = 0; i < columns_.size(); ++i) {
            out << (i > 0 ? "  " : "") << std::string(width[i], '-');
        }
        out << "\n";

        for (const auto& row : rows_) {
            for (std::size_t i = 0; i < columns_.size(); ++i) {
                emit(i, row[i], false);
            }
            out << "\n";
        }
        out << std::left;
    }

}  // namespace pinch::cli
