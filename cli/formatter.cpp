//
// Created by gregorian-rayne on 02/16/26.
//

#include "covscope/cli/formatter.hpp"
#include "covscope/utils/string_utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace covscope::cli
{
    // ============================================================================
    // Colors
    // ============================================================================

    namespace colors {

        static bool g_colors_enabled = true;

        const char* RESET = "\033[0m";
        const char* BOLD = "\033[1m";
        const char* DIM = "\033[2m";

        const char* RED = "\033[31m";
        const char* GREEN = "\033[32m";
        const char* YELLOW = "\033[33m";

        bool enabled() {
            return g_colors_enabled && is_tty();
        }

        void set_enabled(const bool enable) {
            g_colors_enabled = enable;
        }

    }  // namespace colors

    bool is_tty() {
#ifdef _WIN32
        return _isatty(_fileno(stdout)) != 0;
#else
        return isatty(fileno(stdout)) != 0;
#endif
    }

    namespace {

        std::string bold(const std::string& text) {
            if (colors::enabled()) {
                return std::string(colors::BOLD) + text + colors::RESET;
            }
            return text;
        }

        std::string dim(const std::string& text) {
            if (colors::enabled()) {
                return std::string(colors::DIM) + text + colors::RESET;
            }
            return text;
        }

    }  // namespace

    // ============================================================================
    // Formatting Functions
    // ============================================================================

    std::string format_percent(const double ratio) {
        return string_utils::format_ratio(ratio);
    }

    std::string format_delta(const double delta) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2);
        const double points = delta * 100.0;
        if (std::abs(points) < 0.005) {
            ss << "+/-0.00";
        } else if (points > 0) {
            ss << "+" << points;
        } else {
            ss << points;
        }
        ss << " pts";
        return ss.str();
    }

    std::string colorize_coverage(const double ratio) {
        const std::string formatted = format_percent(ratio);
        if (!colors::enabled()) {
            return formatted;
        }
        const char* color = colors::GREEN;
        if (ratio < 0.5) color = colors::RED;
        else if (ratio < 0.8) color = colors::YELLOW;
        return std::string(color) + formatted + colors::RESET;
    }

    std::string bar_graph(const double ratio, const std::size_t width) {
        const double pct = std::clamp(ratio, 0.0, 1.0);
        const auto filled = static_cast<std::size_t>(pct * static_cast<double>(width));

        std::string result;
        if (colors::enabled()) {
            result += pct < 0.5 ? colors::RED : (pct < 0.8 ? colors::YELLOW : colors::GREEN);
            for (std::size_t i = 0; i < filled; ++i) {
                result += "█";
            }
            result += colors::RESET;
            result += colors::DIM;
            for (std::size_t i = filled; i < width; ++i) {
                result += "░";
            }
            result += colors::RESET;
        } else {
            result.append(filled, '#');
            result.append(width - filled, '-');
        }
        return result;
    }

    // ============================================================================
    // Table Implementation
    // ============================================================================

    Table::Table(std::vector<Column> columns)
        : columns_(std::move(columns))
    {}

    void Table::add_row(Row row) {
        while (row.size() < columns_.size()) {
            row.emplace_back();
        }
        rows_.push_back(std::move(row));
    }

    void Table::calculate_widths() {
        for (std::size_t i = 0; i < columns_.size(); ++i) {
            if (columns_[i].width == 0) {
                std::size_t max_width = columns_[i].header.length();
                for (const auto& row : rows_) {
                    if (i < row.size() && row[i].length() > max_width) {
                        max_width = row[i].length();
                    }
                }
                columns_[i].width = max_width;
            }
        }
    }

    std::string Table::render() const {
        std::ostringstream ss;
        render(ss);
        return ss.str();
    }

    void Table::render(std::ostream& out) const {
        Table temp = *this;
        temp.calculate_widths();

        auto render_row = [&](const Row& row, const bool is_header) {
            for (std::size_t i = 0; i < temp.columns_.size(); ++i) {
                const auto& col = temp.columns_[i];
                std::string cell = i < row.size() ? row[i] : "";

                if (cell.length() > col.width && col.width > 3) {
                    cell = cell.substr(0, col.width - 3) + "...";
                }

                if (is_header && colors::enabled()) {
                    out << colors::BOLD;
                }
                if (col.right_align) {
                    out << std::right << std::setw(static_cast<int>(col.width)) << cell;
                } else {
                    out << std::left << std::setw(static_cast<int>(col.width)) << cell;
                }
                if (is_header && colors::enabled()) {
                    out << colors::RESET;
                }

                if (i < temp.columns_.size() - 1) {
                    out << "  ";
                }
            }
            out << "\n";
        };

        Row header;
        for (const auto& col : temp.columns_) {
            header.push_back(col.header);
        }
        render_row(header, true);

        for (std::size_t i = 0; i < temp.columns_.size(); ++i) {
            out << std::string(temp.columns_[i].width, '-');
            if (i < temp.columns_.size() - 1) {
                out << "--";
            }
        }
        out << "\n";

        for (const auto& row : temp.rows_) {
            render_row(row, false);
        }
    }

    // ============================================================================
    // SummaryPrinter Implementation
    // ============================================================================

    SummaryPrinter::SummaryPrinter(std::ostream& out)
        : out_(out)
    {}

    void SummaryPrinter::print_summary(const CoverageSummary& summary) const {
        if (!summary.is_success()) {
            out_ << bold("Coverage: FAILED") << "\n";
            out_ << "  " << summary.error() << "\n";
            return;
        }

        const auto& metrics = summary.metrics();
        out_ << bold("Coverage Summary") << "\n";
        out_ << "  Line coverage:   " << bar_graph(metrics.line_coverage) << "  "
             << colorize_coverage(metrics.line_coverage) << "\n";
        out_ << "  Branch coverage: " << bar_graph(metrics.branch_coverage) << "  "
             << colorize_coverage(metrics.branch_coverage) << "\n";

        if (metrics.worst_classes.empty()) {
            out_ << "\n" << dim("No classes with measured lines in scope") << "\n";
            return;
        }

        out_ << "\n" << bold("Lowest Line Coverage")
             << " (" << metrics.worst_classes.size() << " classes)\n";

        Table table({
            {"#", 3, true},
            {"Class", 0, false}
        });
        for (std::size_t i = 0; i < metrics.worst_classes.size(); ++i) {
            table.add_row({std::to_string(i + 1), metrics.worst_classes[i]});
        }
        table.render(out_);
    }

    void SummaryPrinter::print_delta(const CoverageDelta& delta) const {
        out_ << bold("Change Since Baseline") << "\n";
        out_ << "  Line coverage:   " << format_delta(delta.line_delta) << "\n";
        out_ << "  Branch coverage: " << format_delta(delta.branch_delta) << "\n";

        if (!delta.improved_classes.empty()) {
            out_ << "\n" << bold("Left the worst list") << " (" << delta.improved_classes.size() << ")\n";
            for (const auto& name : delta.improved_classes) {
                out_ << "  - " << name << "\n";
            }
        }
        if (!delta.new_worst_classes.empty()) {
            out_ << "\n" << bold("Entered the worst list") << " (" << delta.new_worst_classes.size() << ")\n";
            for (const auto& name : delta.new_worst_classes) {
                out_ << "  + " << name << "\n";
            }
        }
    }

    void SummaryPrinter::print_located(const locator::LocatedReports& located) const {
        out_ << "tier: " << locator::tier_to_string(located.tier) << "\n";
        for (const auto& file : located.files) {
            out_ << file.string() << "\n";
        }
    }

}  // namespace covscope::cli
