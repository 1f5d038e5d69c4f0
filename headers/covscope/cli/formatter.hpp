//
// Created by gregorian-rayne on 02/16/26.
//

#ifndef COVSCOPE_FORMATTER_HPP
#define COVSCOPE_FORMATTER_HPP

/**
 * @file formatter.hpp
 * @brief Output formatting utilities for CLI.
 */

#include "covscope/types.hpp"
#include "covscope/locator/report_locator.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace covscope::cli
{
    /**
     * Terminal color codes.
     */
    namespace colors {

        extern const char* RESET;
        extern const char* BOLD;
        extern const char* DIM;

        extern const char* RED;
        extern const char* GREEN;
        extern const char* YELLOW;

        /**
         * Returns true if colors should be used.
         */
        bool enabled();

        /**
         * Enable/disable colors globally.
         */
        void set_enabled(bool enable);

    }  // namespace colors

    bool is_tty();

    /**
     * Table column definition.
     */
    struct Column {
        std::string header;
        std::size_t width = 0;    // 0 = auto
        bool right_align = false;
    };

    using Row = std::vector<std::string>;

    /**
     * Table formatter for aligned output.
     */
    class Table {
    public:
        explicit Table(std::vector<Column> columns);

        void add_row(Row row);

        [[nodiscard]] std::string render() const;
        void render(std::ostream& out) const;

    private:
        void calculate_widths();

        std::vector<Column> columns_;
        std::vector<Row> rows_;
    };

    /**
     * Formats a ratio in [0, 1] as a percentage ("82.50%").
     */
    [[nodiscard]] std::string format_percent(double ratio);

    /**
     * Formats a ratio difference with an explicit sign ("+3.10 pts").
     */
    [[nodiscard]] std::string format_delta(double delta);

    /**
     * Colors a percentage red below 50%, yellow below 80%, green otherwise.
     */
    [[nodiscard]] std::string colorize_coverage(double ratio);

    /**
     * Creates a bar graph of a ratio.
     */
    [[nodiscard]] std::string bar_graph(double ratio, std::size_t width = 20);

    /**
     * Human-readable rendering of results.
     */
    class SummaryPrinter {
    public:
        explicit SummaryPrinter(std::ostream& out);

        void print_summary(const CoverageSummary& summary) const;
        void print_delta(const CoverageDelta& delta) const;
        void print_located(const locator::LocatedReports& located) const;

    private:
        std::ostream& out_;
    };

}  // namespace covscope::cli

#endif //COVSCOPE_FORMATTER_HPP
