//
// Created by gregorian-rayne on 02/09/26.
//

#ifndef COVSCOPE_TYPES_HPP
#define COVSCOPE_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core data structures for coverage aggregation.
 *
 * - Counters: CounterType, Counter
 * - Per-report data: ClassCoverageRecord, ParseOutcome
 * - Query: ScopeQuery
 * - Results: CoverageMetrics, CoverageSummary, CoverageDelta
 *
 * All types are plain values that move cheaply between worker threads.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <set>
#include <variant>
#include <stdexcept>
#include <filesystem>
#include <utility>

namespace covscope {

    namespace fs = std::filesystem;

    /**
     * Maximum number of entries in CoverageMetrics::worst_classes.
     */
    inline constexpr std::size_t MAX_WORST_CLASSES = 20;

    // ============================================================================
    // Counters
    // ============================================================================

    /**
     * Metric kind of a report counter.
     */
    enum class CounterType {
        Line,
        Branch
    };

    inline const char* counter_type_to_string(CounterType type) noexcept {
        switch (type) {
            case CounterType::Line:   return "LINE";
            case CounterType::Branch: return "BRANCH";
        }
        return "UNKNOWN";
    }

    /**
     * A missed/covered pair for one metric.
     *
     * Both fields are unsigned, so the non-negative invariant holds by type.
     */
    struct Counter {
        std::uint64_t missed = 0;
        std::uint64_t covered = 0;

        [[nodiscard]] std::uint64_t total() const noexcept {
            return missed + covered;
        }

        [[nodiscard]] bool has_data() const noexcept {
            return total() > 0;
        }

        /**
         * Covered fraction, or 0.0 when nothing was measured.
         */
        [[nodiscard]] double ratio() const noexcept {
            if (!has_data()) {
                return 0.0;
            }
            return static_cast<double>(covered) / static_cast<double>(total());
        }

        Counter& operator+=(const Counter& other) noexcept {
            missed += other.missed;
            covered += other.covered;
            return *this;
        }

        bool operator==(const Counter& other) const noexcept = default;
    };

    inline Counter operator+(Counter lhs, const Counter& rhs) noexcept {
        lhs += rhs;
        return lhs;
    }

    // ============================================================================
    // Per-report data
    // ============================================================================

    /**
     * Line coverage of one class that survived the scope filter.
     */
    struct ClassCoverageRecord {
        std::string name;     ///< Fully qualified, dot separated
        Counter line;

        [[nodiscard]] double ratio() const noexcept {
            return line.ratio();
        }
    };

    /**
     * Everything extracted from one report file.
     *
     * Only classes with measured lines appear in `classes`; the counters
     * already include every in-scope class of the file.
     */
    struct ParseOutcome {
        fs::path source;
        Counter line;
        Counter branch;
        std::vector<ClassCoverageRecord> classes;
        std::size_t included_classes = 0;
        std::size_t excluded_classes = 0;
    };

    // ============================================================================
    // Query
    // ============================================================================

    /**
     * Filter settings for one aggregation request.
     *
     * target_modules only steers report discovery; packages and classes
     * select individual classes. Built-in exclusions live in ScopeFilter.
     */
    struct ScopeQuery {
        std::set<std::string> target_modules;
        std::set<std::string> target_packages;
        std::set<std::string> target_classes;

        [[nodiscard]] bool has_class_scope() const noexcept {
            return !target_packages.empty() || !target_classes.empty();
        }

        /**
         * Builds a query from comma-separated lists.
         *
         * Entries are trimmed and empty entries dropped.
         */
        static ScopeQuery from_lists(
            std::string_view modules,
            std::string_view packages,
            std::string_view classes
        );
    };

    // ============================================================================
    // Results
    // ============================================================================

    /**
     * Scope-local coverage figures.
     */
    struct CoverageMetrics {
        double line_coverage = 0.0;             ///< In [0, 1]
        double branch_coverage = 0.0;           ///< In [0, 1]
        std::vector<std::string> worst_classes; ///< Ascending coverage, at most MAX_WORST_CLASSES
    };

    /**
     * Terminal result of a coverage request.
     *
     * Holds either the metrics of a successful aggregation or the message of
     * a failed one, never both.
     */
    class CoverageSummary {
    public:
        static CoverageSummary success(CoverageMetrics metrics) {
            return CoverageSummary(std::move(metrics));
        }

        static CoverageSummary failure(std::string message) {
            return CoverageSummary(Failure{std::move(message)});
        }

        [[nodiscard]] bool is_success() const noexcept {
            return data_.index() == 0;
        }

        /**
         * @throws std::logic_error on a failure summary.
         */
        [[nodiscard]] const CoverageMetrics& metrics() const {
            if (!is_success()) {
                throw std::logic_error("CoverageSummary::metrics() called on failure summary");
            }
            return std::get<0>(data_);
        }

        /**
         * @throws std::logic_error on a success summary.
         */
        [[nodiscard]] const std::string& error() const {
            if (is_success()) {
                throw std::logic_error("CoverageSummary::error() called on success summary");
            }
            return std::get<1>(data_).message;
        }

    private:
        struct Failure {
            std::string message;
        };

        explicit CoverageSummary(CoverageMetrics metrics) : data_(std::move(metrics)) {}
        explicit CoverageSummary(Failure failure) : data_(std::move(failure)) {}

        std::variant<CoverageMetrics, Failure> data_;
    };

    /**
     * Change between two successful summaries (current minus baseline).
     */
    struct CoverageDelta {
        double line_delta = 0.0;
        double branch_delta = 0.0;
        std::vector<std::string> improved_classes;   ///< Left the worst list
        std::vector<std::string> new_worst_classes;  ///< Entered the worst list
    };

    /**
     * Knobs for one aggregation run.
     */
    struct AggregationOptions {
        std::size_t max_threads = 0;  ///< 0 means auto-detect
    };

}  // namespace covscope

#endif //COVSCOPE_TYPES_HPP
