//
// Created by gregorian-rayne on 1/15/26.
//

#ifndef LPA_REPORT_HPP
#define LPA_REPORT_HPP

/**
 * @file report.hpp
 * @brief Per-analyzer results and the aggregated analysis report.
 */

#include "lpa/result.hpp"
#include "lpa/error.hpp"
#include "lpa/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lpa::engine {

    /**
     * Outcome of one analyzer over the analyzed file set.
     */
    struct AnalyzerResult {
        std::string rule_id;
        std::string name;
        std::string description;
        Category category = Category::BestPractices;
        Severity failing_severity = Severity::Medium;
        Status status = Status::Skipped;
        std::vector<Issue> issues;          ///< Sorted by file, line, then message
        std::size_t files_analyzed = 0;
        std::size_t files_skipped = 0;      ///< Matched but unreadable or unparseable

        /// False for rules listed in report.dont_report: computed, never shown or counted.
        bool reported = true;

        /**
         * Recomputes status from the issues and file counts.
         *
         * - no file matched: Skipped
         * - no issue: Passed, also when every matched file was unreadable
         *   or unparseable
         * - any issue at or above failing_severity: Failed
         * - otherwise: Warning
         */
        void refresh_status();
    };

    /**
     * Results of every analyzer of one run.
     */
    struct AnalysisReport {
        std::vector<AnalyzerResult> results;
        std::size_t files_total = 0;
        Timestamp generated_at;
        Duration duration = Duration::zero();

        [[nodiscard]] std::size_t count(Status status) const noexcept;

        /// Issues of reported analyzers.
        [[nodiscard]] std::size_t total_issues() const noexcept;

        /**
         * Share of passed analyzers among those that ran, in percent.
         *
         * 100 when no analyzer ran.
         */
        [[nodiscard]] double score() const noexcept;

        /**
         * Checks whether any reported issue is at or above a severity.
         *
         * @param fail_on Threshold, or nullopt for "never".
         */
        [[nodiscard]] bool exceeds(std::optional<Severity> fail_on) const noexcept;

        [[nodiscard]] const AnalyzerResult* find(std::string_view rule_id) const noexcept;
    };

    /**
     * Parses a fail_on level: never, low, medium, high or critical.
     *
     * @return The threshold, nullopt for "never", or InvalidArgument.
     */
    [[nodiscard]] Result<std::optional<Severity>, Error> parse_fail_on(std::string_view level);

}  // namespace lpa::engine

#endif //LPA_REPORT_HPP
