//
// Created by gregorian-rayne on 1/14/26.
//

#ifndef LPA_FORMATTER_HPP
#define LPA_FORMATTER_HPP

/**
 * @file formatter.hpp
 * @brief Terminal output of the lpa commands.
 *
 * Colors are used only when stdout is a terminal and --no-color was not
 * given.
 */

#include "lpa/types.hpp"
#include "lpa/engine/report.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace lpa::cli
{
    namespace colors {

        /**
         * Returns true if colors should be used.
         */
        bool enabled();

        void set_enabled(bool enable);

    }  // namespace colors

    using Row = std::vector<std::string>;

    /**
     * Left-aligned columns sized to their widest cell, separated by two
     * spaces. Used by `lpa list` and `lpa models`.
     */
    class Table {
    public:
        explicit Table(std::vector<std::string> headers);

        void add_row(Row row);

        void render(std::ostream& out) const;

    private:
        std::vector<std::string> headers_;
        std::vector<Row> rows_;
    };

    [[nodiscard]] std::string format_duration(Duration d);

    /**
     * Formats a count with thousands separators (12,345).
     */
    [[nodiscard]] std::string format_count(std::size_t count);

    [[nodiscard]] std::string colorize_severity(Severity severity);
    [[nodiscard]] std::string colorize_status(Status status);

    /**
     * Prints an analysis report as text.
     *
     * One block per analyzer that warned or failed, listing its issues as
     * "file:line [severity] message" with the recommendation below, then
     * a summary line.
     */
    class ReportPrinter {
    public:
        explicit ReportPrinter(std::ostream& out);

        void print_report(const engine::AnalysisReport& report, std::size_t max_issues = 0) const;

        void print_analyzer(const engine::AnalyzerResult& result, std::size_t max_issues = 0) const;

        void print_summary(const engine::AnalysisReport& report) const;

    private:
        std::ostream& out_;
    };

}  // namespace lpa::cli

#endif //LPA_FORMATTER_HPP
