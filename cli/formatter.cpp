//
// Created by gregorian-rayne on 1/14/26.
//

#include "lpa/cli/formatter.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <iomanip>
#include <sstream>

#include <unistd.h>

namespace lpa::cli
{
    namespace {

        constexpr auto RESET = "\033[0m";
        constexpr auto BOLD = "\033[1m";
        constexpr auto DIM = "\033[2m";
        constexpr auto RED = "\033[31m";
        constexpr auto GREEN = "\033[32m";
        constexpr auto YELLOW = "\033[33m";
        constexpr auto BLUE = "\033[34m";
        constexpr auto MAGENTA = "\033[35m";

        bool g_colors_enabled = true;

        std::string paint(const std::string_view text, const char* color) {
            if (!colors::enabled()) {
                return std::string(text);
            }
            return std::string(color) + std::string(text) + RESET;
        }

        std::string pluralize(const std::size_t count, const std::string_view word) {
            std::ostringstream ss;
            ss << count << " " << word << (count == 1 ? "" : "s");
            return ss.str();
        }

        std::string format_score(const double score) {
            std::ostringstream ss;
            ss << std::fixed << std::setprecision(1) << score << "%";
            return ss.str();
        }

    }  // namespace

    namespace colors {

        bool enabled() {
            return g_colors_enabled && isatty(fileno(stdout)) != 0;
        }

        void set_enabled(const bool enable) {
            g_colors_enabled = enable;
        }

    }  // namespace colors

    std::string format_duration(const Duration d) {
        const auto ms = std::max<std::int64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(d).count(), 0);

        std::ostringstream ss;
        if (ms >= 60'000) {
            ss << ms / 60'000 << "m " << (ms / 1000) % 60 << "s";
        } else if (ms >= 1000) {
            ss << ms / 1000 << "." << std::setfill('0') << std::setw(2) << (ms % 1000) / 10 << "s";
        } else {
            ss << ms << "ms";
        }
        return ss.str();
    }

    std::string format_count(const std::size_t count) {
        std::string digits = std::to_string(count);
        for (auto pos = static_cast<std::ptrdiff_t>(digits.size()) - 3; pos > 0; pos -= 3) {
            digits.insert(static_cast<std::size_t>(pos), ",");
        }
        return digits;
    }

    std::string colorize_severity(const Severity severity) {
        switch (severity) {
            case Severity::Critical: return paint(to_string(severity), MAGENTA);
            case Severity::High:     return paint(to_string(severity), RED);
            case Severity::Medium:   return paint(to_string(severity), YELLOW);
            case Severity::Low:      return paint(to_string(severity), BLUE);
        }
        return to_string(severity);
    }

    std::string colorize_status(const Status status) {
        switch (status) {
            case Status::Passed:  return paint(to_string(status), GREEN);
            case Status::Warning: return paint(to_string(status), YELLOW);
            case Status::Failed:  return paint(to_string(status), RED);
            case Status::Skipped: return paint(to_string(status), DIM);
        }
        return to_string(status);
    }

    Table::Table(std::vector<std::string> headers)
        : headers_(std::move(headers))
    {}

    void Table::add_row(Row row) {
        row.resize(headers_.size());
        rows_.push_back(std::move(row));
    }

    void Table::render(std::ostream& out) const {
        std::vector<std::size_t> widths;
        widths.reserve(headers_.size());
        for (const auto& header : headers_) {
            widths.push_back(header.size());
        }
        for (const auto& row : rows_) {
            for (std::size_t i = 0; i < widths.size(); ++i) {
                widths[i] = std::max(widths[i], row[i].size());
            }
        }

        const auto render_row = [&](const Row& row, const bool header) {
            for (std::size_t i = 0; i < widths.size(); ++i) {
                const bool last = i + 1 == widths.size();
                // No trailing padding on the last column.
                std::string cell = last ? row[i] : row[i] + std::string(widths[i] - row[i].size() + 2, ' ');
                out << (header ? paint(cell, BOLD) : cell);
            }
            out << "\n";
        };

        render_row(headers_, true);
        std::string rule;
        for (std::size_t i = 0; i < widths.size(); ++i) {
            rule += std::string(widths[i], '-') + (i + 1 < widths.size() ? "  " : "");
        }
        out << rule << "\n";
        for (const auto& row : rows_) {
            render_row(row, false);
        }
    }

    ReportPrinter::ReportPrinter(std::ostream& out)
        : out_(out)
    {}

    void ReportPrinter::print_report(const engine::AnalysisReport& report, const std::size_t max_issues) const {
        for (const auto& result : report.results) {
            if (!result.reported || result.status == Status::Passed || result.status == Status::Skipped) {
                continue;
            }
            print_analyzer(result, max_issues);
        }
        print_summary(report);
    }

    void ReportPrinter::print_analyzer(const engine::AnalyzerResult& result, const std::size_t max_issues) const {
        out_ << paint(result.name, BOLD) << " (" << result.rule_id << ") "
             << "[" << colorize_status(result.status) << "]\n";

        const std::size_t limit = max_issues == 0 ? result.issues.size() : std::min(max_issues, result.issues.size());
        for (std::size_t i = 0; i < limit; ++i) {
            const auto& issue = result.issues[i];
            out_ << "  " << issue.location.file.generic_string() << ":" << issue.location.line
                 << " [" << colorize_severity(issue.severity) << "] " << issue.message << "\n";
            if (!issue.recommendation.empty()) {
                out_ << "      " << paint(issue.recommendation, DIM) << "\n";
            }
        }
        if (limit < result.issues.size()) {
            out_ << "  ... " << pluralize(result.issues.size() - limit, "more issue") << "\n";
        }
        out_ << "\n";
    }

    void ReportPrinter::print_summary(const engine::AnalysisReport& report) const {
        const auto ran = report.count(Status::Passed) + report.count(Status::Warning) + report.count(Status::Failed);

        out_ << "Analyzed " << pluralize(report.files_total, "file")
             << " with " << pluralize(ran + report.count(Status::Skipped), "analyzer")
             << " in " << format_duration(report.duration) << "\n";

        out_ << "  " << paint(std::to_string(report.count(Status::Passed)) + " passed", GREEN)
             << ", " << paint(std::to_string(report.count(Status::Warning)) + " warning", YELLOW)
             << ", " << paint(std::to_string(report.count(Status::Failed)) + " failed", RED)
             << ", " << report.count(Status::Skipped) << " skipped\n";

        out_ << "  " << pluralize(report.total_issues(), "issue")
             << ", score " << format_score(report.score()) << "\n";
    }

}  // namespace lpa::cli
