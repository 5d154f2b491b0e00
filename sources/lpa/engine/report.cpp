//
// Created by gregorian-rayne on 1/15/26.
//

#include "lpa/engine/report.hpp"

#include <algorithm>

namespace lpa::engine
{
    void AnalyzerResult::refresh_status() {
        if (files_analyzed == 0 && files_skipped == 0) {
            status = Status::Skipped;
            return;
        }
        if (issues.empty()) {
            status = Status::Passed;
            return;
        }
        const bool failing = std::ranges::any_of(issues, [this](const Issue& issue) {
            return issue.severity >= failing_severity;
        });
        status = failing ? Status::Failed : Status::Warning;
    }

    std::size_t AnalysisReport::count(const Status status) const noexcept {
        return static_cast<std::size_t>(std::ranges::count_if(results, [status](const AnalyzerResult& result) {
            return result.reported && result.status == status;
        }));
    }

    std::size_t AnalysisReport::total_issues() const noexcept {
        std::size_t total = 0;
        for (const auto& result : results) {
            if (result.reported) {
                total += result.issues.size();
            }
        }
        return total;
    }

    double AnalysisReport::score() const noexcept {
        std::size_t ran = 0;
        for (const auto& result : results) {
            if (result.reported && result.status != Status::Skipped) {
                ++ran;
            }
        }
        if (ran == 0) {
            return 100.0;
        }
        return static_cast<double>(count(Status::Passed)) / static_cast<double>(ran) * 100.0;
    }

    bool AnalysisReport::exceeds(const std::optional<Severity> fail_on) const noexcept {
        if (!fail_on) {
            return false;
        }
        for (const auto& result : results) {
            if (!result.reported) {
                continue;
            }
            for (const auto& issue : result.issues) {
                if (issue.severity >= *fail_on) {
                    return true;
                }
            }
        }
        return false;
    }

    const AnalyzerResult* AnalysisReport::find(const std::string_view rule_id) const noexcept {
        for (const auto& result : results) {
            if (result.rule_id == rule_id) {
                return &result;
            }
        }
        return nullptr;
    }

    Result<std::optional<Severity>, Error> parse_fail_on(const std::string_view level) {
        if (level == "never") {
            return Result<std::optional<Severity>, Error>::success(std::nullopt);
        }
        if (auto severity = severity_from_string(level)) {
            return Result<std::optional<Severity>, Error>::success(*severity);
        }
        return Result<std::optional<Severity>, Error>::failure(
            Error::invalid_argument("Unknown fail-on level, expected never, low, medium, high or critical",
                                    std::string(level))
        );
    }

}  // namespace lpa::engine
