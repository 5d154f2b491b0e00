//
// Created by gregorian-rayne on 1/12/26.
//

#ifndef LPA_TYPES_HPP
#define LPA_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core value types shared by every analyzer.
 *
 * - Severity, Status, Category: enumerations with string conversions
 * - SourceLocation: file plus line span of a finding
 * - Issue: a single finding produced by an analyzer
 *
 * Issue metadata is a free-form JSON object so that each analyzer can
 * attach its own structured facts without widening the Issue type.
 */

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace lpa {

    namespace fs = std::filesystem;

    using Duration = std::chrono::nanoseconds;
    using Timestamp = std::chrono::system_clock::time_point;

    // ============================================================================
    // Severity
    // ============================================================================

    /**
     * Issue severity, ordered from least to most severe.
     */
    enum class Severity {
        Low,
        Medium,
        High,
        Critical
    };

    inline const char* to_string(const Severity severity) noexcept {
        switch (severity) {
            case Severity::Low:      return "low";
            case Severity::Medium:   return "medium";
            case Severity::High:     return "high";
            case Severity::Critical: return "critical";
        }
        return "unknown";
    }

    inline std::optional<Severity> severity_from_string(const std::string_view str) noexcept {
        if (str == "low") return Severity::Low;
        if (str == "medium") return Severity::Medium;
        if (str == "high") return Severity::High;
        if (str == "critical") return Severity::Critical;
        return std::nullopt;
    }

    // ============================================================================
    // Status
    // ============================================================================

    /**
     * Outcome of one analyzer over the analyzed file set.
     */
    enum class Status {
        Passed,
        Warning,
        Failed,
        Skipped
    };

    inline const char* to_string(const Status status) noexcept {
        switch (status) {
            case Status::Passed:  return "passed";
            case Status::Warning: return "warning";
            case Status::Failed:  return "failed";
            case Status::Skipped: return "skipped";
        }
        return "unknown";
    }

    // ============================================================================
    // Category
    // ============================================================================

    enum class Category {
        BestPractices,
        Performance,
        Reliability,
        Security
    };

    inline const char* to_string(const Category category) noexcept {
        switch (category) {
            case Category::BestPractices: return "best-practices";
            case Category::Performance:   return "performance";
            case Category::Reliability:   return "reliability";
            case Category::Security:      return "security";
        }
        return "unknown";
    }

    inline std::optional<Category> category_from_string(const std::string_view str) noexcept {
        if (str == "best-practices") return Category::BestPractices;
        if (str == "performance") return Category::Performance;
        if (str == "reliability") return Category::Reliability;
        if (str == "security") return Category::Security;
        return std::nullopt;
    }

    // ============================================================================
    // Findings
    // ============================================================================

    /**
     * Source code location of a finding.
     *
     * Lines are 1-based. end_line equals line for single-line findings.
     */
    struct SourceLocation {
        fs::path file;
        std::size_t line = 0;
        std::size_t end_line = 0;

        [[nodiscard]] bool has_location() const noexcept {
            return !file.empty() && line > 0;
        }
    };

    /**
     * A single finding.
     */
    struct Issue {
        std::string rule_id;
        Severity severity = Severity::Low;
        std::string message;
        std::string code;               // Machine-stable issue code
        std::string recommendation;
        SourceLocation location;
        std::string excerpt;            // Source text of the offending construct, may be empty
        nlohmann::json metadata = nlohmann::json::object();
    };

    /**
     * Orders issues by file, then line, then message.
     */
    inline bool issue_less(const Issue& a, const Issue& b) {
        if (a.location.file != b.location.file) {
            return a.location.file < b.location.file;
        }
        if (a.location.line != b.location.line) {
            return a.location.line < b.location.line;
        }
        if (a.message != b.message) {
            return a.message < b.message;
        }
        return a.code < b.code;
    }

}  // namespace lpa

#endif //LPA_TYPES_HPP
