//
// Created by gregorian-rayne on 1/15/26.
//

#include "lpa/exporters/exporter.hpp"
#include "lpa/version.hpp"

#include "lpa/utils/file_utils.hpp"
#include "lpa/utils/json_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace lpa::exporters
{
    namespace {

        using json_utils::duration_to_ms;
        using json_utils::format_timestamp;

        /**
         * Escapes Markdown table cell content.
         */
        std::string escape_cell(const std::string& text) {
            std::string result;
            result.reserve(text.size());
            for (const char c : text) {
                switch (c) {
                case '|': result += "\\|"; break;
                case '\n': result += "<br>"; break;
                case '\r': break;
                default: result += c; break;
                }
            }
            return result;
        }

        std::string location_of(const Issue& issue) {
            std::ostringstream ss;
            ss << issue.location.file.generic_string();
            if (issue.location.line > 0) {
                ss << ":" << issue.location.line;
            }
            return ss.str();
        }

        std::vector<const engine::AnalyzerResult*> exported_results(
            const engine::AnalysisReport& report, const ExportOptions& options
        ) {
            std::vector<const engine::AnalyzerResult*> results;
            for (const auto& result : report.results) {
                if (!result.reported) {
                    continue;
                }
                if (!options.include_passed && result.issues.empty()) {
                    continue;
                }
                results.push_back(&result);
            }
            return results;
        }

        std::size_t issue_limit(const engine::AnalyzerResult& result, const ExportOptions& options) {
            return options.max_issues == 0 ? result.issues.size() : std::min(options.max_issues, result.issues.size());
        }

    }  // namespace

    // =============================================================================
    // Format Conversion
    // =============================================================================

    std::string_view format_to_string(const ExportFormat format) noexcept {
        switch (format) {
        case ExportFormat::JSON: return "json";
        case ExportFormat::Markdown: return "markdown";
        }
        return "unknown";
    }

    std::optional<ExportFormat> string_to_format(const std::string_view str) noexcept {
        if (str == "json" || str == "JSON") return ExportFormat::JSON;
        if (str == "markdown" || str == "md" || str == "Markdown") return ExportFormat::Markdown;
        return std::nullopt;
    }

    // =============================================================================
    // Exporter Factory
    // =============================================================================

    Result<std::unique_ptr<IExporter>, Error> ExporterFactory::create(const ExportFormat format) {
        switch (format) {
        case ExportFormat::JSON:
            return Result<std::unique_ptr<IExporter>, Error>::success(
                std::make_unique<JsonExporter>()
            );
        case ExportFormat::Markdown:
            return Result<std::unique_ptr<IExporter>, Error>::success(
                std::make_unique<MarkdownExporter>()
            );
        }
        return Result<std::unique_ptr<IExporter>, Error>::failure(
            Error::invalid_argument("Unknown export format")
        );
    }

    Result<std::unique_ptr<IExporter>, Error> ExporterFactory::create_for_file(const fs::path& path) {
        std::string ext = path.extension().string();
        std::ranges::transform(ext, ext.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (ext == ".json") return create(ExportFormat::JSON);
        if (ext == ".md" || ext == ".markdown") return create(ExportFormat::Markdown);

        return Result<std::unique_ptr<IExporter>, Error>::failure(
            Error::invalid_argument("Cannot determine format from extension", ext)
        );
    }

    // =============================================================================
    // Shared
    // =============================================================================

    Result<void, Error> IExporter::export_to_file(
        const fs::path& path,
        const engine::AnalysisReport& report,
        const ExportOptions& options
    ) const {
        auto content = export_to_string(report, options);
        if (content.is_err()) {
            return Result<void, Error>::failure(content.error());
        }
        return file_utils::write_file(path, content.value());
    }

    Result<std::string, Error> IExporter::export_to_string(
        const engine::AnalysisReport& report,
        const ExportOptions& options
    ) const {
        std::ostringstream ss;
        if (auto result = export_to_stream(ss, report, options); result.is_err()) {
            return Result<std::string, Error>::failure(result.error());
        }
        return Result<std::string, Error>::success(ss.str());
    }

    // =============================================================================
    // JSON Exporter
    // =============================================================================

    Result<void, Error> JsonExporter::export_to_stream(
        std::ostream& stream,
        const engine::AnalysisReport& report,
        const ExportOptions& options
    ) const {
        using json = nlohmann::json;

        json output;

        if (options.include_metadata) {
            output["tool"] = PROJECT_NAME;
            output["version"] = VERSION_STRING;
            output["schema_version"] = options.json_schema_version;
            output["generated_at"] = format_timestamp(report.generated_at);
        }

        json summary;
        summary["files"] = report.files_total;
        summary["passed"] = report.count(Status::Passed);
        summary["warnings"] = report.count(Status::Warning);
        summary["failed"] = report.count(Status::Failed);
        summary["skipped"] = report.count(Status::Skipped);
        summary["issues"] = report.total_issues();
        summary["score"] = report.score();
        summary["duration_ms"] = duration_to_ms(report.duration);
        output["summary"] = summary;

        json analyzers = json::array();
        for (const auto* result : exported_results(report, options)) {
            json entry;
            entry["id"] = result->rule_id;
            entry["name"] = result->name;
            entry["category"] = to_string(result->category);
            entry["status"] = to_string(result->status);
            entry["files_analyzed"] = result->files_analyzed;
            entry["files_skipped"] = result->files_skipped;

            json issues = json::array();
            const auto limit = issue_limit(*result, options);
            for (std::size_t i = 0; i < limit; ++i) {
                const auto& issue = result->issues[i];
                json item;
                item["severity"] = to_string(issue.severity);
                item["code"] = issue.code;
                item["message"] = issue.message;
                item["recommendation"] = issue.recommendation;
                item["file"] = issue.location.file.generic_string();
                item["line"] = issue.location.line;
                item["end_line"] = issue.location.end_line;
                if (!issue.excerpt.empty()) {
                    item["excerpt"] = issue.excerpt;
                }
                if (options.include_metadata_maps && !issue.metadata.empty()) {
                    item["metadata"] = issue.metadata;
                }
                issues.push_back(std::move(item));
            }
            entry["issues"] = std::move(issues);
            analyzers.push_back(std::move(entry));
        }
        output["analyzers"] = std::move(analyzers);

        try {
            const int indent = options.pretty_print ? 2 : -1;
            stream << output.dump(indent, ' ', false, json::error_handler_t::replace) << "\n";
        } catch (const json::type_error& e) {
            return Result<void, Error>::failure(
                Error::internal_error("JSON serialization error", e.what())
            );
        }

        if (!stream) {
            return Result<void, Error>::failure(Error::io_error("Failed to write JSON report"));
        }
        return Result<void, Error>::success();
    }

    // =============================================================================
    // Markdown Exporter
    // =============================================================================

    Result<void, Error> MarkdownExporter::export_to_stream(
        std::ostream& stream,
        const engine::AnalysisReport& report,
        const ExportOptions& options
    ) const {
        stream << "# " << PROJECT_NAME << " Report\n\n";
        if (options.include_metadata) {
            stream << "_Generated by " << PROJECT_SHORT_NAME << " v" << VERSION_STRING
                   << " on " << format_timestamp(report.generated_at) << "_\n\n";
        }

        stream << "## Summary\n\n";
        stream << "| Metric | Value |\n";
        stream << "|--------|-------|\n";
        stream << "| Files | " << report.files_total << " |\n";
        stream << "| Passed | " << report.count(Status::Passed) << " |\n";
        stream << "| Warnings | " << report.count(Status::Warning) << " |\n";
        stream << "| Failed | " << report.count(Status::Failed) << " |\n";
        stream << "| Skipped | " << report.count(Status::Skipped) << " |\n";
        stream << "| Issues | " << report.total_issues() << " |\n";
        stream << "| Score | " << std::fixed << std::setprecision(1) << report.score() << "% |\n\n";

        const auto results = exported_results(report, options);

        stream << "## Analyzers\n\n";
        stream << "| Analyzer | Category | Status | Issues |\n";
        stream << "|----------|----------|--------|--------|\n";
        for (const auto* result : results) {
            stream << "| " << escape_cell(result->name) << " (`" << result->rule_id << "`)"
                   << " | " << to_string(result->category)
                   << " | " << to_string(result->status)
                   << " | " << result->issues.size() << " |\n";
        }
        stream << "\n";

        for (const auto* result : results) {
            if (result->issues.empty()) {
                continue;
            }

            stream << "### " << result->name << "\n\n";
            stream << "| Severity | Location | Message |\n";
            stream << "|----------|----------|---------|\n";

            const auto limit = issue_limit(*result, options);
            for (std::size_t i = 0; i < limit; ++i) {
                const auto& issue = result->issues[i];
                stream << "| " << to_string(issue.severity)
                       << " | `" << location_of(issue) << "`"
                       << " | " << escape_cell(issue.message) << " |\n";
            }
            if (limit < result->issues.size()) {
                stream << "\n_" << (result->issues.size() - limit) << " more issues not shown._\n";
            }
            stream << "\n";

            // Recommendations repeat across issues of the same code
            std::vector<std::string> seen;
            for (std::size_t i = 0; i < limit; ++i) {
                const auto& issue = result->issues[i];
                if (issue.recommendation.empty() ||
                    std::ranges::find(seen, issue.code) != seen.end()) {
                    continue;
                }
                seen.push_back(issue.code);
                stream << "- **" << issue.code << "**: " << issue.recommendation << "\n";
            }
            if (!seen.empty()) {
                stream << "\n";
            }
        }

        if (!stream) {
            return Result<void, Error>::failure(Error::io_error("Failed to write Markdown report"));
        }
        return Result<void, Error>::success();
    }

} // namespace lpa::exporters
