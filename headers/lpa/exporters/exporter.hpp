//
// Created by gregorian-rayne on 1/15/26.
//

#ifndef LPA_EXPORTER_HPP
#define LPA_EXPORTER_HPP

/**
 * @file exporter.hpp
 * @brief Export interfaces for analysis reports.
 *
 * Provides a unified interface for writing an AnalysisReport:
 * - JSON (machine-readable, versioned schema)
 * - Markdown (pull request comments and documentation)
 *
 * Analyzers listed in report.dont_report are never exported.
 */

#include "lpa/result.hpp"
#include "lpa/error.hpp"
#include "lpa/types.hpp"
#include "lpa/engine/report.hpp"

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace lpa::exporters
{
    enum class ExportFormat {
        JSON,
        Markdown
    };

    /**
     * Export options for controlling output.
     */
    struct ExportOptions {
        bool pretty_print = true;           // Format output for readability
        bool include_metadata = true;       // Include version, timestamp, etc.
        bool include_passed = true;         // List analyzers without issues
        bool include_metadata_maps = true;  // Per-issue analyzer-specific metadata
        std::size_t max_issues = 0;         // Per analyzer, 0 = unlimited

        std::string json_schema_version = "1.0.0";
    };

    /**
     * Interface for all exporters.
     */
    class IExporter {
    public:
        virtual ~IExporter() = default;

        [[nodiscard]] virtual ExportFormat format() const noexcept = 0;

        /**
         * Exports a report to a file, creating parent directories.
         */
        [[nodiscard]] virtual Result<void, Error> export_to_file(
            const fs::path& path,
            const engine::AnalysisReport& report,
            const ExportOptions& options
        ) const;

        [[nodiscard]] virtual Result<void, Error> export_to_stream(
            std::ostream& stream,
            const engine::AnalysisReport& report,
            const ExportOptions& options
        ) const = 0;

        [[nodiscard]] virtual Result<std::string, Error> export_to_string(
            const engine::AnalysisReport& report,
            const ExportOptions& options
        ) const;
    };

    /**
     * Factory for creating exporters.
     */
    class ExporterFactory {
    public:
        [[nodiscard]] static Result<std::unique_ptr<IExporter>, Error> create(ExportFormat format);

        /**
         * Picks the exporter from the file extension: .json, .md or
         * .markdown, in any case.
         */
        [[nodiscard]] static Result<std::unique_ptr<IExporter>, Error> create_for_file(const fs::path& path);
    };

    [[nodiscard]] std::string_view format_to_string(ExportFormat format) noexcept;

    [[nodiscard]] std::optional<ExportFormat> string_to_format(std::string_view str) noexcept;

    /**
     * JSON Exporter.
     *
     * Top-level keys: tool, version, schema_version, generated_at,
     * summary and analyzers (one object per reported analyzer, each with
     * its issues).
     */
    class JsonExporter : public IExporter {
    public:
        [[nodiscard]] ExportFormat format() const noexcept override { return ExportFormat::JSON; }

        [[nodiscard]] Result<void, Error> export_to_stream(
            std::ostream& stream,
            const engine::AnalysisReport& report,
            const ExportOptions& options
        ) const override;
    };

    /**
     * Markdown Exporter.
     */
    class MarkdownExporter : public IExporter {
    public:
        [[nodiscard]] ExportFormat format() const noexcept override { return ExportFormat::Markdown; }

        [[nodiscard]] Result<void, Error> export_to_stream(
            std::ostream& stream,
            const engine::AnalysisReport& report,
            const ExportOptions& options
        ) const override;
    };

} // namespace lpa::exporters

#endif //LPA_EXPORTER_HPP
