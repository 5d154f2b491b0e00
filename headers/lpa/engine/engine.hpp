//
// Created by gregorian-rayne on 1/15/26.
//

#ifndef LPA_ENGINE_HPP
#define LPA_ENGINE_HPP

/**
 * @file engine.hpp
 * @brief Runs configured analyzers over a set of PHP files.
 *
 * Each file is read, parsed and pre-scanned for suppression markers once.
 * A single scope-tracked traversal then drives the visitors of every
 * analyzer whose should_analyze() accepts the file. Files are processed
 * in parallel; analyzers are shared read-only between workers.
 *
 * A file that cannot be read or parsed is skipped for every analyzer and
 * logged at debug level; it never fails the run.
 */

#include "lpa/analyzers/analyzer.hpp"
#include "lpa/engine/report.hpp"
#include "lpa/result.hpp"
#include "lpa/error.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace lpa::models {
    class ModelRegistry;
}

namespace lpa::engine {

    /**
     * A file to analyze.
     */
    struct SourceFile {
        fs::path path;
        std::string relative_path;      ///< Forward slashes, relative to the base directory
    };

    struct EngineOptions {
        unsigned int threads = 0;                   ///< 0 = hardware concurrency
        std::set<std::string, std::less<>> dont_report;

        /// Extra exclusion globs per rule id, on top of the analyzer's own should_analyze()
        std::map<std::string, std::vector<std::string>, std::less<>> excluded_paths;
    };

    /**
     * Result of analyzing one file with every analyzer.
     */
    struct FileOutcome {
        bool parsed = false;
        std::vector<bool> matched;                  ///< Index-aligned with the analyzer list
        std::vector<std::vector<Issue>> issues;     ///< Index-aligned with the analyzer list
    };

    class AnalysisEngine {
    public:
        explicit AnalysisEngine(const models::ModelRegistry& registry, EngineOptions options = {});

        /**
         * Runs the analyzers over the files.
         *
         * Analyzers must already be configured.
         */
        [[nodiscard]] AnalysisReport run(const std::vector<std::unique_ptr<analyzers::IAnalyzer>>& analyzers,
                                         const std::vector<SourceFile>& files) const;

        /**
         * Analyzes one in-memory source.
         */
        [[nodiscard]] FileOutcome analyze_source(const std::vector<std::unique_ptr<analyzers::IAnalyzer>>& analyzers,
                                                 const SourceFile& file,
                                                 std::string source) const;

        [[nodiscard]] const EngineOptions& options() const noexcept { return options_; }

    private:
        [[nodiscard]] bool matches(const analyzers::IAnalyzer& analyzer, std::string_view relative_path) const;

        [[nodiscard]] FileOutcome analyze_file(const std::vector<std::unique_ptr<analyzers::IAnalyzer>>& analyzers,
                                               const SourceFile& file) const;

        const models::ModelRegistry& registry_;
        EngineOptions options_;
    };

    /**
     * Creates and configures the analyzers to run.
     *
     * @param registry Source of analyzer factories.
     * @param enabled Rule ids to run; empty runs every registered analyzer.
     * @param settings Per-rule settings; rules without an entry keep their defaults.
     * @return The configured analyzers, or the first ConfigError.
     */
    [[nodiscard]] Result<std::vector<std::unique_ptr<analyzers::IAnalyzer>>, Error> create_analyzers(
        const analyzers::AnalyzerRegistry& registry,
        const std::vector<std::string>& enabled,
        const std::vector<analyzers::AnalyzerSettings>& settings);

}  // namespace lpa::engine

#endif //LPA_ENGINE_HPP
