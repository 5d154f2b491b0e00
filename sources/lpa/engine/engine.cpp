//
// Created by gregorian-rayne on 1/15/26.
//

#include "lpa/engine/engine.hpp"

#include "lpa/models/model_registry.hpp"
#include "lpa/scope/scope_tracker.hpp"
#include "lpa/scope/suppression.hpp"
#include "lpa/scope/traverser.hpp"
#include "lpa/syntax/syntax_tree.hpp"
#include "lpa/utils/file_utils.hpp"
#include "lpa/utils/logging.hpp"
#include "lpa/utils/parallel.hpp"
#include "lpa/utils/path_utils.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <utility>

namespace lpa::engine
{
    AnalysisEngine::AnalysisEngine(const models::ModelRegistry& registry, EngineOptions options)
        : registry_(registry), options_(std::move(options)) {}

    bool AnalysisEngine::matches(const analyzers::IAnalyzer& analyzer, const std::string_view relative_path) const {
        if (!analyzer.should_analyze(relative_path)) {
            return false;
        }
        const auto excluded = options_.excluded_paths.find(analyzer.id());
        if (excluded == options_.excluded_paths.end()) {
            return true;
        }
        return std::ranges::none_of(excluded->second, [relative_path](const std::string& pattern) {
            return path_utils::glob_match(relative_path, pattern);
        });
    }

    FileOutcome AnalysisEngine::analyze_source(
        const std::vector<std::unique_ptr<analyzers::IAnalyzer>>& analyzers,
        const SourceFile& file,
        std::string source
    ) const {
        FileOutcome outcome;
        outcome.matched.resize(analyzers.size(), false);
        outcome.issues.resize(analyzers.size());

        bool any_matched = false;
        for (std::size_t i = 0; i < analyzers.size(); ++i) {
            outcome.matched[i] = matches(*analyzers[i], file.relative_path);
            any_matched = any_matched || outcome.matched[i];
        }
        if (!any_matched) {
            return outcome;
        }

        auto tree = syntax::SyntaxTree::parse(std::move(source));
        if (tree.is_err()) {
            logging::get()->debug("Skipping {}: {}", file.relative_path, tree.error().to_string());
            return outcome;
        }
        outcome.parsed = true;

        const auto suppressions = scope::SuppressionIndex::build(tree.value());
        scope::ScopeTracker scopes(registry_, suppressions);
        analyzers::FileContext context(file.path, file.relative_path, tree.value(), registry_, scopes, suppressions);

        std::vector<std::unique_ptr<scope::FileVisitor>> visitors;
        std::vector<scope::FileVisitor*> attached;
        for (std::size_t i = 0; i < analyzers.size(); ++i) {
            if (!outcome.matched[i]) {
                continue;
            }
            visitors.push_back(analyzers[i]->create_visitor(context));
            attached.push_back(visitors.back().get());
        }

        scope::Traverser traverser(scopes, std::move(attached));
        traverser.run(tree.value());

        for (std::size_t i = 0; i < analyzers.size(); ++i) {
            if (outcome.matched[i]) {
                outcome.issues[i] = context.take_issues(analyzers[i]->id());
            }
        }
        return outcome;
    }

    FileOutcome AnalysisEngine::analyze_file(
        const std::vector<std::unique_ptr<analyzers::IAnalyzer>>& analyzers,
        const SourceFile& file
    ) const {
        auto content = file_utils::read_file(file.path);
        if (content.is_err()) {
            logging::get()->debug("Skipping {}: {}", file.relative_path, content.error().to_string());

            FileOutcome outcome;
            outcome.issues.resize(analyzers.size());
            for (const auto& analyzer : analyzers) {
                outcome.matched.push_back(matches(*analyzer, file.relative_path));
            }
            return outcome;
        }
        return analyze_source(analyzers, file, std::move(content).value());
    }

    AnalysisReport AnalysisEngine::run(
        const std::vector<std::unique_ptr<analyzers::IAnalyzer>>& analyzers,
        const std::vector<SourceFile>& files
    ) const {
        const auto start_time = std::chrono::steady_clock::now();

        AnalysisReport report;
        report.files_total = files.size();
        report.results.reserve(analyzers.size());
        for (const auto& analyzer : analyzers) {
            AnalyzerResult result;
            result.rule_id = std::string(analyzer->id());
            result.name = std::string(analyzer->name());
            result.description = std::string(analyzer->description());
            result.category = analyzer->category();
            result.failing_severity = analyzer->failing_severity();
            result.reported = !options_.dont_report.contains(analyzer->id());
            report.results.push_back(std::move(result));
        }

        auto outcomes = parallel::map(files, [this, &analyzers](const SourceFile& file) {
            return analyze_file(analyzers, file);
        }, options_.threads);

        for (auto& outcome : outcomes) {
            for (std::size_t i = 0; i < analyzers.size(); ++i) {
                if (!outcome.matched[i]) {
                    continue;
                }
                auto& result = report.results[i];
                if (!outcome.parsed) {
                    ++result.files_skipped;
                    continue;
                }
                ++result.files_analyzed;
                std::ranges::move(outcome.issues[i], std::back_inserter(result.issues));
            }
        }

        for (std::size_t i = 0; i < analyzers.size(); ++i) {
            auto& result = report.results[i];
            std::ranges::sort(result.issues, issue_less);
            analyzers[i]->finalize_issues(result.issues);
            result.refresh_status();
            logging::get()->debug("{}: {} ({} issues, {} files)", result.rule_id, to_string(result.status),
                                  result.issues.size(), result.files_analyzed);
        }

        const auto end_time = std::chrono::steady_clock::now();
        report.generated_at = std::chrono::system_clock::now();
        report.duration = std::chrono::duration_cast<Duration>(end_time - start_time);
        return report;
    }

    Result<std::vector<std::unique_ptr<analyzers::IAnalyzer>>, Error> create_analyzers(
        const analyzers::AnalyzerRegistry& registry,
        const std::vector<std::string>& enabled,
        const std::vector<analyzers::AnalyzerSettings>& settings
    ) {
        using ResultType = Result<std::vector<std::unique_ptr<analyzers::IAnalyzer>>, Error>;

        std::vector<std::unique_ptr<analyzers::IAnalyzer>> created;
        if (enabled.empty()) {
            created = registry.create_all();
        } else {
            for (const auto& id : enabled) {
                auto analyzer = registry.create(id);
                if (!analyzer) {
                    return ResultType::failure(Error::invalid_argument("Unknown analyzer", id));
                }
                created.push_back(std::move(analyzer));
            }
        }

        for (auto& analyzer : created) {
            const auto it = std::ranges::find_if(settings, [&analyzer](const analyzers::AnalyzerSettings& s) {
                return s.rule_id() == analyzer->id();
            });
            const analyzers::AnalyzerSettings defaults{std::string(analyzer->id())};
            if (auto configured = analyzer->configure(it == settings.end() ? defaults : *it); configured.is_err()) {
                return ResultType::failure(configured.error());
            }
        }

        return ResultType::success(std::move(created));
    }

}  // namespace lpa::engine
