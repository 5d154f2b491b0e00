//
// Created by gregorian-rayne on 1/15/26.
//

#ifndef LPA_ANALYZER_HPP
#define LPA_ANALYZER_HPP

/**
 * @file analyzer.hpp
 * @brief Analyzer interface, per-analyzer settings and per-file context.
 *
 * An analyzer never walks the syntax tree itself. For every file the
 * engine asks each analyzer for a FileVisitor, attaches all visitors to a
 * single scope-tracked traversal and collects what they report through
 * the shared FileContext.
 *
 * Analyzer lifecycle:
 * 1. created from the registry
 * 2. configure() with its [analyzers.<id>] settings, failing fast on bad values
 * 3. should_analyze() decides per file
 * 4. create_visitor() once per analyzed file
 */

#include "lpa/result.hpp"
#include "lpa/error.hpp"
#include "lpa/types.hpp"
#include "lpa/scope/provenance.hpp"
#include "lpa/scope/scope_tracker.hpp"
#include "lpa/scope/suppression.hpp"
#include "lpa/scope/traverser.hpp"
#include "lpa/syntax/syntax_tree.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lpa::models {
    class ModelRegistry;
}

namespace lpa::analyzers {

    // ============================================================================
    // Settings
    // ============================================================================

    /**
     * One configuration value. std::monostate marks a value of a type no
     * analyzer accepts (a table, a mixed array, a date).
     */
    using SettingValue = std::variant<
        std::monostate,
        bool,
        std::int64_t,
        double,
        std::string,
        std::vector<std::string>,
        std::map<std::string, std::string>
    >;

    /**
     * The key/value bag of one analyzer.
     *
     * Missing keys fall back to the default passed by the caller. A key
     * holding the wrong type or an out-of-range value is a ConfigError
     * whose context names the full key ("analyzers.<id>.<key>").
     */
    class AnalyzerSettings {
    public:
        AnalyzerSettings() = default;
        explicit AnalyzerSettings(std::string rule_id)
            : rule_id_(std::move(rule_id)) {}

        void set(std::string key, SettingValue value);

        [[nodiscard]] bool has(std::string_view key) const;
        [[nodiscard]] bool empty() const noexcept { return values_.empty(); }
        [[nodiscard]] const std::string& rule_id() const noexcept { return rule_id_; }
        [[nodiscard]] const std::map<std::string, SettingValue, std::less<>>& values() const noexcept {
            return values_;
        }

        /**
         * Reads a non-negative integer no smaller than minimum.
         */
        [[nodiscard]] Result<std::size_t, Error> get_count(
            std::string_view key, std::size_t fallback, std::size_t minimum = 0) const;

        [[nodiscard]] Result<bool, Error> get_bool(std::string_view key, bool fallback) const;

        [[nodiscard]] Result<std::vector<std::string>, Error> get_strings(std::string_view key) const;

        /**
         * Reads a list of strings that replaces the fallback when present.
         */
        [[nodiscard]] Result<std::vector<std::string>, Error> get_strings(
            std::string_view key, std::vector<std::string> fallback) const;

        [[nodiscard]] Result<std::map<std::string, std::string>, Error> get_string_map(std::string_view key) const;

    private:
        [[nodiscard]] std::string full_key(std::string_view key) const;
        [[nodiscard]] const SettingValue* find(std::string_view key) const;

        std::string rule_id_;
        std::map<std::string, SettingValue, std::less<>> values_;
    };

    // ============================================================================
    // File context
    // ============================================================================

    /**
     * Everything a visitor needs to know about the file being analyzed.
     *
     * The context outlives every visitor of its file. Issues are collected
     * per rule id; suppressed issues are dropped at report time, while the
     * scope stack still describes the reporting location.
     */
    class FileContext {
    public:
        FileContext(fs::path path,
                    std::string relative_path,
                    const syntax::SyntaxTree& tree,
                    const models::ModelRegistry& registry,
                    scope::ScopeTracker& scopes,
                    const scope::SuppressionIndex& suppressions);

        FileContext(const FileContext&) = delete;
        FileContext& operator=(const FileContext&) = delete;

        [[nodiscard]] const fs::path& path() const noexcept { return path_; }

        /// Forward-slash path relative to the analyzed base directory.
        [[nodiscard]] const std::string& relative_path() const noexcept { return relative_path_; }

        [[nodiscard]] const syntax::SyntaxTree& tree() const noexcept { return tree_; }
        [[nodiscard]] const models::ModelRegistry& registry() const noexcept { return registry_; }
        [[nodiscard]] scope::ScopeTracker& scopes() noexcept { return scopes_; }
        [[nodiscard]] const scope::ScopeTracker& scopes() const noexcept { return scopes_; }
        [[nodiscard]] const scope::ProvenanceResolver& provenance() const noexcept { return resolver_; }

        /**
         * Table of a model class as resolved by the registry. Classes the
         * registry does not know as models have no table.
         */
        [[nodiscard]] std::optional<std::string> model_table(std::string_view qualified_name) const;

        /**
         * Checks whether a rule is suppressed at a line in the current scope.
         */
        [[nodiscard]] bool is_suppressed(std::string_view rule_id, std::size_t line) const;

        /**
         * Records an issue located at a node.
         *
         * @return false when the issue was suppressed.
         */
        bool report(std::string_view rule_id,
                    const syntax::SyntaxNode& node,
                    Severity severity,
                    std::string code,
                    std::string message,
                    std::string recommendation,
                    nlohmann::json metadata = nlohmann::json::object());

        /**
         * Records an issue at an explicit line span.
         */
        bool report_at(std::string_view rule_id,
                       std::size_t line,
                       std::size_t end_line,
                       Severity severity,
                       std::string code,
                       std::string message,
                       std::string recommendation,
                       std::string excerpt = {},
                       nlohmann::json metadata = nlohmann::json::object());

        /**
         * Moves the issues recorded for a rule out of the context.
         */
        [[nodiscard]] std::vector<Issue> take_issues(std::string_view rule_id);

    private:
        fs::path path_;
        std::string relative_path_;
        const syntax::SyntaxTree& tree_;
        const models::ModelRegistry& registry_;
        scope::ScopeTracker& scopes_;
        const scope::SuppressionIndex& suppressions_;
        scope::ProvenanceResolver resolver_;
        std::map<std::string, std::vector<Issue>, std::less<>> issues_;
    };

    /**
     * First line of a node's source text, shortened for display. The cut
     * falls on a UTF-8 character boundary.
     */
    [[nodiscard]] std::string make_excerpt(std::string_view text, std::size_t max_length = 120);

    // ============================================================================
    // Analyzer interface
    // ============================================================================

    /**
     * Base interface for all analyzers.
     */
    class IAnalyzer {
    public:
        virtual ~IAnalyzer() = default;

        /**
         * Stable rule identifier, used in configuration, suppression
         * markers and baselines.
         */
        [[nodiscard]] virtual std::string_view id() const noexcept = 0;

        /**
         * Returns the analyzer display name.
         */
        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        /**
         * Returns a description of what this analyzer does.
         */
        [[nodiscard]] virtual std::string_view description() const noexcept = 0;

        [[nodiscard]] virtual Category category() const noexcept = 0;

        /**
         * Severity of the analyzer's main finding.
         */
        [[nodiscard]] virtual Severity severity() const noexcept = 0;

        /**
         * Issues at or above this severity make the analyzer fail; lower
         * ones only produce a warning.
         */
        [[nodiscard]] virtual Severity failing_severity() const noexcept {
            return Severity::Medium;
        }

        /**
         * Applies the analyzer's settings.
         *
         * @return ConfigError for a malformed or out-of-range value.
         */
        [[nodiscard]] virtual Result<void, Error> configure(const AnalyzerSettings& settings) {
            (void)settings;
            return Result<void, Error>::success();
        }

        /**
         * Decides whether a file is in scope for this analyzer.
         *
         * @param relative_path Forward-slash path relative to the base directory.
         */
        [[nodiscard]] virtual bool should_analyze(std::string_view relative_path) const {
            (void)relative_path;
            return true;
        }

        /**
         * Creates the visitor for one file.
         */
        [[nodiscard]] virtual std::unique_ptr<scope::FileVisitor> create_visitor(FileContext& context) const = 0;

        /**
         * Rewrites the issues collected over a whole run, for rules whose
         * findings depend on more than one file. Issues arrive sorted and
         * the ones kept must stay in that order.
         */
        virtual void finalize_issues(std::vector<Issue>& issues) const {
            (void)issues;
        }
    };

    using AnalyzerFactory = std::function<std::unique_ptr<IAnalyzer>()>;

    /**
     * Registry for managing analyzers.
     *
     * Each entry keeps a prototype for listing and the factory that
     * produces a fresh, unconfigured instance for every run.
     */
    class AnalyzerRegistry {
    public:
        static AnalyzerRegistry& instance();

        /**
         * Registers an analyzer. A later registration with the same id
         * replaces the earlier one.
         */
        void register_analyzer(AnalyzerFactory factory);

        [[nodiscard]] const IAnalyzer* get_analyzer(std::string_view id) const;
        [[nodiscard]] std::vector<const IAnalyzer*> list_analyzers() const;

        [[nodiscard]] std::unique_ptr<IAnalyzer> create(std::string_view id) const;
        [[nodiscard]] std::vector<std::unique_ptr<IAnalyzer>> create_all() const;

    private:
        AnalyzerRegistry() = default;

        struct Entry {
            AnalyzerFactory factory;
            std::unique_ptr<IAnalyzer> prototype;
        };

        std::vector<Entry> analyzers_;
    };

    /**
     * Severity of a count that exceeds its threshold by excess: High from
     * high upwards, Medium from medium upwards, Low below.
     */
    inline Severity scaled_severity(const std::size_t excess, const std::size_t high, const std::size_t medium) noexcept {
        if (excess >= high) {
            return Severity::High;
        }
        if (excess >= medium) {
            return Severity::Medium;
        }
        return Severity::Low;
    }

}  // namespace lpa::analyzers

#endif //LPA_ANALYZER_HPP
