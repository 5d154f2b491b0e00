//
// Created by gregorian-rayne on 1/15/26.
//

#include "lpa/analyzers/mixed_query_analyzer.hpp"
#include "lpa/analyzers/query_patterns.hpp"

#include "lpa/models/model_registry.hpp"
#include "lpa/scope/vocabulary.hpp"
#include "lpa/syntax/php_nodes.hpp"
#include "lpa/utils/path_utils.hpp"
#include "lpa/utils/string_utils.hpp"

#include <array>
#include <map>
#include <optional>
#include <sstream>

namespace lpa::analyzers
{
    namespace {

        /// Model instance methods that hit the model's own table.
        constexpr std::array<std::string_view, 11> MODEL_PERSISTENCE_METHODS = {
            "save", "update", "delete", "forceDelete", "restore", "refresh",
            "fresh", "increment", "decrement", "touch", "push",
        };

        constexpr std::string_view ANONYMOUS_CLASS_NAME = "class@anonymous";

        enum class Interface {
            Eloquent,
            QueryBuilder
        };

        struct Usage {
            Interface via = Interface::Eloquent;
            std::string table;
        };

        struct ClassFrame {
            syntax::SyntaxNode node;
            std::string name;
            bool whitelisted = false;
            std::map<std::string, syntax::SyntaxNode> eloquent;     // table -> first use
            std::map<std::string, syntax::SyntaxNode> query_builder;
        };

        bool converts_to_base(const syntax::CallChain& chain) noexcept {
            return chain.contains("toBase") || chain.contains("getQuery");
        }

        class MixedQueryVisitor final : public scope::FileVisitor {
        public:
            MixedQueryVisitor(const MixedQueryAnalyzer& analyzer, FileContext& context)
                : analyzer_(analyzer), context_(context) {}

            void enter(const syntax::SyntaxNode& node) override {
                if (is_class_node(node)) {
                    push_class(node);
                    return;
                }
                if (classes_.empty()) {
                    return;
                }
                if ((syntax::is_member_call(node) || syntax::is_static_call(node)) && is_outermost_call(node)) {
                    if (auto usage = classify(node)) {
                        record(*usage, node);
                    }
                }
            }

            void leave(const syntax::SyntaxNode& node) override {
                if (classes_.empty() || !is_class_node(node) || classes_.back().node != node) {
                    return;
                }
                if (!classes_.back().whitelisted) {
                    emit(classes_.back());
                }
                classes_.pop_back();
            }

        private:
            static bool is_class_node(const syntax::SyntaxNode& node) {
                const auto kind = scope::Traverser::scope_kind_of(node);
                return kind && (*kind == scope::ScopeKind::Class || *kind == scope::ScopeKind::AnonymousClass);
            }

            void push_class(const syntax::SyntaxNode& node) {
                const auto& current = context_.scopes().current();

                ClassFrame frame;
                frame.node = node;
                if (current.kind == scope::ScopeKind::AnonymousClass || current.name.empty()) {
                    frame.name = std::string(ANONYMOUS_CLASS_NAME);
                } else {
                    frame.name = current.name;
                    frame.whitelisted = analyzer_.is_whitelisted(current.name, current.qualified_name);
                }
                classes_.push_back(std::move(frame));
            }

            [[nodiscard]] std::optional<std::string> table_of_model(const std::string& fqn) const {
                if (fqn.empty()) {
                    return std::nullopt;
                }
                return context_.model_table(fqn);
            }

            [[nodiscard]] Interface eloquent_or_converted(const syntax::CallChain& chain) const noexcept {
                return analyzer_.counts_to_base_as_query_builder() && converts_to_base(chain)
                    ? Interface::QueryBuilder
                    : Interface::Eloquent;
            }

            [[nodiscard]] std::optional<Usage> classify(const syntax::SyntaxNode& call) const {
                const auto chain = syntax::decompose_chain(call);
                if (chain.links.empty()) {
                    return std::nullopt;
                }

                if (is_db_rooted(chain)) {
                    if (chain.links.front().name != "table") {
                        return std::nullopt;
                    }
                    auto table = syntax::string_literal(syntax::first_argument(chain.links.front().call));
                    if (!table || table->empty()) {
                        return std::nullopt;
                    }
                    return Usage{Interface::QueryBuilder, std::move(*table)};
                }

                if (is_model_rooted(context_, chain)) {
                    auto table = table_of_model(context_.scopes().resolve_class(chain.root));
                    if (!table) {
                        return std::nullopt;
                    }
                    return Usage{eloquent_or_converted(chain), std::move(*table)};
                }

                if (chain.root_kind != syntax::ChainRoot::Variable) {
                    return std::nullopt;
                }

                const auto provenance = context_.scopes().lookup(chain.root);
                switch (provenance.kind) {
                    case scope::ProvenanceKind::EloquentBuilder: {
                        auto table = table_of_model(provenance.subject);
                        if (!table) {
                            return std::nullopt;
                        }
                        return Usage{eloquent_or_converted(chain), std::move(*table)};
                    }

                    case scope::ProvenanceKind::QueryBuilder: {
                        if (!provenance.converted_from_eloquent) {
                            return Usage{Interface::QueryBuilder, provenance.subject};
                        }
                        auto table = table_of_model(provenance.subject);
                        if (!table) {
                            return std::nullopt;
                        }
                        return Usage{
                            analyzer_.counts_to_base_as_query_builder() ? Interface::QueryBuilder : Interface::Eloquent,
                            std::move(*table)
                        };
                    }

                    case scope::ProvenanceKind::ModelClass: {
                        // Relation calls ($user->posts()) stay unresolved
                        if (!scope::vocabulary::contains(MODEL_PERSISTENCE_METHODS, chain.links.front().name)) {
                            return std::nullopt;
                        }
                        auto table = table_of_model(provenance.subject);
                        if (!table) {
                            return std::nullopt;
                        }
                        return Usage{Interface::Eloquent, std::move(*table)};
                    }

                    case scope::ProvenanceKind::Unknown:
                        break;
                }
                return std::nullopt;
            }

            void record(const Usage& usage, const syntax::SyntaxNode& call) {
                auto& frame = classes_.back();
                auto& target = usage.via == Interface::Eloquent ? frame.eloquent : frame.query_builder;
                target.try_emplace(usage.table, call);
            }

            [[nodiscard]] bool table_has_model(const ClassFrame& frame, const std::string& table) const {
                return context_.registry().has_model_for_table(table) || frame.eloquent.contains(table);
            }

            void emit(const ClassFrame& frame) {
                for (const auto& [table, qb_use] : frame.query_builder) {
                    const auto eloquent = frame.eloquent.find(table);
                    if (eloquent == frame.eloquent.end()) {
                        continue;
                    }

                    context_.report(
                        MixedQueryAnalyzer::ID, qb_use, Severity::High,
                        "same-table-mixing",
                        "Class \"" + frame.name + "\" uses both Eloquent and Query Builder for table \"" + table + "\"",
                        "Use one approach per table: prefer Eloquent so global scopes, casts and model events "
                        "apply consistently. Keep the Query Builder for performance-critical raw queries.",
                        {
                            {"class", frame.name},
                            {"table", table},
                            {"eloquent_line", eloquent->second.start_line()},
                            {"query_builder_line", qb_use.start_line()},
                        });
                }

                std::vector<std::string> model_tables;
                syntax::SyntaxNode first_use;
                for (const auto& [table, qb_use] : frame.query_builder) {
                    if (!table_has_model(frame, table)) {
                        continue;
                    }
                    model_tables.push_back(table);
                    if (first_use.is_null() || qb_use.start_byte() < first_use.start_byte()) {
                        first_use = qb_use;
                    }
                }

                if (model_tables.size() <= analyzer_.threshold()) {
                    return;
                }

                std::ostringstream message;
                message << "Class \"" << frame.name << "\" uses the Query Builder on " << model_tables.size()
                        << " tables that have Eloquent models (" << string_utils::join(model_tables, ", ") << ")";

                context_.report(
                    MixedQueryAnalyzer::ID, first_use, Severity::Low,
                    "significant-mixing",
                    message.str(),
                    "Consider using one approach throughout the class. These tables already have models; "
                    "querying them through Eloquent keeps behavior consistent.",
                    {
                        {"class", frame.name},
                        {"tables", model_tables},
                        {"count", model_tables.size()},
                        {"threshold", analyzer_.threshold()},
                    });
            }

            const MixedQueryAnalyzer& analyzer_;
            FileContext& context_;
            std::vector<ClassFrame> classes_;
        };

    }  // namespace

    Result<void, Error> MixedQueryAnalyzer::configure(const AnalyzerSettings& settings) {
        auto threshold = settings.get_count("threshold", DEFAULT_THRESHOLD);
        if (threshold.is_err()) {
            return Result<void, Error>::failure(threshold.error());
        }
        threshold_ = threshold.value();

        auto whitelist = settings.get_strings("whitelist");
        if (whitelist.is_err()) {
            return Result<void, Error>::failure(whitelist.error());
        }
        whitelist_ = std::move(whitelist).value();

        auto to_base = settings.get_bool("count_to_base_as_query_builder", false);
        if (to_base.is_err()) {
            return Result<void, Error>::failure(to_base.error());
        }
        count_to_base_ = to_base.value();

        return Result<void, Error>::success();
    }

    bool MixedQueryAnalyzer::is_whitelisted(const std::string_view class_name, const std::string_view qualified_name) const {
        if (class_name.empty()) {
            return false;
        }
        for (const auto& pattern : whitelist_) {
            std::string_view trimmed = pattern;
            if (!trimmed.empty() && trimmed.front() == '\\') {
                trimmed.remove_prefix(1);
            }
            if (path_utils::glob_match(class_name, trimmed) || path_utils::glob_match(qualified_name, trimmed)) {
                return true;
            }
        }
        return false;
    }

    std::unique_ptr<scope::FileVisitor> MixedQueryAnalyzer::create_visitor(FileContext& context) const {
        return std::make_unique<MixedQueryVisitor>(*this, context);
    }

    void register_mixed_query_analyzer() {
        AnalyzerRegistry::instance().register_analyzer([] {
            return std::make_unique<MixedQueryAnalyzer>();
        });
    }

}  // namespace lpa::analyzers
