//
// Created by gregorian-rayne on 1/15/26.
//

#include "lpa/analyzers/fat_model_analyzer.hpp"

#include "lpa/scope/vocabulary.hpp"
#include "lpa/syntax/php_nodes.hpp"
#include "lpa/utils/string_utils.hpp"

#include <array>
#include <sstream>
#include <string>
#include <vector>

namespace lpa::analyzers
{
    namespace {

        namespace vocab = scope::vocabulary;

        /// Framework hooks a model overrides without adding business logic.
        constexpr std::array<std::string_view, 21> FRAMEWORK_METHODS = {
            "boot", "booting", "booted", "casts", "newEloquentBuilder", "newCollection",
            "newFactory", "resolveRouteBinding", "resolveChildRouteBinding",
            "getRouteKeyName", "getRouteKey", "toArray", "toJson", "broadcastOn",
            "broadcastWith", "broadcastAs", "prunable", "shouldBeSearchable",
            "toSearchableArray", "searchableAs", "newQuery",
        };

        constexpr std::array<std::string_view, 11> RELATION_METHODS = {
            "hasOne", "hasMany", "belongsTo", "belongsToMany", "morphTo", "morphOne",
            "morphMany", "morphToMany", "hasOneThrough", "hasManyThrough", "morphedByMany",
        };

        constexpr std::array<std::string_view, 12> RELATION_TYPES = {
            "Relation", "HasOne", "HasMany", "BelongsTo", "BelongsToMany", "MorphTo",
            "MorphOne", "MorphMany", "MorphToMany", "HasOneThrough", "HasManyThrough",
            "MorphedByMany",
        };

        constexpr std::array<std::string_view, 9> BRANCH_NODES = {
            "if_statement", "else_if_clause", "case_statement", "for_statement",
            "foreach_statement", "while_statement", "do_statement", "catch_clause",
            "conditional_expression",
        };

        constexpr std::array<std::string_view, 5> SHORT_CIRCUIT_OPERATORS = {
            "&&", "||", "and", "or", "??",
        };

        bool is_business_method(const syntax::SyntaxNode& method) {
            const auto name = syntax::declaration_name(method);
            if (vocab::contains(FRAMEWORK_METHODS, name) || string_utils::starts_with(name, "__")) {
                return false;
            }
            // scopeActive(), getNameAttribute(), fullName(): Attribute
            if (string_utils::starts_with(name, "scope") || string_utils::ends_with(name, "Attribute")) {
                return false;
            }
            if (syntax::method_visibility(method) != "public") {
                return false;
            }
            return !is_relation_method(method);
        }

        std::size_t declaration_lines(const syntax::SyntaxNode& node) noexcept {
            return node.end_line() - node.start_line() + 1;
        }

        class FatModelVisitor final : public scope::FileVisitor {
        public:
            FatModelVisitor(const FatModelAnalyzer& analyzer, FileContext& context)
                : analyzer_(analyzer), context_(context) {}

            void enter(const syntax::SyntaxNode& node) override {
                if (!syntax::is_class_declaration(node) || !context_.scopes().in_model_class()) {
                    return;
                }
                analyze_model(node);
            }

        private:
            void analyze_model(const syntax::SyntaxNode& cls) {
                const std::string class_name(syntax::declaration_name(cls));

                std::vector<syntax::SyntaxNode> business_methods;
                std::size_t statement_lines = 0;
                for (const auto& member : syntax::declaration_body(cls).named_children()) {
                    if (syntax::is_method(member)) {
                        statement_lines += declaration_lines(member);
                        if (is_business_method(member)) {
                            business_methods.push_back(member);
                        }
                    } else if (member.is("property_declaration")) {
                        statement_lines += declaration_lines(member);
                    }
                }

                check_method_count(cls, class_name, business_methods.size());
                check_size(cls, class_name, statement_lines);
                for (const auto& method : business_methods) {
                    check_complexity(class_name, method);
                }
            }

            void check_method_count(const syntax::SyntaxNode& cls, const std::string& class_name, const std::size_t count) {
                const auto threshold = analyzer_.method_threshold();
                if (count <= threshold) {
                    return;
                }

                std::ostringstream message;
                message << "Model \"" << class_name << "\" has " << count << " business methods (threshold: "
                        << threshold << "). Consider extracting logic to service classes";

                context_.report(
                    FatModelAnalyzer::ID, cls, scaled_severity(count - threshold, 15, 5),
                    "too-many-methods",
                    message.str(),
                    "Move business logic to service classes. Models should focus on data representation, "
                    "relationships, and simple accessors/mutators.",
                    {{"class", class_name}, {"business_methods", count}, {"threshold", threshold}});
            }

            void check_size(const syntax::SyntaxNode& cls, const std::string& class_name, const std::size_t lines) {
                const auto threshold = analyzer_.loc_threshold();
                if (lines <= threshold) {
                    return;
                }

                std::ostringstream message;
                message << "Model \"" << class_name << "\" has " << lines << " statement lines (threshold: "
                        << threshold << "). Model is too large";

                context_.report(
                    FatModelAnalyzer::ID, cls, scaled_severity(lines - threshold, 200, 100),
                    "too-many-lines",
                    message.str(),
                    "Large models are hard to maintain. Extract business logic to services, reusable behavior to "
                    "traits and query logic to dedicated query classes.",
                    {{"class", class_name}, {"statement_lines", lines}, {"threshold", threshold}});
            }

            void check_complexity(const std::string& class_name, const syntax::SyntaxNode& method) {
                const auto threshold = analyzer_.complexity_threshold();
                const auto complexity = cyclomatic_complexity(method);
                if (complexity <= threshold) {
                    return;
                }

                const std::string method_name(syntax::declaration_name(method));
                std::ostringstream message;
                message << "Method \"" << class_name << "::" << method_name << "()\" has complexity of "
                        << complexity << " (threshold: " << threshold << ")";

                context_.report(
                    FatModelAnalyzer::ID, method, scaled_severity(complexity - threshold, 15, 5),
                    "complex-method",
                    message.str(),
                    "Complex methods in models indicate business logic that should be extracted to service classes.",
                    {
                        {"class", class_name},
                        {"method", method_name},
                        {"complexity", complexity},
                        {"threshold", threshold},
                    });
            }

            const FatModelAnalyzer& analyzer_;
            FileContext& context_;
        };

    }  // namespace

    std::size_t cyclomatic_complexity(const syntax::SyntaxNode& method) {
        std::size_t complexity = 1;

        std::vector<syntax::SyntaxNode> pending;
        if (auto body = syntax::declaration_body(method)) {
            pending.push_back(body);
        }
        while (!pending.empty()) {
            const auto node = pending.back();
            pending.pop_back();

            const auto kind = node.kind();
            if (vocab::contains(BRANCH_NODES, kind) || kind == "match_expression") {
                ++complexity;
            } else if (kind == "binary_expression" &&
                       vocab::contains(SHORT_CIRCUIT_OPERATORS, string_utils::to_lower(syntax::operator_of(node)))) {
                ++complexity;
            } else if (kind == "match_condition_list") {
                complexity += node.named_child_count();
            }

            for (const auto& child : node.named_children()) {
                pending.push_back(child);
            }
        }
        return complexity;
    }

    bool is_relation_method(const syntax::SyntaxNode& method) {
        if (auto return_type = method.child_by_field("return_type")) {
            std::vector<syntax::SyntaxNode> pending{return_type};
            while (!pending.empty()) {
                const auto node = pending.back();
                pending.pop_back();
                if (node.is("name") || node.is("qualified_name")) {
                    for (const auto type : RELATION_TYPES) {
                        if (string_utils::ends_with(node.text(), type)) {
                            return true;
                        }
                    }
                    continue;
                }
                for (const auto& child : node.named_children()) {
                    pending.push_back(child);
                }
            }
        }

        const auto body = syntax::declaration_body(method);
        const auto statements = body.named_children();
        for (auto it = statements.rbegin(); it != statements.rend(); ++it) {
            if (!it->is("return_statement")) {
                continue;
            }
            if (it->named_child_count() == 0) {
                return false;
            }
            const auto chain = syntax::decompose_chain(it->named_child(0));
            for (const auto& link : chain.links) {
                if (syntax::is_member_call(link.call) && vocab::contains(RELATION_METHODS, link.name)) {
                    return true;
                }
            }
            return false;
        }
        return false;
    }

    Result<void, Error> FatModelAnalyzer::configure(const AnalyzerSettings& settings) {
        auto methods = settings.get_count("method_threshold", DEFAULT_METHOD_THRESHOLD);
        if (methods.is_err()) {
            return Result<void, Error>::failure(methods.error());
        }
        auto loc = settings.get_count("loc_threshold", DEFAULT_LOC_THRESHOLD);
        if (loc.is_err()) {
            return Result<void, Error>::failure(loc.error());
        }
        auto complexity = settings.get_count("complexity_threshold", DEFAULT_COMPLEXITY_THRESHOLD, 1);
        if (complexity.is_err()) {
            return Result<void, Error>::failure(complexity.error());
        }

        method_threshold_ = methods.value();
        loc_threshold_ = loc.value();
        complexity_threshold_ = complexity.value();
        return Result<void, Error>::success();
    }

    std::unique_ptr<scope::FileVisitor> FatModelAnalyzer::create_visitor(FileContext& context) const {
        return std::make_unique<FatModelVisitor>(*this, context);
    }

    void register_fat_model_analyzer() {
        AnalyzerRegistry::instance().register_analyzer([] {
            return std::make_unique<FatModelAnalyzer>();
        });
    }

}  // namespace lpa::analyzers
