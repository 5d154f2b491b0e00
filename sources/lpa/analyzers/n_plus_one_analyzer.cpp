//
// Created by gregorian-rayne on 1/15/26.
//

#include "lpa/analyzers/n_plus_one_analyzer.hpp"
#include "lpa/analyzers/query_patterns.hpp"

#include "lpa/syntax/php_nodes.hpp"
#include "lpa/utils/string_utils.hpp"

#include <array>
#include <sstream>
#include <vector>

namespace lpa::analyzers
{
    namespace {

        /// Common model columns that are never relations.
        constexpr std::array<std::string_view, 25> DEFAULT_PLAIN_ATTRIBUTES = {
            "id", "created_at", "updated_at", "deleted_at", "name", "email",
            "password", "remember_token", "email_verified_at", "title", "content",
            "description", "status", "type", "value", "data", "meta", "slug",
            "count", "total", "amount", "price", "quantity", "active", "enabled",
        };

        std::string_view loop_type_of(const syntax::SyntaxNode& loop) noexcept {
            const auto kind = loop.kind();
            if (kind == "foreach_statement") return "foreach";
            if (kind == "for_statement") return "for";
            if (kind == "while_statement") return "while";
            return "do-while";
        }

        syntax::SyntaxNode loop_body(const syntax::SyntaxNode& loop) noexcept {
            if (auto body = loop.child_by_field("body")) {
                return body;
            }
            const auto count = loop.named_child_count();
            return count == 0 ? syntax::SyntaxNode{} : loop.named_child(count - 1);
        }

        struct LoopFrame {
            syntax::SyntaxNode loop;
            syntax::SyntaxNode body;
            std::string_view loop_type;
            std::string variable;               // empty unless the loop iterates models
            scope::Provenance source;
            std::set<std::string> guarded;      // relationLoaded() checks seen in this loop
            std::set<std::string> reported;

            [[nodiscard]] bool tracked() const noexcept { return !variable.empty(); }

            [[nodiscard]] bool covers(const std::string& path) const {
                if (source.covers(path)) {
                    return true;
                }
                for (const auto& guard : guarded) {
                    if (guard == path ||
                        (guard.size() > path.size() && string_utils::starts_with(guard, path) && guard[path.size()] == '.')) {
                        return true;
                    }
                }
                return false;
            }
        };

        class NPlusOneVisitor final : public scope::FileVisitor {
        public:
            NPlusOneVisitor(const NPlusOneAnalyzer& analyzer, FileContext& context)
                : analyzer_(analyzer), context_(context) {}

            void enter(const syntax::SyntaxNode& node) override {
                if (syntax::is_loop(node)) {
                    push_loop(node);
                    return;
                }
                if (loops_.empty()) {
                    return;
                }

                if (node.is("if_statement") || node.is("conditional_expression")) {
                    record_guards(node);
                } else if (syntax::is_property_access(node)) {
                    check_property_access(node);
                } else if (analyzer_.checks_queries_in_loops() &&
                           (syntax::is_member_call(node) || syntax::is_static_call(node))) {
                    check_query(node);
                }
            }

            void leave(const syntax::SyntaxNode& node) override {
                if (!loops_.empty() && syntax::is_loop(node) && loops_.back().loop == node) {
                    loops_.pop_back();
                }
            }

        private:
            void push_loop(const syntax::SyntaxNode& loop) {
                LoopFrame frame;
                frame.loop = loop;
                frame.body = loop_body(loop);
                frame.loop_type = loop_type_of(loop);

                if (loop.is("foreach_statement")) {
                    const auto parts = scope::foreach_parts(loop);
                    frame.body = parts.body;
                    if (!parts.value.is_null()) {
                        auto source = context_.provenance().resolve(parts.source);
                        if (source.is_model_derived()) {
                            frame.variable = std::string(parts.value.text());
                            frame.source = std::move(source);
                        }
                    }
                }
                loops_.push_back(std::move(frame));
            }

            LoopFrame* frame_for_variable(const std::string_view variable) {
                for (auto it = loops_.rbegin(); it != loops_.rend(); ++it) {
                    if (it->tracked() && it->variable == variable) {
                        return &*it;
                    }
                }
                return nullptr;
            }

            /**
             * Collects relationLoaded('x') checks on loop variables from the
             * condition of an if statement or ternary.
             */
            void record_guards(const syntax::SyntaxNode& node) {
                const auto condition = node.child_by_field("condition");
                if (condition.is_null()) {
                    return;
                }

                std::vector<syntax::SyntaxNode> pending{condition};
                while (!pending.empty()) {
                    const auto current = pending.back();
                    pending.pop_back();

                    if (syntax::is_member_call(current) && syntax::call_name(current) == "relationLoaded") {
                        const auto object = syntax::unwrap_parentheses(current.child_by_field("object"));
                        auto* frame = object.is("variable_name") ? frame_for_variable(object.text()) : nullptr;
                        if (frame != nullptr) {
                            if (auto relation = syntax::string_literal(syntax::first_argument(current))) {
                                frame->guarded.insert(std::move(*relation));
                            }
                        }
                    }
                    for (const auto& child : current.named_children()) {
                        pending.push_back(child);
                    }
                }
            }

            void check_property_access(const syntax::SyntaxNode& access) {
                const auto parent = access.parent();
                if (syntax::is_property_access(parent) && parent.child_by_field("object") == access) {
                    return;     // only the longest chain is examined
                }
                if (parent.is("assignment_expression") && parent.child_by_field("left") == access) {
                    return;
                }

                const auto chain = syntax::property_chain(access);
                if (!chain) {
                    return;
                }
                auto* frame = frame_for_variable(chain->variable);
                if (frame == nullptr) {
                    return;
                }

                // The last segment of a longer chain is usually a column of the
                // related model, unless the chain is iterated or called on.
                const bool used_as_object =
                    (syntax::is_member_call(parent) && parent.child_by_field("object") == access) ||
                    (parent.is("foreach_statement") && parent.named_child(0) == access);

                std::vector<std::string_view> relations;
                for (const auto segment : chain->segments) {
                    if (analyzer_.is_plain_attribute(segment)) {
                        break;
                    }
                    relations.push_back(segment);
                }
                if (relations.size() == chain->segments.size() && relations.size() > 1 && !used_as_object) {
                    relations.pop_back();
                }
                if (relations.empty()) {
                    return;
                }

                const std::string path = string_utils::join(relations, ".");
                if (frame->covers(path) || frame->reported.contains(path)) {
                    return;
                }
                frame->reported.insert(path);

                std::ostringstream recommendation;
                recommendation << "Accessing the '" << path << "' relationship inside a " << frame->loop_type
                               << " triggers a separate query for every iteration. Eager load it with ->with('"
                               << path << "') or ->load('" << path << "') before the loop.";

                context_.report(
                    NPlusOneAnalyzer::ID, access, Severity::High,
                    "lazy-loaded-relationship",
                    "Potential N+1 query: accessing '" + path + "' inside loop",
                    recommendation.str(),
                    {
                        {"relationship", path},
                        {"loop_type", std::string(frame->loop_type)},
                        {"variable", frame->variable},
                    });
            }

            void check_query(const syntax::SyntaxNode& call) {
                if (!is_outermost_call(call) || !is_query_call(context_, call)) {
                    return;
                }

                const LoopFrame* enclosing = nullptr;
                for (auto it = loops_.rbegin(); it != loops_.rend(); ++it) {
                    if (!it->body.is_null() && call.is_within(it->body)) {
                        enclosing = &*it;
                        break;
                    }
                }
                if (enclosing == nullptr) {
                    return;     // e.g. the iterated expression of the loop itself
                }

                const auto query = make_excerpt(call.text(), 80);
                context_.report(
                    NPlusOneAnalyzer::ID, call, Severity::High,
                    "query-in-loop",
                    "Database query executed inside " + std::string(enclosing->loop_type) + " loop",
                    "Queries inside a loop run once per iteration. Fetch the data once before the loop "
                    "(whereIn, eager loading or a keyed collection) and look it up inside the loop.",
                    {
                        {"loop_type", std::string(enclosing->loop_type)},
                        {"query", query},
                    });
            }

            const NPlusOneAnalyzer& analyzer_;
            FileContext& context_;
            std::vector<LoopFrame> loops_;
        };

    }  // namespace

    NPlusOneAnalyzer::NPlusOneAnalyzer() {
        for (const auto attribute : DEFAULT_PLAIN_ATTRIBUTES) {
            plain_attributes_.emplace(attribute);
        }
    }

    Result<void, Error> NPlusOneAnalyzer::configure(const AnalyzerSettings& settings) {
        auto extra = settings.get_strings("plain_attributes");
        if (extra.is_err()) {
            return Result<void, Error>::failure(extra.error());
        }
        for (const auto& attribute : extra.value()) {
            plain_attributes_.insert(string_utils::to_lower(attribute));
        }

        auto check_queries = settings.get_bool("check_queries_in_loops", true);
        if (check_queries.is_err()) {
            return Result<void, Error>::failure(check_queries.error());
        }
        check_queries_in_loops_ = check_queries.value();

        return Result<void, Error>::success();
    }

    bool NPlusOneAnalyzer::is_plain_attribute(const std::string_view property) const {
        return plain_attributes_.contains(string_utils::to_lower(property));
    }

    std::unique_ptr<scope::FileVisitor> NPlusOneAnalyzer::create_visitor(FileContext& context) const {
        return std::make_unique<NPlusOneVisitor>(*this, context);
    }

    void register_n_plus_one_analyzer() {
        AnalyzerRegistry::instance().register_analyzer([] {
            return std::make_unique<NPlusOneAnalyzer>();
        });
    }

}  // namespace lpa::analyzers
