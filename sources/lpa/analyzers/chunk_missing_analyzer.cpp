//
// Created by gregorian-rayne on 1/16/26.
//

#include "lpa/analyzers/chunk_missing_analyzer.hpp"

#include "lpa/scope/vocabulary.hpp"
#include "lpa/syntax/php_nodes.hpp"

#include <array>
#include <map>
#include <string>
#include <vector>

namespace lpa::analyzers
{
    namespace {

        namespace vocab = scope::vocabulary;

        constexpr std::array<std::string_view, 8> STREAMING_METHODS = {
            "chunk", "chunkById", "cursor", "lazy", "lazyById",
            "paginate", "simplePaginate", "cursorPaginate",
        };

        constexpr std::array<std::string_view, 11> BOUNDING_METHODS = {
            "limit", "take", "first", "firstOrFail", "firstWhere", "find",
            "findOrFail", "findOr", "sole", "soleOrFail", "value",
        };

        constexpr auto RECOMMENDATION =
            "Use chunk(), chunkById(), cursor() or lazy() to process large result sets in batches, "
            "or bound the query with limit()/take() when only a few rows are needed.";

        class ChunkMissingVisitor final : public scope::FileVisitor {
        public:
            explicit ChunkMissingVisitor(FileContext& context)
                : context_(context), assigned_(1) {}

            void enter(const syntax::SyntaxNode& node) override {
                if (is_callable(node)) {
                    assigned_.emplace_back();
                } else if (node.is("assignment_expression")) {
                    record_assignment(node);
                } else if (node.is("foreach_statement")) {
                    check_loop(node);
                }
            }

            void leave(const syntax::SyntaxNode& node) override {
                if (is_callable(node) && assigned_.size() > 1) {
                    assigned_.pop_back();
                }
            }

        private:
            static bool is_callable(const syntax::SyntaxNode& node) noexcept {
                return syntax::is_method(node) || syntax::is_function(node) || syntax::is_closure(node);
            }

            static bool is_unbounded_call(const syntax::SyntaxNode& expr) {
                const auto node = syntax::unwrap_parentheses(expr);
                if (!syntax::is_member_call(node) && !syntax::is_static_call(node)) {
                    return false;
                }
                return is_unbounded_fetch(syntax::decompose_chain(node));
            }

            void record_assignment(const syntax::SyntaxNode& assignment) {
                const auto left = assignment.child_by_field("left");
                if (!left.is("variable_name")) {
                    return;
                }
                const std::string variable(left.text());
                if (is_unbounded_call(assignment.child_by_field("right"))) {
                    assigned_.back()[variable] = assignment.start_line();
                } else {
                    assigned_.back().erase(variable);
                }
            }

            void check_loop(const syntax::SyntaxNode& loop) {
                const auto parts = scope::foreach_parts(loop);
                const auto source = syntax::unwrap_parentheses(parts.source);

                if (is_unbounded_call(source)) {
                    const auto chain = syntax::decompose_chain(source);
                    context_.report(
                        ChunkMissingAnalyzer::ID, loop, Severity::High,
                        "loop-without-chunk",
                        "Looping over ->all() or ->get() without chunk() can cause memory issues on large datasets",
                        RECOMMENDATION,
                        {{"method", std::string(chain.last())}});
                    return;
                }

                if (!source.is("variable_name")) {
                    return;
                }
                const auto& variables = assigned_.back();
                const auto it = variables.find(std::string(source.text()));
                if (it == variables.end()) {
                    return;
                }
                context_.report(
                    ChunkMissingAnalyzer::ID, loop, Severity::High,
                    "loop-over-unbounded-variable",
                    "Looping over a variable assigned with ->all() or ->get() can cause memory issues "
                    "on large datasets",
                    RECOMMENDATION,
                    {
                        {"variable", it->first},
                        {"assigned_line", it->second},
                    });
            }

            FileContext& context_;
            std::vector<std::map<std::string, std::size_t>> assigned_;    // one frame per callable
        };

    }  // namespace

    bool is_unbounded_fetch(const syntax::CallChain& chain) noexcept {
        if (!chain.contains("all") && !chain.contains("get")) {
            return false;
        }
        if (chain.links.size() < 2 && chain.root_kind != syntax::ChainRoot::StaticClass) {
            return false;   // $collection->all() is not a query
        }
        for (const auto& link : chain.links) {
            if (vocab::contains(STREAMING_METHODS, link.name) || vocab::contains(BOUNDING_METHODS, link.name)) {
                return false;
            }
        }
        return true;
    }

    std::unique_ptr<scope::FileVisitor> ChunkMissingAnalyzer::create_visitor(FileContext& context) const {
        return std::make_unique<ChunkMissingVisitor>(context);
    }

    void register_chunk_missing_analyzer() {
        AnalyzerRegistry::instance().register_analyzer([] {
            return std::make_unique<ChunkMissingAnalyzer>();
        });
    }

}  // namespace lpa::analyzers
