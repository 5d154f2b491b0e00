//
// Created by gregorian-rayne on 1/15/26.
//

#include "lpa/analyzers/select_asterisk_analyzer.hpp"
#include "lpa/analyzers/query_patterns.hpp"

#include "lpa/scope/vocabulary.hpp"
#include "lpa/syntax/php_nodes.hpp"

#include <array>
#include <string>

namespace lpa::analyzers
{
    namespace {

        namespace vocab = scope::vocabulary;

        constexpr std::array<std::string_view, 3> FETCH_ALL_COLUMNS = {
            "all", "get", "first",
        };

        constexpr std::array<std::string_view, 6> COLUMN_SELECTIONS = {
            "select", "addSelect", "selectRaw", "pluck", "value", "only",
        };

        class SelectAsteriskVisitor final : public scope::FileVisitor {
        public:
            explicit SelectAsteriskVisitor(FileContext& context)
                : context_(context) {}

            void enter(const syntax::SyntaxNode& node) override {
                if (!syntax::is_member_call(node) && !syntax::is_static_call(node)) {
                    return;
                }
                if (!is_outermost_call(node)) {
                    return;
                }

                const auto chain = syntax::decompose_chain(node);
                const auto method = chain.last();
                if (!vocab::contains(FETCH_ALL_COLUMNS, method) || !is_model_rooted(context_, chain)) {
                    return;
                }
                if (!syntax::argument_values(node).empty()) {
                    return;     // get(['id', 'name'])
                }
                for (const auto& link : chain.links) {
                    if (vocab::contains(COLUMN_SELECTIONS, link.name)) {
                        return;
                    }
                }

                const std::string name(method);
                context_.report(
                    SelectAsteriskAnalyzer::ID, node, Severity::Low,
                    "select-asterisk",
                    "Query using ->" + name + "() without ->select() fetches all columns",
                    "Use ->select(['col1', 'col2']) to fetch only needed columns. This reduces memory usage and "
                    "network transfer, especially for tables with many columns or BLOB/TEXT fields.",
                    {
                        {"method", name},
                        {"model", context_.scopes().resolve_class(chain.root)},
                    });
            }

        private:
            FileContext& context_;
        };

    }  // namespace

    std::unique_ptr<scope::FileVisitor> SelectAsteriskAnalyzer::create_visitor(FileContext& context) const {
        return std::make_unique<SelectAsteriskVisitor>(context);
    }

    void register_select_asterisk_analyzer() {
        AnalyzerRegistry::instance().register_analyzer([] {
            return std::make_unique<SelectAsteriskAnalyzer>();
        });
    }

}  // namespace lpa::analyzers
