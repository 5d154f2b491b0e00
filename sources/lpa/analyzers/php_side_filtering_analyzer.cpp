//
// Created by gregorian-rayne on 1/15/26.
//

#include "lpa/analyzers/php_side_filtering_analyzer.hpp"
#include "lpa/analyzers/query_patterns.hpp"

#include "lpa/scope/vocabulary.hpp"
#include "lpa/syntax/php_nodes.hpp"
#include "lpa/utils/string_utils.hpp"

#include <array>
#include <string>
#include <vector>

namespace lpa::analyzers
{
    namespace {

        namespace vocab = scope::vocabulary;

        constexpr std::array<std::string_view, 2> FETCH_METHODS = {"get", "all"};

        constexpr std::array<std::string_view, 4> FILTER_METHODS = {
            "filter", "reject", "whereIn", "whereNotIn",
        };

        std::string recommendation_for(const std::string_view filter, const std::string& pattern) {
            std::string advice;
            if (filter == "filter") {
                advice = "Replace filter() with where() clauses before get()/all() to filter at database level. "
                         "For complex filtering logic, consider database computed columns or raw where clauses.";
            } else if (filter == "reject") {
                advice = "Replace reject() with where() or whereNot() clauses before get()/all() to filter at "
                         "database level.";
            } else {
                advice = "Replace the collection " + std::string(filter) + "() with the query builder's " +
                         std::string(filter) + "() before get()/all().";
            }
            return advice + " Current pattern \"" + pattern + "\" loads all data into memory before filtering, "
                   "which can exhaust memory on large tables.";
        }

        class PhpFilteringVisitor final : public scope::FileVisitor {
        public:
            explicit PhpFilteringVisitor(FileContext& context)
                : context_(context) {}

            void enter(const syntax::SyntaxNode& node) override {
                if (!syntax::is_member_call(node) || !is_outermost_call(node)) {
                    return;
                }

                const auto chain = syntax::decompose_chain(node);
                if (!is_eligible_root(chain)) {
                    return;
                }

                for (std::size_t i = 0; i + 1 < chain.links.size(); ++i) {
                    if (!vocab::contains(FETCH_METHODS, chain.links[i].name) ||
                        !vocab::contains(FILTER_METHODS, chain.links[i + 1].name)) {
                        continue;
                    }

                    std::vector<std::string_view> names;
                    for (const auto& link : chain.links) {
                        names.push_back(link.name);
                    }
                    const auto pattern = string_utils::join(names, "->");
                    const auto filter = chain.links[i + 1].name;

                    context_.report(
                        PhpSideFilteringAnalyzer::ID, node, Severity::Critical,
                        "php-side-filtering",
                        "Filtering data in PHP instead of database: " + pattern,
                        recommendation_for(filter, pattern),
                        {
                            {"pattern", pattern},
                            {"fetch_method", std::string(chain.links[i].name)},
                            {"filter_method", std::string(filter)},
                        });
                    return;
                }
            }

        private:
            [[nodiscard]] bool is_eligible_root(const syntax::CallChain& chain) const {
                switch (chain.root_kind) {
                    case syntax::ChainRoot::StaticClass:
                        return is_model_rooted(context_, chain);
                    case syntax::ChainRoot::Variable:
                    case syntax::ChainRoot::Property:
                        return true;
                    default:
                        return false;
                }
            }

            FileContext& context_;
        };

    }  // namespace

    std::unique_ptr<scope::FileVisitor> PhpSideFilteringAnalyzer::create_visitor(FileContext& context) const {
        return std::make_unique<PhpFilteringVisitor>(context);
    }

    void register_php_side_filtering_analyzer() {
        AnalyzerRegistry::instance().register_analyzer([] {
            return std::make_unique<PhpSideFilteringAnalyzer>();
        });
    }

}  // namespace lpa::analyzers
