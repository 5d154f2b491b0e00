//
// Created by gregorian-rayne on 1/16/26.
//

#ifndef LPA_QUERY_BUILDER_IN_CONTROLLER_ANALYZER_HPP
#define LPA_QUERY_BUILDER_IN_CONTROLLER_ANALYZER_HPP

#include "lpa/analyzers/analyzer.hpp"

namespace lpa::analyzers {

    /**
     * Flags query construction inside controller methods.
     *
     * DB facade calls and builder methods beyond simple lookups (find,
     * all, first, count) belong in a repository, query object or model
     * scope. Severity follows the kind of query: joins and raw SQL are
     * High, conditions and aggregates Medium, the rest Low.
     */
    class QueryBuilderInControllerAnalyzer : public IAnalyzer {
    public:
        static constexpr std::string_view ID = "query-builder-in-controller";

        [[nodiscard]] std::string_view id() const noexcept override {
            return ID;
        }

        [[nodiscard]] std::string_view name() const noexcept override {
            return "Query Builder In Controller Analyzer";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Detects database queries built directly in controller methods";
        }

        [[nodiscard]] Category category() const noexcept override {
            return Category::BestPractices;
        }

        [[nodiscard]] Severity severity() const noexcept override {
            return Severity::Medium;
        }

        [[nodiscard]] bool should_analyze(std::string_view relative_path) const override;

        [[nodiscard]] std::unique_ptr<scope::FileVisitor> create_visitor(FileContext& context) const override;
    };

    void register_query_builder_in_controller_analyzer();

}  // namespace lpa::analyzers

#endif //LPA_QUERY_BUILDER_IN_CONTROLLER_ANALYZER_HPP
