//
// Created by gregorian-rayne on 1/16/26.
//

#ifndef LPA_RAW_ELOQUENT_AVOIDANCE_ANALYZER_HPP
#define LPA_RAW_ELOQUENT_AVOIDANCE_ANALYZER_HPP

#include "lpa/analyzers/analyzer.hpp"

namespace lpa::analyzers {

    /**
     * Flags raw SQL through the DB facade where an Eloquent call says the same.
     */
    class RawEloquentAvoidanceAnalyzer : public IAnalyzer {
    public:
        static constexpr std::string_view ID = "raw-eloquent-avoidance";

        [[nodiscard]] std::string_view id() const noexcept override {
            return ID;
        }

        [[nodiscard]] std::string_view name() const noexcept override {
            return "Raw Eloquent Avoidance Analyzer";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Detects simple raw SQL queries that could use Eloquent instead";
        }

        [[nodiscard]] Category category() const noexcept override {
            return Category::BestPractices;
        }

        [[nodiscard]] Severity severity() const noexcept override {
            return Severity::Low;
        }

        [[nodiscard]] Severity failing_severity() const noexcept override {
            return Severity::Low;
        }

        [[nodiscard]] std::unique_ptr<scope::FileVisitor> create_visitor(FileContext& context) const override;
    };

    /// COUNT(*), SUM(col), AVG(col), MAX(col) or MIN(col) and nothing else.
    [[nodiscard]] bool is_simple_aggregate(std::string_view sql);

    /// SELECT * FROM t [WHERE c = ?] or SELECT a, b FROM t.
    [[nodiscard]] bool is_simple_select(std::string_view sql);

    /// Single-table INSERT, UPDATE ... SET or DELETE ... WHERE without joins or subqueries.
    [[nodiscard]] bool is_simple_modification(std::string_view sql);

    void register_raw_eloquent_avoidance_analyzer();

}  // namespace lpa::analyzers

#endif //LPA_RAW_ELOQUENT_AVOIDANCE_ANALYZER_HPP
