//
// Created by gregorian-rayne on 1/15/26.
//

#ifndef LPA_LOGIC_IN_ROUTES_ANALYZER_HPP
#define LPA_LOGIC_IN_ROUTES_ANALYZER_HPP

/**
 * @file logic_in_routes_analyzer.hpp
 * @brief Route closures that do the work of a controller.
 *
 * Only files below a routes/ directory are analyzed. Every closure passed
 * to a Route:: call (directly or through a chain such as
 * Route::middleware(...)->get(...)) is checked for:
 * - database queries (Critical, route-has-db-queries)
 * - business logic: jobs, events, mail, container resolution, nested
 *   ifs, arithmetic inside loops, long method chains (High,
 *   route-has-business-logic)
 * - more than max_closure_lines lines (Medium, route-closure-too-long)
 *
 * All problems of a closure are reported as one issue whose code and
 * severity come from the most severe problem. Closures passed to
 * Route::group() only declare routes and are not checked themselves.
 */

#include "lpa/analyzers/analyzer.hpp"

namespace lpa::analyzers {

    class LogicInRoutesAnalyzer : public IAnalyzer {
    public:
        static constexpr std::string_view ID = "logic-in-routes";
        static constexpr std::size_t DEFAULT_MAX_CLOSURE_LINES = 5;
        static constexpr std::size_t DEFAULT_METHOD_CHAIN_THRESHOLD = 3;

        [[nodiscard]] std::string_view id() const noexcept override {
            return ID;
        }

        [[nodiscard]] std::string_view name() const noexcept override {
            return "Logic in Routes Analyzer";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Detects business logic and database queries in route closures";
        }

        [[nodiscard]] Category category() const noexcept override {
            return Category::BestPractices;
        }

        [[nodiscard]] Severity severity() const noexcept override {
            return Severity::High;
        }

        [[nodiscard]] Result<void, Error> configure(const AnalyzerSettings& settings) override;

        [[nodiscard]] bool should_analyze(std::string_view relative_path) const override;

        [[nodiscard]] std::unique_ptr<scope::FileVisitor> create_visitor(FileContext& context) const override;

        [[nodiscard]] std::size_t max_closure_lines() const noexcept { return max_closure_lines_; }
        [[nodiscard]] std::size_t method_chain_threshold() const noexcept { return method_chain_threshold_; }

    private:
        std::size_t max_closure_lines_ = DEFAULT_MAX_CLOSURE_LINES;
        std::size_t method_chain_threshold_ = DEFAULT_METHOD_CHAIN_THRESHOLD;
    };

    void register_logic_in_routes_analyzer();

}  // namespace lpa::analyzers

#endif //LPA_LOGIC_IN_ROUTES_ANALYZER_HPP
