//
// Created by gregorian-rayne on 1/16/26.
//

#ifndef LPA_MASS_ASSIGNMENT_ANALYZER_HPP
#define LPA_MASS_ASSIGNMENT_ANALYZER_HPP

/**
 * @file mass_assignment_analyzer.hpp
 * @brief Models and writes open to mass assignment.
 *
 * Models need $fillable or $guarded (High); $guarded = [] opens every
 * attribute (Critical). Unfiltered request data - request()->all(),
 * $request->input() without a key, Request::all(), Input::get() - passed
 * to create(), fill(), update() or a query builder insert is Critical.
 */

#include "lpa/analyzers/analyzer.hpp"

namespace lpa::analyzers {

    class MassAssignmentAnalyzer : public IAnalyzer {
    public:
        static constexpr std::string_view ID = "mass-assignment";

        [[nodiscard]] std::string_view id() const noexcept override {
            return ID;
        }

        [[nodiscard]] std::string_view name() const noexcept override {
            return "Mass Assignment Vulnerabilities Analyzer";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Detects mass assignment vulnerabilities in Eloquent models and query builders";
        }

        [[nodiscard]] Category category() const noexcept override {
            return Category::Security;
        }

        [[nodiscard]] Severity severity() const noexcept override {
            return Severity::High;
        }

        [[nodiscard]] std::unique_ptr<scope::FileVisitor> create_visitor(FileContext& context) const override;
    };

    /**
     * Checks whether an expression yields the whole, unfiltered request
     * payload.
     */
    [[nodiscard]] bool is_unfiltered_request_data(const syntax::SyntaxNode& expr);

    void register_mass_assignment_analyzer();

}  // namespace lpa::analyzers

#endif //LPA_MASS_ASSIGNMENT_ANALYZER_HPP
