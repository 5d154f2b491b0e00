//
// Created by gregorian-rayne on 1/15/26.
//

#ifndef LPA_MVC_STRUCTURE_ANALYZER_HPP
#define LPA_MVC_STRUCTURE_ANALYZER_HPP

/**
 * @file mvc_structure_analyzer.hpp
 * @brief Presentation logic in models and oversized controller actions.
 *
 * - models declaring render(), toHtml(), toView(), renderView() or display()
 * - model methods calling the view() helper
 * - controller methods longer than max_controller_method_lines
 *
 * A controller is a class named *Controller or declared below a
 * Controllers/ directory.
 */

#include "lpa/analyzers/analyzer.hpp"

namespace lpa::analyzers {

    class MvcStructureAnalyzer : public IAnalyzer {
    public:
        static constexpr std::string_view ID = "mvc-structure-violation";
        static constexpr std::size_t DEFAULT_MAX_CONTROLLER_METHOD_LINES = 50;

        [[nodiscard]] std::string_view id() const noexcept override {
            return ID;
        }

        [[nodiscard]] std::string_view name() const noexcept override {
            return "MVC Structure Violation Analyzer";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Detects violations of Model-View-Controller architectural pattern";
        }

        [[nodiscard]] Category category() const noexcept override {
            return Category::BestPractices;
        }

        [[nodiscard]] Severity severity() const noexcept override {
            return Severity::High;
        }

        [[nodiscard]] Result<void, Error> configure(const AnalyzerSettings& settings) override;

        [[nodiscard]] std::unique_ptr<scope::FileVisitor> create_visitor(FileContext& context) const override;

        [[nodiscard]] std::size_t max_controller_method_lines() const noexcept {
            return max_controller_method_lines_;
        }

    private:
        std::size_t max_controller_method_lines_ = DEFAULT_MAX_CONTROLLER_METHOD_LINES;
    };

    void register_mvc_structure_analyzer();

}  // namespace lpa::analyzers

#endif //LPA_MVC_STRUCTURE_ANALYZER_HPP
