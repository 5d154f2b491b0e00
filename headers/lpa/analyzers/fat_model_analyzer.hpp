//
// Created by gregorian-rayne on 1/15/26.
//

#ifndef LPA_FAT_MODEL_ANALYZER_HPP
#define LPA_FAT_MODEL_ANALYZER_HPP

/**
 * @file fat_model_analyzer.hpp
 * @brief Models carrying business logic that belongs in services.
 *
 * For every class descending from an ORM base model:
 * - public business methods are counted; scopes, accessors and
 *   mutators, relations, framework hooks and magic methods are not
 * - property and method declarations are summed into statement lines
 * - each business method gets a cyclomatic complexity
 *
 * Severity grows with the distance over the threshold.
 */

#include "lpa/analyzers/analyzer.hpp"

namespace lpa::analyzers {

    class FatModelAnalyzer : public IAnalyzer {
    public:
        static constexpr std::string_view ID = "fat-model";
        static constexpr std::size_t DEFAULT_METHOD_THRESHOLD = 15;
        static constexpr std::size_t DEFAULT_LOC_THRESHOLD = 300;
        static constexpr std::size_t DEFAULT_COMPLEXITY_THRESHOLD = 10;

        [[nodiscard]] std::string_view id() const noexcept override {
            return ID;
        }

        [[nodiscard]] std::string_view name() const noexcept override {
            return "Fat Model Analyzer";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Detects Eloquent models with too much business logic that should be extracted to services";
        }

        [[nodiscard]] Category category() const noexcept override {
            return Category::BestPractices;
        }

        [[nodiscard]] Severity severity() const noexcept override {
            return Severity::Medium;
        }

        [[nodiscard]] Result<void, Error> configure(const AnalyzerSettings& settings) override;

        [[nodiscard]] std::unique_ptr<scope::FileVisitor> create_visitor(FileContext& context) const override;

        [[nodiscard]] std::size_t method_threshold() const noexcept { return method_threshold_; }
        [[nodiscard]] std::size_t loc_threshold() const noexcept { return loc_threshold_; }
        [[nodiscard]] std::size_t complexity_threshold() const noexcept { return complexity_threshold_; }

    private:
        std::size_t method_threshold_ = DEFAULT_METHOD_THRESHOLD;
        std::size_t loc_threshold_ = DEFAULT_LOC_THRESHOLD;
        std::size_t complexity_threshold_ = DEFAULT_COMPLEXITY_THRESHOLD;
    };

    /**
     * Cyclomatic complexity of a method: one plus every branch, loop,
     * catch, ternary, short-circuit operator, null coalescing and match arm
     * condition in its body.
     */
    [[nodiscard]] std::size_t cyclomatic_complexity(const syntax::SyntaxNode& method);

    /**
     * Checks whether a method defines an Eloquent relation, judged by its
     * return type or by the relation call in its last return statement.
     */
    [[nodiscard]] bool is_relation_method(const syntax::SyntaxNode& method);

    void register_fat_model_analyzer();

}  // namespace lpa::analyzers

#endif //LPA_FAT_MODEL_ANALYZER_HPP
