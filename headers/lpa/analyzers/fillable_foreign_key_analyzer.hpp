//
// Created by gregorian-rayne on 1/16/26.
//

#ifndef LPA_FILLABLE_FOREIGN_KEY_ANALYZER_HPP
#define LPA_FILLABLE_FOREIGN_KEY_ANALYZER_HPP

/**
 * @file fillable_foreign_key_analyzer.hpp
 * @brief Foreign key columns listed in a model's $fillable.
 */

#include "lpa/analyzers/analyzer.hpp"

namespace lpa::analyzers {

    class FillableForeignKeyAnalyzer : public IAnalyzer {
    public:
        static constexpr std::string_view ID = "fillable-foreign-key";

        [[nodiscard]] std::string_view id() const noexcept override {
            return ID;
        }

        [[nodiscard]] std::string_view name() const noexcept override {
            return "Fillable Foreign Key Analyzer";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Detects foreign keys in fillable arrays that may allow unauthorized relationship manipulation";
        }

        [[nodiscard]] Category category() const noexcept override {
            return Category::Security;
        }

        [[nodiscard]] Severity severity() const noexcept override {
            return Severity::High;
        }

        [[nodiscard]] std::unique_ptr<scope::FileVisitor> create_visitor(FileContext& context) const override;
    };

    void register_fillable_foreign_key_analyzer();

}  // namespace lpa::analyzers

#endif //LPA_FILLABLE_FOREIGN_KEY_ANALYZER_HPP
