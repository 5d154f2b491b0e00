//
// Created by gregorian-rayne on 1/15/26.
//

#ifndef LPA_SELECT_ASTERISK_ANALYZER_HPP
#define LPA_SELECT_ASTERISK_ANALYZER_HPP

#include "lpa/analyzers/analyzer.hpp"

namespace lpa::analyzers {

    /**
     * Flags model queries that fetch every column.
     *
     * A chain rooted at a model class ending in all(), get() or first()
     * is reported unless it selects columns, either through a
     * select-style call in the chain or by passing columns to the
     * fetching call itself.
     */
    class SelectAsteriskAnalyzer : public IAnalyzer {
    public:
        static constexpr std::string_view ID = "select-asterisk";

        [[nodiscard]] std::string_view id() const noexcept override {
            return ID;
        }

        [[nodiscard]] std::string_view name() const noexcept override {
            return "Select Asterisk Detector";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Detects queries fetching all columns when only specific columns are needed";
        }

        [[nodiscard]] Category category() const noexcept override {
            return Category::Performance;
        }

        [[nodiscard]] Severity severity() const noexcept override {
            return Severity::Low;
        }

        [[nodiscard]] Severity failing_severity() const noexcept override {
            return Severity::Low;
        }

        [[nodiscard]] std::unique_ptr<scope::FileVisitor> create_visitor(FileContext& context) const override;
    };

    void register_select_asterisk_analyzer();

}  // namespace lpa::analyzers

#endif //LPA_SELECT_ASTERISK_ANALYZER_HPP
