//
// Created by gregorian-rayne on 1/16/26.
//

#ifndef LPA_FACADE_USAGE_ANALYZER_HPP
#define LPA_FACADE_USAGE_ANALYZER_HPP

/**
 * @file facade_usage_analyzer.hpp
 * @brief Classes that lean on too many different facades.
 */

#include "lpa/analyzers/analyzer.hpp"

#include <string>
#include <vector>

namespace lpa::analyzers {

    class FacadeUsageAnalyzer : public IAnalyzer {
    public:
        static constexpr std::string_view ID = "facade-usage";
        static constexpr std::size_t DEFAULT_THRESHOLD = 5;

        FacadeUsageAnalyzer();

        [[nodiscard]] std::string_view id() const noexcept override {
            return ID;
        }

        [[nodiscard]] std::string_view name() const noexcept override {
            return "Facade Usage";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Identifies excessive facade usage that makes classes hard to test and violates dependency inversion";
        }

        [[nodiscard]] Category category() const noexcept override {
            return Category::BestPractices;
        }

        [[nodiscard]] Severity severity() const noexcept override {
            return Severity::Medium;
        }

        [[nodiscard]] Result<void, Error> configure(const AnalyzerSettings& settings) override;

        [[nodiscard]] std::unique_ptr<scope::FileVisitor> create_visitor(FileContext& context) const override;

        [[nodiscard]] std::size_t threshold() const noexcept { return threshold_; }

        /**
         * Returns the facade short name a static call scope refers to, or
         * empty when it is not a known facade. Both Cache and
         * Illuminate\Support\Facades\Cache give "Cache".
         */
        [[nodiscard]] std::string_view facade_of(std::string_view scope) const;

    private:
        std::size_t threshold_ = DEFAULT_THRESHOLD;
        std::vector<std::string> facades_;
    };

    void register_facade_usage_analyzer();

}  // namespace lpa::analyzers

#endif //LPA_FACADE_USAGE_ANALYZER_HPP
