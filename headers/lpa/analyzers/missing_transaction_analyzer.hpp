//
// Created by gregorian-rayne on 1/15/26.
//

#ifndef LPA_MISSING_TRANSACTION_ANALYZER_HPP
#define LPA_MISSING_TRANSACTION_ANALYZER_HPP

/**
 * @file missing_transaction_analyzer.hpp
 * @brief Methods with several database writes outside a transaction.
 *
 * A write is protected when it is lexically inside:
 * - the closure passed as first argument to a transaction() call
 * - the span between beginTransaction() and the last commit()/rollBack()
 *   that follows it in the same method
 *
 * Writes to caches, sessions, queues and file storage are not counted.
 * Tests, seeders, factories and migrations are not analyzed.
 */

#include "lpa/analyzers/analyzer.hpp"

namespace lpa::analyzers {

    class MissingTransactionAnalyzer : public IAnalyzer {
    public:
        static constexpr std::string_view ID = "missing-database-transactions";
        static constexpr std::size_t DEFAULT_THRESHOLD = 2;

        [[nodiscard]] std::string_view id() const noexcept override {
            return ID;
        }

        [[nodiscard]] std::string_view name() const noexcept override {
            return "Missing Database Transactions Analyzer";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Detects methods performing multiple database writes without transaction protection";
        }

        [[nodiscard]] Category category() const noexcept override {
            return Category::Reliability;
        }

        [[nodiscard]] Severity severity() const noexcept override {
            return Severity::High;
        }

        [[nodiscard]] Result<void, Error> configure(const AnalyzerSettings& settings) override;

        [[nodiscard]] bool should_analyze(std::string_view relative_path) const override;

        [[nodiscard]] std::unique_ptr<scope::FileVisitor> create_visitor(FileContext& context) const override;

        [[nodiscard]] std::size_t threshold() const noexcept { return threshold_; }

    private:
        std::size_t threshold_ = DEFAULT_THRESHOLD;
    };

    /**
     * Checks whether a call writes to the relational database.
     */
    [[nodiscard]] bool is_write_operation(const FileContext& context, const syntax::SyntaxNode& call);

    void register_missing_transaction_analyzer();

}  // namespace lpa::analyzers

#endif //LPA_MISSING_TRANSACTION_ANALYZER_HPP
