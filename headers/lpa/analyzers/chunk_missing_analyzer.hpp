//
// Created by gregorian-rayne on 1/16/26.
//

#ifndef LPA_CHUNK_MISSING_ANALYZER_HPP
#define LPA_CHUNK_MISSING_ANALYZER_HPP

/**
 * @file chunk_missing_analyzer.hpp
 * @brief Loops over unbounded result sets.
 *
 * A foreach that iterates ->all() or ->get() loads the whole table into
 * memory. The iterated expression is either the query itself or a
 * variable assigned from one earlier in the same callable. Queries that
 * already stream (chunk, cursor, lazy, paginate) or are bounded (limit,
 * take, first, find) pass.
 */

#include "lpa/analyzers/analyzer.hpp"

namespace lpa::analyzers {

    class ChunkMissingAnalyzer : public IAnalyzer {
    public:
        static constexpr std::string_view ID = "chunk-missing";

        [[nodiscard]] std::string_view id() const noexcept override {
            return ID;
        }

        [[nodiscard]] std::string_view name() const noexcept override {
            return "Chunk Missing Analyzer";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Detects loops over ->all() or ->get() results that should use chunk(), cursor() or lazy()";
        }

        [[nodiscard]] Category category() const noexcept override {
            return Category::Performance;
        }

        [[nodiscard]] Severity severity() const noexcept override {
            return Severity::High;
        }

        [[nodiscard]] std::unique_ptr<scope::FileVisitor> create_visitor(FileContext& context) const override;
    };

    /**
     * Checks whether a call chain fetches every row without streaming or
     * bounding the result.
     */
    [[nodiscard]] bool is_unbounded_fetch(const syntax::CallChain& chain) noexcept;

    void register_chunk_missing_analyzer();

}  // namespace lpa::analyzers

#endif //LPA_CHUNK_MISSING_ANALYZER_HPP
