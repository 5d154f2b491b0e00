//
// Created by gregorian-rayne on 1/16/26.
//

#ifndef LPA_HARDCODED_STORAGE_PATHS_ANALYZER_HPP
#define LPA_HARDCODED_STORAGE_PATHS_ANALYZER_HPP

/**
 * @file hardcoded_storage_paths_analyzer.hpp
 * @brief Filesystem paths written out instead of built with path helpers.
 *
 * Absolute deployment paths (/var/www/.../storage), Windows drive paths
 * and ../storage/ style relative paths are always reported. Paths such
 * as /storage/app/ or /public/ double as URL paths, so they are only
 * reported when they flow into a filesystem call: a PHP file function,
 * a Storage or File facade method, response()->download() or a method
 * on a variable named like a filesystem. /public/ and /app/ need one of
 * the definite contexts; a variable name alone is not enough for them.
 */

#include "lpa/analyzers/analyzer.hpp"

#include <regex>
#include <string>
#include <vector>

namespace lpa::analyzers {

    /**
     * A path pattern and the helper that replaces it.
     */
    struct PathPattern {
        std::regex regex;
        std::string helper;
        bool needs_definite_context = false;
    };

    class HardcodedStoragePathsAnalyzer : public IAnalyzer {
    public:
        static constexpr std::string_view ID = "hardcoded-storage-paths";

        HardcodedStoragePathsAnalyzer();

        [[nodiscard]] std::string_view id() const noexcept override {
            return ID;
        }

        [[nodiscard]] std::string_view name() const noexcept override {
            return "Hardcoded Storage Paths Analyzer";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Finds hardcoded storage/public paths instead of Laravel path helpers";
        }

        [[nodiscard]] Category category() const noexcept override {
            return Category::BestPractices;
        }

        [[nodiscard]] Severity severity() const noexcept override {
            return Severity::Medium;
        }

        [[nodiscard]] Result<void, Error> configure(const AnalyzerSettings& settings) override;

        [[nodiscard]] std::unique_ptr<scope::FileVisitor> create_visitor(FileContext& context) const override;

        [[nodiscard]] bool is_allowed(std::string_view value) const;

        /// Helper for a path that is wrong wherever it appears, or nullptr.
        [[nodiscard]] const PathPattern* always_flagged(const std::string& value) const;

        /// Helper for a path that is only wrong in a filesystem call, or nullptr.
        [[nodiscard]] const PathPattern* context_required(const std::string& value) const;

    private:
        std::vector<std::string> allowed_paths_;
        std::vector<PathPattern> always_patterns_;
        std::vector<PathPattern> context_patterns_;
    };

    void register_hardcoded_storage_paths_analyzer();

}  // namespace lpa::analyzers

#endif //LPA_HARDCODED_STORAGE_PATHS_ANALYZER_HPP
