//
// Created by gregorian-rayne on 1/15/26.
//

#ifndef LPA_BASELINE_HPP
#define LPA_BASELINE_HPP

/**
 * @file baseline.hpp
 * @brief Accepted issues that later runs should not report again.
 *
 * File layout:
 * @code
 * {
 *   "generated_at": "2026-01-15T10:00:00Z",
 *   "version": "1.2.0",
 *   "errors": {
 *     "<rule-id>": [
 *       {"type": "hash", "path": "app/X.php", "line": 12, "message": "...", "hash": "<sha256>"}
 *     ]
 *   }
 * }
 * @endcode
 *
 * The hash covers the file, line and message of an issue, so an issue
 * that moves to another line is reported again.
 */

#include "lpa/result.hpp"
#include "lpa/error.hpp"
#include "lpa/types.hpp"
#include "lpa/engine/report.hpp"

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lpa::report {

    struct BaselineEntry {
        std::string path;
        std::size_t line = 0;
        std::string message;
        std::string hash;
    };

    class Baseline {
    public:
        /**
         * SHA-256 of the JSON object {"file", "line", "message"} of an issue.
         */
        [[nodiscard]] static std::string hash_issue(const Issue& issue);

        /**
         * Collects the issues of every reported analyzer.
         */
        [[nodiscard]] static Baseline from_report(const engine::AnalysisReport& report);

        /**
         * Parses baseline JSON.
         *
         * Entries without a hash are ignored.
         *
         * @return The baseline, or ParseError for malformed JSON.
         */
        [[nodiscard]] static Result<Baseline, Error> parse(std::string_view json);

        [[nodiscard]] static Result<Baseline, Error> load(const fs::path& path);

        /**
         * Adds a rule's entry unless the same hash is already present.
         *
         * @return true when the entry was added.
         */
        bool add(const std::string& rule_id, BaselineEntry entry);

        /**
         * Adds every entry of another baseline that is not already present.
         *
         * @return Number of entries added.
         */
        std::size_t merge(const Baseline& other);

        [[nodiscard]] bool contains(std::string_view rule_id, std::string_view hash) const;
        [[nodiscard]] bool contains(const Issue& issue) const;

        /**
         * Drops baselined issues from a report and recomputes statuses.
         *
         * @return Number of issues dropped.
         */
        std::size_t filter(engine::AnalysisReport& report) const;

        [[nodiscard]] std::size_t size() const noexcept { return index_.size(); }
        [[nodiscard]] bool empty() const noexcept { return index_.empty(); }

        [[nodiscard]] const std::map<std::string, std::vector<BaselineEntry>>& entries() const noexcept {
            return entries_;
        }

        [[nodiscard]] std::string to_json(Timestamp generated_at) const;

        [[nodiscard]] Result<void, Error> save(const fs::path& path, Timestamp generated_at) const;

    private:
        std::map<std::string, std::vector<BaselineEntry>> entries_;     // rule id -> entries
        std::set<std::pair<std::string, std::string>> index_;   // (rule id, hash)
    };

}  // namespace lpa::report

#endif //LPA_BASELINE_HPP
