//
// Created by gregorian-rayne on 1/15/26.
//

#include "lpa/report/baseline.hpp"
#include "lpa/version.hpp"

#include "lpa/utils/file_utils.hpp"
#include "lpa/utils/hash_utils.hpp"
#include "lpa/utils/json_utils.hpp"
#include "lpa/utils/logging.hpp"

#include <nlohmann/json.hpp>
#include <simdjson.h>

#include <algorithm>

namespace lpa::report
{
    std::string Baseline::hash_issue(const Issue& issue) {
        nlohmann::json key;
        key["file"] = issue.location.file.generic_string();
        key["line"] = issue.location.line;
        key["message"] = issue.message;
        return utils::compute_sha256(key.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }

    Baseline Baseline::from_report(const engine::AnalysisReport& report) {
        Baseline baseline;
        for (const auto& result : report.results) {
            if (!result.reported) {
                continue;
            }
            for (const auto& issue : result.issues) {
                baseline.add(result.rule_id, BaselineEntry{
                    issue.location.file.generic_string(),
                    issue.location.line,
                    issue.message,
                    hash_issue(issue)
                });
            }
        }
        return baseline;
    }

    Result<Baseline, Error> Baseline::parse(const std::string_view json) {
        using namespace simdjson;

        dom::parser parser;
        const padded_string padded(json);
        dom::element doc;
        if (parser.parse(padded).get(doc)) {
            return Result<Baseline, Error>::failure(Error::parse_error("Failed to parse baseline JSON"));
        }

        dom::object errors;
        if (doc["errors"].get(errors)) {
            return Result<Baseline, Error>::failure(
                Error::parse_error("Baseline JSON has no \"errors\" object"));
        }

        Baseline baseline;
        for (auto [rule_id, list] : errors) {
            dom::array entries;
            if (list.get(entries)) {
                continue;
            }
            for (auto element : entries) {
                dom::object obj;
                if (element.get(obj)) {
                    continue;
                }

                BaselineEntry entry;
                std::string_view text;
                if (obj["hash"].get(text) || text.empty()) {
                    continue;
                }
                entry.hash = std::string(text);
                if (!obj["path"].get(text)) {
                    entry.path = std::string(text);
                }
                if (!obj["message"].get(text)) {
                    entry.message = std::string(text);
                }
                uint64_t line = 0;
                if (!obj["line"].get(line)) {
                    entry.line = static_cast<std::size_t>(line);
                }
                baseline.add(std::string(rule_id), std::move(entry));
            }
        }
        return Result<Baseline, Error>::success(std::move(baseline));
    }

    Result<Baseline, Error> Baseline::load(const fs::path& path) {
        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<Baseline, Error>::failure(content.error());
        }
        auto baseline = parse(content.value());
        if (baseline.is_err()) {
            return Result<Baseline, Error>::failure(baseline.error().with_context(path.string()));
        }
        logging::get()->debug("Loaded {} baseline entries from {}", baseline.value().size(), path.string());
        return baseline;
    }

    bool Baseline::add(const std::string& rule_id, BaselineEntry entry) {
        if (!index_.emplace(rule_id, entry.hash).second) {
            return false;
        }
        entries_[rule_id].push_back(std::move(entry));
        return true;
    }

    std::size_t Baseline::merge(const Baseline& other) {
        std::size_t added = 0;
        for (const auto& [rule_id, entries] : other.entries_) {
            for (const auto& entry : entries) {
                if (add(rule_id, entry)) {
                    ++added;
                }
            }
        }
        return added;
    }

    bool Baseline::contains(const std::string_view rule_id, const std::string_view hash) const {
        return index_.contains({std::string(rule_id), std::string(hash)});
    }

    bool Baseline::contains(const Issue& issue) const {
        return contains(issue.rule_id, hash_issue(issue));
    }

    std::size_t Baseline::filter(engine::AnalysisReport& report) const {
        std::size_t dropped = 0;
        for (auto& result : report.results) {
            const auto removed = std::erase_if(result.issues, [this, &result](const Issue& issue) {
                return contains(result.rule_id, hash_issue(issue));
            });
            if (removed > 0) {
                dropped += removed;
                result.refresh_status();
            }
        }
        return dropped;
    }

    std::string Baseline::to_json(const Timestamp generated_at) const {
        nlohmann::json output;
        output["generated_at"] = json_utils::format_timestamp(generated_at);
        output["version"] = VERSION_STRING;

        nlohmann::json errors = nlohmann::json::object();
        for (const auto& [rule_id, entries] : entries_) {
            auto sorted = entries;
            std::ranges::sort(sorted, [](const BaselineEntry& a, const BaselineEntry& b) {
                if (a.path != b.path) return a.path < b.path;
                if (a.line != b.line) return a.line < b.line;
                return a.hash < b.hash;
            });

            nlohmann::json list = nlohmann::json::array();
            for (const auto& entry : sorted) {
                list.push_back({
                    {"type", "hash"},
                    {"path", entry.path},
                    {"line", entry.line},
                    {"message", entry.message},
                    {"hash", entry.hash},
                });
            }
            errors[rule_id] = std::move(list);
        }
        output["errors"] = std::move(errors);

        return output.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    Result<void, Error> Baseline::save(const fs::path& path, const Timestamp generated_at) const {
        return file_utils::write_file(path, to_json(generated_at) + "\n");
    }

}  // namespace lpa::report
