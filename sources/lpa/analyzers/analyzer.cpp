//
// Created by gregorian-rayne on 1/15/26.
//

#include "lpa/analyzers/analyzer.hpp"

#include "lpa/models/model_registry.hpp"
#include "lpa/utils/string_utils.hpp"

#include <algorithm>
#include <utility>

namespace lpa::analyzers
{
    // ============================================================================
    // AnalyzerSettings
    // ============================================================================

    void AnalyzerSettings::set(std::string key, SettingValue value) {
        values_.insert_or_assign(std::move(key), std::move(value));
    }

    bool AnalyzerSettings::has(const std::string_view key) const {
        return values_.find(key) != values_.end();
    }

    std::string AnalyzerSettings::full_key(const std::string_view key) const {
        std::string result = "analyzers.";
        result += rule_id_;
        result += '.';
        result += key;
        return result;
    }

    const SettingValue* AnalyzerSettings::find(const std::string_view key) const {
        const auto it = values_.find(key);
        return it == values_.end() ? nullptr : &it->second;
    }

    Result<std::size_t, Error> AnalyzerSettings::get_count(
        const std::string_view key,
        const std::size_t fallback,
        const std::size_t minimum
    ) const {
        const auto* value = find(key);
        if (!value) {
            return Result<std::size_t, Error>::success(fallback);
        }

        const auto* number = std::get_if<std::int64_t>(value);
        if (!number) {
            return Result<std::size_t, Error>::failure(
                Error::config_error("Expected an integer", full_key(key)));
        }
        if (*number < 0 || static_cast<std::size_t>(*number) < minimum) {
            return Result<std::size_t, Error>::failure(Error::config_error(
                "Value " + std::to_string(*number) + " is below the minimum of " + std::to_string(minimum),
                full_key(key)));
        }

        return Result<std::size_t, Error>::success(static_cast<std::size_t>(*number));
    }

    Result<bool, Error> AnalyzerSettings::get_bool(const std::string_view key, const bool fallback) const {
        const auto* value = find(key);
        if (!value) {
            return Result<bool, Error>::success(fallback);
        }
        if (const auto* flag = std::get_if<bool>(value)) {
            return Result<bool, Error>::success(*flag);
        }
        return Result<bool, Error>::failure(Error::config_error("Expected a boolean", full_key(key)));
    }

    Result<std::vector<std::string>, Error> AnalyzerSettings::get_strings(const std::string_view key) const {
        const auto* value = find(key);
        if (!value) {
            return Result<std::vector<std::string>, Error>::success({});
        }
        if (const auto* list = std::get_if<std::vector<std::string>>(value)) {
            return Result<std::vector<std::string>, Error>::success(*list);
        }
        // A single string is accepted as a one-element list
        if (const auto* single = std::get_if<std::string>(value)) {
            return Result<std::vector<std::string>, Error>::success({*single});
        }
        return Result<std::vector<std::string>, Error>::failure(
            Error::config_error("Expected a list of strings", full_key(key)));
    }

    Result<std::vector<std::string>, Error> AnalyzerSettings::get_strings(
        const std::string_view key, std::vector<std::string> fallback) const {
        if (!has(key)) {
            return Result<std::vector<std::string>, Error>::success(std::move(fallback));
        }
        return get_strings(key);
    }

    Result<std::map<std::string, std::string>, Error> AnalyzerSettings::get_string_map(
        const std::string_view key
    ) const {
        using MapResult = Result<std::map<std::string, std::string>, Error>;

        const auto* value = find(key);
        if (!value) {
            return MapResult::success({});
        }
        if (const auto* map = std::get_if<std::map<std::string, std::string>>(value)) {
            return MapResult::success(*map);
        }
        return MapResult::failure(Error::config_error("Expected a table of strings", full_key(key)));
    }

    // ============================================================================
    // FileContext
    // ============================================================================

    std::string make_excerpt(const std::string_view text, const std::size_t max_length) {
        auto line = text.substr(0, text.find('\n'));
        line = string_utils::trim(line);
        if (line.size() <= max_length) {
            return std::string(line);
        }
        // Never split a UTF-8 sequence: back up over continuation bytes.
        std::size_t cut = max_length;
        while (cut > 0 && (static_cast<unsigned char>(line[cut]) & 0xC0) == 0x80) {
            --cut;
        }
        std::string result(line.substr(0, cut));
        result += "...";
        return result;
    }

    FileContext::FileContext(
        fs::path path,
        std::string relative_path,
        const syntax::SyntaxTree& tree,
        const models::ModelRegistry& registry,
        scope::ScopeTracker& scopes,
        const scope::SuppressionIndex& suppressions
    )
        : path_(std::move(path))
        , relative_path_(std::move(relative_path))
        , tree_(tree)
        , registry_(registry)
        , scopes_(scopes)
        , suppressions_(suppressions)
        , resolver_(scopes) {}

    std::optional<std::string> FileContext::model_table(const std::string_view qualified_name) const {
        if (auto table = registry_.resolve_table(qualified_name); table.is_ok()) {
            return std::move(table).value();
        }
        return std::nullopt;
    }

    bool FileContext::is_suppressed(const std::string_view rule_id, const std::size_t line) const {
        return scopes_.is_suppressed(rule_id) || suppressions_.line_suppressed(rule_id, line);
    }

    bool FileContext::report(
        const std::string_view rule_id,
        const syntax::SyntaxNode& node,
        const Severity severity,
        std::string code,
        std::string message,
        std::string recommendation,
        nlohmann::json metadata
    ) {
        return report_at(rule_id, node.start_line(), node.end_line(), severity,
                         std::move(code), std::move(message), std::move(recommendation),
                         make_excerpt(node.text()), std::move(metadata));
    }

    bool FileContext::report_at(
        const std::string_view rule_id,
        const std::size_t line,
        const std::size_t end_line,
        const Severity severity,
        std::string code,
        std::string message,
        std::string recommendation,
        std::string excerpt,
        nlohmann::json metadata
    ) {
        if (is_suppressed(rule_id, line)) {
            return false;
        }

        Issue issue;
        issue.rule_id = std::string(rule_id);
        issue.severity = severity;
        issue.code = std::move(code);
        issue.message = std::move(message);
        issue.recommendation = std::move(recommendation);
        issue.location.file = relative_path_;
        issue.location.line = line;
        issue.location.end_line = std::max(line, end_line);
        issue.excerpt = std::move(excerpt);
        issue.metadata = std::move(metadata);

        auto it = issues_.find(rule_id);
        if (it == issues_.end()) {
            it = issues_.emplace(std::string(rule_id), std::vector<Issue>{}).first;
        }
        it->second.push_back(std::move(issue));
        return true;
    }

    std::vector<Issue> FileContext::take_issues(const std::string_view rule_id) {
        const auto it = issues_.find(rule_id);
        if (it == issues_.end()) {
            return {};
        }
        auto issues = std::move(it->second);
        issues_.erase(it);
        return issues;
    }

}  // namespace lpa::analyzers
