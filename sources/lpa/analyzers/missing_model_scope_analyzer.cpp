//
// Created by gregorian-rayne on 1/16/26.
//

#include "lpa/analyzers/missing_model_scope_analyzer.hpp"

#include "lpa/utils/string_utils.hpp"

#include <algorithm>
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace lpa::analyzers
{
    namespace {

        bool is_where_method(const std::string_view method) noexcept {
            return string_utils::starts_with(method, "where") || method == "orWhere";
        }

        std::optional<std::string> literal_argument(const syntax::SyntaxNode& value) {
            if (auto text = syntax::string_literal(value)) {
                return text;
            }
            if (value.is("integer") || value.is("float") || value.is("boolean") ||
                value.is("null") || value.is("name")) {
                return std::string(value.text());
            }
            return std::nullopt;
        }

        std::string signature_of(const std::vector<WhereCall>& calls) {
            std::vector<std::string> parts;
            for (const auto& call : calls) {
                parts.push_back(call.method + "(" + string_utils::join(call.arguments, ",") + ")");
            }
            return string_utils::join(parts, "->");
        }

        std::string pattern_of(const std::vector<WhereCall>& calls) {
            std::vector<std::string> parts;
            for (const auto& call : calls) {
                if (call.arguments.empty()) {
                    parts.push_back(call.method + "(...)");
                    continue;
                }
                const std::vector<std::string> shown(
                    call.arguments.begin(),
                    call.arguments.begin() + static_cast<std::ptrdiff_t>(std::min<std::size_t>(call.arguments.size(), 2)));
                parts.push_back(call.method + "('" + string_utils::join(shown, "', '") + "', ...)");
            }
            return string_utils::join(parts, "->");
        }

        class ModelScopeVisitor final : public scope::FileVisitor {
        public:
            explicit ModelScopeVisitor(FileContext& context)
                : context_(context) {}

            void enter(const syntax::SyntaxNode& node) override {
                if (!syntax::is_member_call(node) || is_where_method(syntax::call_name(node))) {
                    return;
                }
                // Only the outermost call of a chain, so get()->count() counts once
                if (const auto parent = node.parent();
                    syntax::is_member_call(parent) && parent.child_by_field("object") == node) {
                    return;
                }

                const auto calls = where_chain(syntax::decompose_chain(node));
                std::set<std::string> seen;
                for (std::size_t start = 0; start < calls.size(); ++start) {
                    for (std::size_t length = 2; start + length <= calls.size(); ++length) {
                        const std::vector<WhereCall> sub(
                            calls.begin() + static_cast<std::ptrdiff_t>(start),
                            calls.begin() + static_cast<std::ptrdiff_t>(start + length));
                        auto signature = signature_of(sub);
                        if (!seen.insert(signature).second) {
                            continue;
                        }
                        const auto pattern = pattern_of(sub);
                        context_.report(
                            MissingModelScopeAnalyzer::ID, node, Severity::Low,
                            "repeated-query-pattern",
                            "Query pattern \"" + pattern + "\"",
                            "Extract this query pattern to a model scope for reusability",
                            {{"signature", std::move(signature)}, {"pattern", pattern}});
                    }
                }
            }

        private:
            FileContext& context_;
        };

    }  // namespace

    std::vector<WhereCall> where_chain(const syntax::CallChain& chain) {
        std::vector<WhereCall> calls;
        for (const auto& link : chain.links) {
            if (!is_where_method(link.name) || !link.call.child_by_field("name").is("name")) {
                continue;
            }
            WhereCall call{std::string(link.name), {}};
            for (const auto& value : syntax::argument_values(link.call)) {
                if (auto literal = literal_argument(value)) {
                    call.arguments.push_back(std::move(*literal));
                }
            }
            calls.push_back(std::move(call));
        }
        if (calls.size() < 2) {
            calls.clear();
        }
        return calls;
    }

    std::unique_ptr<scope::FileVisitor> MissingModelScopeAnalyzer::create_visitor(FileContext& context) const {
        return std::make_unique<ModelScopeVisitor>(context);
    }

    void MissingModelScopeAnalyzer::finalize_issues(std::vector<Issue>& issues) const {
        std::map<std::string, std::vector<std::size_t>> occurrences;
        for (std::size_t i = 0; i < issues.size(); ++i) {
            occurrences[issues[i].metadata.value("signature", std::string{})].push_back(i);
        }

        std::vector<bool> keep(issues.size(), false);
        for (const auto& [signature, indices] : occurrences) {
            if (indices.size() < 2) {
                continue;
            }

            std::vector<std::string> places;
            for (std::size_t n = 0; n < indices.size() && n < 3; ++n) {
                const auto& location = issues[indices[n]].location;
                places.push_back(location.file.filename().string() + ":" + std::to_string(location.line));
            }

            auto& first = issues[indices.front()];
            const auto pattern = first.metadata.value("pattern", std::string{});
            first.message = "Query pattern \"" + pattern + "\" appears " +
                            std::to_string(indices.size()) + " times across the codebase";
            first.recommendation = "Extract this query pattern to a model scope for reusability. Found " +
                                   std::to_string(indices.size()) + " occurrences at: " +
                                   string_utils::join(places, ", ");
            first.metadata["occurrences"] = indices.size();
            keep[indices.front()] = true;
        }

        std::vector<Issue> kept;
        for (std::size_t i = 0; i < issues.size(); ++i) {
            if (keep[i]) {
                kept.push_back(std::move(issues[i]));
            }
        }
        issues = std::move(kept);
    }

    void register_missing_model_scope_analyzer() {
        AnalyzerRegistry::instance().register_analyzer([] {
            return std::make_unique<MissingModelScopeAnalyzer>();
        });
    }

}  // namespace lpa::analyzers
