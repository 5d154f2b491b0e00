//
// Created by gregorian-rayne on 1/16/26.
//

#include "lpa/analyzers/helper_function_abuse_analyzer.hpp"

#include "lpa/syntax/php_nodes.hpp"

#include <algorithm>
#include <utility>

namespace lpa::analyzers
{
    namespace {

        struct HelperUsage {
            syntax::SyntaxNode node;
            std::string name;
            std::vector<std::pair<std::string, std::size_t>> calls;    // first use order

            [[nodiscard]] std::size_t total() const noexcept {
                std::size_t sum = 0;
                for (const auto& [helper, count] : calls) {
                    sum += count;
                }
                return sum;
            }
        };

        class HelperFunctionVisitor final : public scope::FileVisitor {
        public:
            HelperFunctionVisitor(const HelperFunctionAbuseAnalyzer& analyzer, FileContext& context)
                : analyzer_(analyzer), context_(context) {}

            void enter(const syntax::SyntaxNode& node) override {
                if (node.is("class_declaration") || node.is("trait_declaration")) {
                    types_.push_back({node, std::string(syntax::declaration_name(node)), {}});
                    return;
                }
                if (types_.empty() || !syntax::is_function_call(node)) {
                    return;
                }

                const auto function = node.child_by_field("function");
                if (!function.is("name")) {
                    return;
                }
                const std::string name(function.text());
                if (!analyzer_.is_helper(name)) {
                    return;
                }
                auto& calls = types_.back().calls;
                const auto known = std::ranges::find_if(calls, [&name](const auto& entry) {
                    return entry.first == name;
                });
                if (known == calls.end()) {
                    calls.emplace_back(name, 1);
                } else {
                    ++known->second;
                }
            }

            void leave(const syntax::SyntaxNode& node) override {
                if (types_.empty() || types_.back().node != node) {
                    return;
                }
                check(types_.back());
                types_.pop_back();
            }

        private:
            void check(const HelperUsage& usage) {
                const auto count = usage.total();
                const auto threshold = analyzer_.threshold();
                if (count <= threshold) {
                    return;
                }

                std::string listed;
                auto helpers = nlohmann::json::object();
                for (const auto& [helper, calls] : usage.calls) {
                    listed += (listed.empty() ? "" : ", ") + helper + "() (" + std::to_string(calls) + "x)";
                    helpers[helper] = calls;
                }

                context_.report_at(
                    HelperFunctionAbuseAnalyzer::ID, usage.node.start_line(), usage.node.start_line(),
                    scaled_severity(count - threshold, 20, 10),
                    "too-many-helpers",
                    "Class '" + usage.name + "' uses " + std::to_string(count) +
                    " helper function calls (threshold: " + std::to_string(threshold) + ")",
                    "Class '" + usage.name + "' uses " + std::to_string(count) + " helper function calls: " + listed +
                    ". Excessive helper use hides dependencies and makes unit testing difficult; inject the "
                    "underlying services through the constructor.",
                    {},
                    {{"class", usage.name}, {"helpers", helpers}, {"count", count}, {"threshold", threshold}});
            }

            const HelperFunctionAbuseAnalyzer& analyzer_;
            FileContext& context_;
            std::vector<HelperUsage> types_;
        };

    }  // namespace

    HelperFunctionAbuseAnalyzer::HelperFunctionAbuseAnalyzer()
        : helpers_{
              "app", "auth", "cache", "config", "cookie", "event", "logger", "old",
              "redirect", "request", "response", "route", "session", "storage_path",
              "url", "view", "abort", "abort_if", "abort_unless", "bcrypt",
              "collect", "dd", "dispatch", "info", "now", "optional", "policy",
              "resolve", "retry", "tap", "throw_if", "throw_unless", "today",
              "validator", "value", "report"} {}

    Result<void, Error> HelperFunctionAbuseAnalyzer::configure(const AnalyzerSettings& settings) {
        auto threshold = settings.get_count("threshold", DEFAULT_THRESHOLD);
        if (threshold.is_err()) {
            return Result<void, Error>::failure(threshold.error());
        }
        auto helpers = settings.get_strings("helper_functions", helpers_);
        if (helpers.is_err()) {
            return Result<void, Error>::failure(helpers.error());
        }

        threshold_ = threshold.value();
        if (!helpers.value().empty()) {
            helpers_ = std::move(helpers).value();
        }
        return Result<void, Error>::success();
    }

    bool HelperFunctionAbuseAnalyzer::is_helper(const std::string_view function) const {
        return std::ranges::find(helpers_, function) != helpers_.end();
    }

    std::unique_ptr<scope::FileVisitor> HelperFunctionAbuseAnalyzer::create_visitor(FileContext& context) const {
        return std::make_unique<HelperFunctionVisitor>(*this, context);
    }

    void register_helper_function_abuse_analyzer() {
        AnalyzerRegistry::instance().register_analyzer([] {
            return std::make_unique<HelperFunctionAbuseAnalyzer>();
        });
    }

}  // namespace lpa::analyzers
