//
// Created by gregorian-rayne on 1/16/26.
//

#include "lpa/analyzers/unguarded_models_analyzer.hpp"

#include "lpa/scope/vocabulary.hpp"
#include "lpa/syntax/php_nodes.hpp"
#include "lpa/utils/path_utils.hpp"
#include "lpa/utils/string_utils.hpp"

#include <algorithm>
#include <array>

namespace lpa::analyzers
{
    namespace {

        using syntax::SyntaxNode;

        constexpr std::array<std::string_view, 4> ELOQUENT_CLASSES = {
            "model",
            "eloquent",
            "illuminate\\database\\eloquent\\model",
            "illuminate\\database\\eloquent\\eloquent",
        };

        /// Receivers of unguard()/reguard() that address Eloquent. self::,
        /// static:: and parent:: count.
        bool is_eloquent_scope(const SyntaxNode& scope) {
            if (scope.is("relative_scope")) {
                return true;
            }
            auto name = scope.text();
            if (!name.empty() && name.front() == '\\') {
                name.remove_prefix(1);
            }
            return scope::vocabulary::contains(ELOQUENT_CLASSES, string_utils::to_lower(name));
        }

        class UnguardedModelsVisitor final : public scope::FileVisitor {
        public:
            explicit UnguardedModelsVisitor(FileContext& context)
                : context_(context) {}

            void enter(const SyntaxNode& node) override {
                if (!syntax::is_static_call(node)) {
                    return;
                }
                const auto method = syntax::call_name(node);
                if (method != "unguard" && method != "reguard") {
                    return;
                }
                if (!is_eloquent_scope(node.child_by_field("scope"))) {
                    return;
                }
                if (method == "unguard") {
                    unguards_.push_back(node);
                } else {
                    reguard_lines_.push_back(node.start_line());
                }
            }

            void finish() override {
                // Both lists are in source order.
                const auto severity = UnguardedModelsAnalyzer::severity_for_path(context_.relative_path());
                for (const auto& call : unguards_) {
                    const auto line = call.start_line();
                    const auto reguard = std::ranges::upper_bound(reguard_lines_, line);
                    if (reguard != reguard_lines_.end()) {
                        reguard_lines_.erase(reguard);
                        continue;
                    }

                    const std::string label(call.child_by_field("scope").text());
                    context_.report(
                        UnguardedModelsAnalyzer::ID, call, severity,
                        "unguard-without-reguard",
                        "Model mass assignment protection disabled without re-guarding (" + label + "::unguard())",
                        "Call Model::reguard() immediately after importing or use $fillable/forceFill() instead "
                        "of globally unguarding models",
                        {{"class", label}});
                }
            }

        private:
            FileContext& context_;
            std::vector<SyntaxNode> unguards_;
            std::vector<size_t> reguard_lines_;
        };

    }  // namespace

    bool UnguardedModelsAnalyzer::should_analyze(const std::string_view relative_path) const {
        return !path_utils::is_within_directory(relative_path, "vendor");
    }

    Severity UnguardedModelsAnalyzer::severity_for_path(const std::string_view relative_path) {
        const auto path = string_utils::to_lower(relative_path);
        const auto within = [&path](const std::string_view directory) {
            return path_utils::is_within_directory(path, directory);
        };

        if (within("http/controllers") || within("models") || within("services")) {
            return Severity::Critical;
        }
        if (within("database/seeders") || within("database/seeds")) {
            return Severity::Medium;
        }
        if (within("tests") || string_utils::ends_with(path, "test.php")) {
            return Severity::Low;
        }
        return Severity::High;
    }

    std::unique_ptr<scope::FileVisitor> UnguardedModelsAnalyzer::create_visitor(FileContext& context) const {
        return std::make_unique<UnguardedModelsVisitor>(context);
    }

    void register_unguarded_models_analyzer() {
        AnalyzerRegistry::instance().register_analyzer([] {
            return std::make_unique<UnguardedModelsAnalyzer>();
        });
    }

}  // namespace lpa::analyzers
