//
// Created by gregorian-rayne on 1/16/26.
//

#include "lpa/analyzers/environment_check_smell_analyzer.hpp"

#include "lpa/syntax/php_nodes.hpp"
#include "lpa/utils/string_utils.hpp"

namespace lpa::analyzers
{
    namespace {

        class EnvironmentCheckVisitor final : public scope::FileVisitor {
        public:
            explicit EnvironmentCheckVisitor(FileContext& context)
                : context_(context) {}

            void enter(const syntax::SyntaxNode& node) override {
                if (syntax::call_name(node) != "environment") {
                    return;
                }

                if (syntax::is_member_call(node)) {
                    const auto object = syntax::unwrap_parentheses(node.child_by_field("object"));
                    if (!syntax::is_function_call(object) || object.child_by_field("function").text() != "app") {
                        return;
                    }
                    context_.report(
                        EnvironmentCheckSmellAnalyzer::ID, node, Severity::Low,
                        "environment-check",
                        "Using app()->environment() for feature flags or behavior changes",
                        "Use config values instead of environment checks for feature flags. Store the decision in "
                        "config/features.php and read it with config('features.feature_name')",
                        {{"call", "app()->environment()"}});
                } else if (syntax::is_static_call(node) && node.child_by_field("scope").text() == "App") {
                    context_.report(
                        EnvironmentCheckSmellAnalyzer::ID, node, Severity::Low,
                        "environment-check",
                        "Using App::environment() for feature flags or behavior changes",
                        "Use config values instead of environment checks. Environment checks should be for "
                        "infrastructure concerns only (logging, debugging); use config('features.feature_name') "
                        "for behavior changes",
                        {{"call", "App::environment()"}});
                }
            }

        private:
            FileContext& context_;
        };

    }  // namespace

    bool EnvironmentCheckSmellAnalyzer::should_analyze(const std::string_view relative_path) const {
        return !string_utils::contains(relative_path, "ServiceProvider") &&
               !string_utils::contains(relative_path, "ExceptionHandler") &&
               !string_utils::ends_with(relative_path, "Exceptions/Handler.php");
    }

    std::unique_ptr<scope::FileVisitor> EnvironmentCheckSmellAnalyzer::create_visitor(FileContext& context) const {
        return std::make_unique<EnvironmentCheckVisitor>(context);
    }

    void register_environment_check_smell_analyzer() {
        AnalyzerRegistry::instance().register_analyzer([] {
            return std::make_unique<EnvironmentCheckSmellAnalyzer>();
        });
    }

}  // namespace lpa::analyzers
