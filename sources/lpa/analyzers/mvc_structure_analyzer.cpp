//
// Created by gregorian-rayne on 1/15/26.
//

#include "lpa/analyzers/mvc_structure_analyzer.hpp"

#include "lpa/scope/vocabulary.hpp"
#include "lpa/syntax/php_nodes.hpp"
#include "lpa/utils/path_utils.hpp"
#include "lpa/utils/string_utils.hpp"

#include <array>
#include <sstream>
#include <string>
#include <vector>

namespace lpa::analyzers
{
    namespace {

        constexpr std::array<std::string_view, 5> RENDERING_METHODS = {
            "render", "toHtml", "toView", "renderView", "display",
        };

        bool calls_view_helper(const syntax::SyntaxNode& method) {
            std::vector<syntax::SyntaxNode> pending;
            if (auto body = syntax::declaration_body(method)) {
                pending.push_back(body);
            }
            while (!pending.empty()) {
                const auto node = pending.back();
                pending.pop_back();
                if (syntax::is_function_call(node) && syntax::call_name(node) == "view") {
                    return true;
                }
                for (const auto& child : node.named_children()) {
                    pending.push_back(child);
                }
            }
            return false;
        }

        class MvcVisitor final : public scope::FileVisitor {
        public:
            MvcVisitor(const MvcStructureAnalyzer& analyzer, FileContext& context)
                : analyzer_(analyzer), context_(context) {}

            void enter(const syntax::SyntaxNode& node) override {
                if (!syntax::is_class_declaration(node)) {
                    return;
                }

                const std::string class_name(syntax::declaration_name(node));
                if (context_.scopes().in_model_class()) {
                    check_model(node, class_name);
                } else if (is_controller(class_name)) {
                    check_controller(node, class_name);
                }
            }

        private:
            [[nodiscard]] bool is_controller(const std::string_view class_name) const {
                return string_utils::ends_with(class_name, "Controller") ||
                       path_utils::has_directory(context_.relative_path(), "Controllers");
            }

            void check_model(const syntax::SyntaxNode& cls, const std::string& class_name) {
                for (const auto& member : syntax::declaration_body(cls).named_children()) {
                    if (!syntax::is_method(member)) {
                        continue;
                    }
                    const std::string method(syntax::declaration_name(member));

                    if (scope::vocabulary::contains(RENDERING_METHODS, method)) {
                        context_.report(
                            MvcStructureAnalyzer::ID, member, Severity::High,
                            "model-rendering-method",
                            "Model \"" + class_name + "\" has rendering method \"" + method + "()\" (MVC violation)",
                            "Models should not contain view rendering logic. Move this to a controller or view "
                            "composer. Models are for data and relationships only.",
                            {{"class", class_name}, {"method", method}});
                    }
                    if (calls_view_helper(member)) {
                        context_.report(
                            MvcStructureAnalyzer::ID, member, Severity::High,
                            "model-calls-view",
                            "Model \"" + class_name + "\" method \"" + method + "()\" calls view() helper (MVC violation)",
                            "Models should not render views. This belongs in controllers.",
                            {{"class", class_name}, {"method", method}});
                    }
                }
            }

            void check_controller(const syntax::SyntaxNode& cls, const std::string& class_name) {
                const auto max_lines = analyzer_.max_controller_method_lines();
                for (const auto& member : syntax::declaration_body(cls).named_children()) {
                    if (!syntax::is_method(member)) {
                        continue;
                    }
                    const std::size_t lines = member.end_line() - member.start_line();
                    if (lines <= max_lines) {
                        continue;
                    }

                    const std::string method(syntax::declaration_name(member));
                    std::ostringstream message;
                    message << "Controller method \"" << class_name << "::" << method << "()\" has " << lines
                            << " lines (max: " << max_lines << "). Large methods indicate business logic in controller";

                    context_.report(
                        MvcStructureAnalyzer::ID, member, Severity::High,
                        "fat-controller-method",
                        message.str(),
                        "Keep controller actions thin: validate, delegate to a service or action class, and return "
                        "a response.",
                        {{"class", class_name}, {"method", method}, {"lines", lines}, {"max_lines", max_lines}});
                }
            }

            const MvcStructureAnalyzer& analyzer_;
            FileContext& context_;
        };

    }  // namespace

    Result<void, Error> MvcStructureAnalyzer::configure(const AnalyzerSettings& settings) {
        auto lines = settings.get_count("max_controller_method_lines", DEFAULT_MAX_CONTROLLER_METHOD_LINES, 1);
        if (lines.is_err()) {
            return Result<void, Error>::failure(lines.error());
        }
        max_controller_method_lines_ = lines.value();
        return Result<void, Error>::success();
    }

    std::unique_ptr<scope::FileVisitor> MvcStructureAnalyzer::create_visitor(FileContext& context) const {
        return std::make_unique<MvcVisitor>(*this, context);
    }

    void register_mvc_structure_analyzer() {
        AnalyzerRegistry::instance().register_analyzer([] {
            return std::make_unique<MvcStructureAnalyzer>();
        });
    }

}  // namespace lpa::analyzers
