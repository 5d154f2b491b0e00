//
// Created by gregorian-rayne on 1/15/26.
//

#include "lpa/analyzers/generic_exception_catch_analyzer.hpp"

#include <string>
#include <vector>

namespace lpa::analyzers
{
    namespace {

        class GenericCatchVisitor final : public scope::FileVisitor {
        public:
            explicit GenericCatchVisitor(FileContext& context)
                : context_(context) {}

            void enter(const syntax::SyntaxNode& node) override {
                if (!node.is("catch_clause")) {
                    return;
                }
                for (const auto type : caught_types(node)) {
                    if (type != "Exception" && type != "Throwable") {
                        continue;
                    }
                    const std::string name(type);
                    context_.report(
                        GenericExceptionCatchAnalyzer::ID, node, Severity::Low,
                        "generic-exception-catch",
                        "Catching generic " + name + " instead of specific exception type",
                        "Catch specific exception types (e.g., ModelNotFoundException, ValidationException) "
                        "for better error handling and to avoid catching unexpected errors",
                        {{"type", name}});
                }
            }

        private:
            FileContext& context_;
        };

    }  // namespace

    std::vector<std::string_view> caught_types(const syntax::SyntaxNode& clause) {
        std::vector<std::string_view> types;

        std::vector<syntax::SyntaxNode> pending;
        if (auto type = clause.child_by_field("type")) {
            pending.push_back(type);
        } else {
            for (const auto& child : clause.named_children()) {
                if (child.is("type_list") || child.is("named_type")) {
                    pending.push_back(child);
                }
            }
        }

        while (!pending.empty()) {
            const auto node = pending.back();
            pending.pop_back();

            if (node.is("name") || node.is("qualified_name")) {
                auto text = node.text();
                if (!text.empty() && text.front() == '\\') {
                    text.remove_prefix(1);
                }
                types.push_back(text);
                continue;
            }
            for (const auto& child : node.named_children()) {
                pending.push_back(child);
            }
        }
        return types;
    }

    std::unique_ptr<scope::FileVisitor> GenericExceptionCatchAnalyzer::create_visitor(FileContext& context) const {
        return std::make_unique<GenericCatchVisitor>(context);
    }

    void register_generic_exception_catch_analyzer() {
        AnalyzerRegistry::instance().register_analyzer([] {
            return std::make_unique<GenericExceptionCatchAnalyzer>();
        });
    }

}  // namespace lpa::analyzers
