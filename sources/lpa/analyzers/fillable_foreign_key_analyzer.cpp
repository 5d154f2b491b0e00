//
// Created by gregorian-rayne on 1/16/26.
//

#include "lpa/analyzers/fillable_foreign_key_analyzer.hpp"

#include "lpa/syntax/php_nodes.hpp"
#include "lpa/utils/string_utils.hpp"

#include <array>
#include <utility>

namespace lpa::analyzers
{
    namespace {

        using syntax::SyntaxNode;

        // Columns that tie a record to the acting user.
        constexpr std::array<std::pair<std::string_view, std::string_view>, 5> OWNERSHIP_KEYS = {{
            {"user_id", "user ownership"},
            {"author_id", "author relationship"},
            {"owner_id", "owner relationship"},
            {"creator_id", "creator relationship"},
            {"parent_id", "hierarchical relationship"},
        }};

        std::string_view ownership_of(const std::string_view field) noexcept {
            for (const auto& [key, relationship] : OWNERSHIP_KEYS) {
                if (key == field) {
                    return relationship;
                }
            }
            return {};
        }

        class FillableForeignKeyVisitor final : public scope::FileVisitor {
        public:
            explicit FillableForeignKeyVisitor(FileContext& context)
                : context_(context) {}

            void enter(const SyntaxNode& node) override {
                if (!syntax::is_class_declaration(node)) {
                    return;
                }
                if (string_utils::basename(syntax::base_class_name(node)) != "Model" &&
                    !context_.scopes().in_model_class()) {
                    return;
                }

                const std::string model(syntax::declaration_name(node));
                for (const auto& property : syntax::class_properties(node)) {
                    if (property.name != "$fillable" || !property.value.is("array_creation_expression")) {
                        continue;
                    }
                    for (const auto& [field, element] : syntax::array_string_values(property.value)) {
                        if (string_utils::ends_with(field, "_id")) {
                            report(model, field, element);
                        }
                    }
                }
            }

        private:
            void report(const std::string& model, const std::string& field, const SyntaxNode& element) {
                const auto relationship = ownership_of(field);
                if (!relationship.empty()) {
                    context_.report(
                        FillableForeignKeyAnalyzer::ID, element, Severity::Critical,
                        "fillable-ownership-key",
                        "Critical: \"" + field + "\" (" + std::string(relationship) + ") is fillable in model \"" +
                        model + "\" - this allows users to impersonate others",
                        "Remove \"" + field + "\" from $fillable and set it manually: $model->" + field +
                        " = auth()->id();",
                        {{"model", model}, {"field", field}, {"relationship", std::string(relationship)}});
                    return;
                }

                context_.report(
                    FillableForeignKeyAnalyzer::ID, element, Severity::High,
                    "fillable-foreign-key",
                    "Potential foreign key \"" + field + "\" is fillable in model \"" + model + "\"",
                    "Remove \"" + field + "\" from $fillable or validate that users should be able to set this "
                    "relationship. Consider using $guarded or manual assignment for foreign keys",
                    {{"model", model}, {"field", field}});
            }

            FileContext& context_;
        };

    }  // namespace

    std::unique_ptr<scope::FileVisitor> FillableForeignKeyAnalyzer::create_visitor(FileContext& context) const {
        return std::make_unique<FillableForeignKeyVisitor>(context);
    }

    void register_fillable_foreign_key_analyzer() {
        AnalyzerRegistry::instance().register_analyzer([] {
            return std::make_unique<FillableForeignKeyAnalyzer>();
        });
    }

}  // namespace lpa::analyzers
