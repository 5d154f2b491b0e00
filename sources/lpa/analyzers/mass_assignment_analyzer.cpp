//
// Created by gregorian-rayne on 1/16/26.
//

#include "lpa/analyzers/mass_assignment_analyzer.hpp"

#include "lpa/scope/vocabulary.hpp"
#include "lpa/syntax/php_nodes.hpp"
#include "lpa/utils/string_utils.hpp"

#include <array>

namespace lpa::analyzers
{
    namespace {

        namespace vocab = scope::vocabulary;
        using syntax::SyntaxNode;

        constexpr std::array<std::string_view, 9> MODEL_STATIC_METHODS = {
            "create", "forceCreate", "firstOrCreate", "updateOrCreate", "firstOrNew",
            "make", "insert", "upsert", "insertOrIgnore",
        };

        constexpr std::array<std::string_view, 3> MODEL_INSTANCE_METHODS = {"fill", "forceFill", "update"};

        constexpr std::array<std::string_view, 7> BUILDER_METHODS = {
            "update", "insert", "upsert", "insertOrIgnore", "insertUsing", "insertGetId", "updateOrInsert",
        };

        constexpr std::array<std::string_view, 7> REQUEST_DATA_METHODS = {
            "all", "input", "post", "get", "query", "except", "json",
        };

        // Called with a key these read one field.
        constexpr std::array<std::string_view, 4> KEYED_REQUEST_METHODS = {"input", "get", "post", "query"};

        constexpr auto RECOMMENDATION =
            "Use request()->only([...]) or request()->validated() to specify allowed fields explicitly";

        std::string_view plain_name(const SyntaxNode& node) noexcept {
            if (!node.is("name") && !node.is("qualified_name")) {
                return {};
            }
            auto text = node.text();
            if (!text.empty() && text.front() == '\\') {
                text.remove_prefix(1);
            }
            return text;
        }

        bool is_query_builder(const SyntaxNode& receiver) {
            const auto node = syntax::unwrap_parentheses(receiver);
            if (syntax::is_static_call(node)) {
                return string_utils::basename(plain_name(node.child_by_field("scope"))) == "DB";
            }
            if (syntax::is_member_call(node)) {
                const auto method = syntax::call_name(node);
                return method == "query" || method == "table";
            }
            return false;
        }

        class MassAssignmentVisitor final : public scope::FileVisitor {
        public:
            explicit MassAssignmentVisitor(FileContext& context)
                : context_(context) {}

            void enter(const SyntaxNode& node) override {
                if (syntax::is_class_declaration(node)) {
                    check_model(node);
                } else if (syntax::is_static_call(node)) {
                    const auto method = syntax::call_name(node);
                    if (vocab::contains(MODEL_STATIC_METHODS, method)) {
                        check_arguments(node, method, "static", "Static call to");
                    }
                } else if (syntax::is_member_call(node)) {
                    const auto method = syntax::call_name(node);
                    if (vocab::contains(BUILDER_METHODS, method) && is_query_builder(node.child_by_field("object"))) {
                        check_arguments(node, method, "builder", "Query builder call to");
                    } else if (vocab::contains(MODEL_INSTANCE_METHODS, method)) {
                        check_arguments(node, method, "instance", "Instance call to");
                    }
                }
            }

        private:
            bool is_model(const SyntaxNode& class_node) const {
                if (string_utils::basename(syntax::base_class_name(class_node)) == "Model" ||
                    context_.scopes().in_model_class()) {
                    return true;
                }
                const auto* cls = context_.scopes().current_class();
                return cls != nullptr && string_utils::starts_with(cls->qualified_name, "App\\Models\\");
            }

            void check_model(const SyntaxNode& class_node) {
                if (!is_model(class_node)) {
                    return;
                }

                bool has_fillable = false;
                bool has_guarded = false;
                bool empty_guarded = false;
                for (const auto& property : syntax::class_properties(class_node)) {
                    if (property.name == "$fillable") {
                        has_fillable = true;
                    } else if (property.name == "$guarded") {
                        has_guarded = true;
                        empty_guarded = property.value.is("array_creation_expression") &&
                                        property.value.named_child_count() == 0;
                    }
                }

                const std::string model(syntax::declaration_name(class_node));
                const auto line = class_node.start_line();
                if (!has_fillable && !has_guarded) {
                    context_.report_at(
                        MassAssignmentAnalyzer::ID, line, line, Severity::High,
                        "missing-model-protection",
                        "Model '" + model + "' lacks mass assignment protection ($fillable or $guarded)",
                        "Add protected $fillable = [...] or protected $guarded = ['*'] to the model",
                        {},
                        {{"model", model}});
                }
                if (empty_guarded) {
                    context_.report_at(
                        MassAssignmentAnalyzer::ID, line, line, Severity::Critical,
                        "empty-guarded",
                        "Model '" + model + "' has $guarded = [] which allows mass assignment of all attributes",
                        "Either specify fillable attributes or use $guarded = ['*'] to protect all",
                        {},
                        {{"model", model}});
                }
            }

            void check_arguments(const SyntaxNode& call, const std::string_view method,
                                 const std::string_view call_type, const std::string_view label) {
                for (const auto& argument : syntax::argument_values(call)) {
                    if (!is_unfiltered_request_data(argument)) {
                        continue;
                    }
                    context_.report(
                        MassAssignmentAnalyzer::ID, call, Severity::Critical,
                        "request-data",
                        std::string(label) + " " + std::string(method) +
                        "() with unfiltered request data may result in mass assignment vulnerability",
                        RECOMMENDATION,
                        {{"method", std::string(method)}, {"call_type", std::string(call_type)}});
                    return;
                }
            }

            FileContext& context_;
        };

    }  // namespace

    bool is_unfiltered_request_data(const SyntaxNode& expr) {
        const auto node = syntax::unwrap_parentheses(expr);
        const auto method = syntax::call_name(node);
        if (!vocab::contains(REQUEST_DATA_METHODS, method)) {
            return false;
        }

        if (syntax::is_member_call(node)) {
            const auto object = syntax::unwrap_parentheses(node.child_by_field("object"));
            const bool on_request =
                (syntax::is_function_call(object) && plain_name(object.child_by_field("function")) == "request") ||
                (object.is("variable_name") && object.text() == "$request");
            if (!on_request) {
                return false;
            }
            return !vocab::contains(KEYED_REQUEST_METHODS, method) || syntax::argument_values(node).empty();
        }

        if (syntax::is_static_call(node)) {
            const auto scope = plain_name(node.child_by_field("scope"));
            return string_utils::contains(scope, "Request") || string_utils::basename(scope) == "Input";
        }
        return false;
    }

    std::unique_ptr<scope::FileVisitor> MassAssignmentAnalyzer::create_visitor(FileContext& context) const {
        return std::make_unique<MassAssignmentVisitor>(context);
    }

    void register_mass_assignment_analyzer() {
        AnalyzerRegistry::instance().register_analyzer([] {
            return std::make_unique<MassAssignmentAnalyzer>();
        });
    }

}  // namespace lpa::analyzers
