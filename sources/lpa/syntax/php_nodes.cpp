//
// Created by gregorian-rayne on 1/13/26.
//

#include "lpa/syntax/php_nodes.hpp"

#include <algorithm>
#include <array>

namespace lpa::syntax {

    namespace {
        constexpr std::array<std::string_view, 4> LITERAL_STRING_PARTS = {
            "string_content", "string_value", "string", "escape_sequence"
        };

        bool is_literal_part(const std::string_view kind) noexcept {
            return std::ranges::find(LITERAL_STRING_PARTS, kind) != LITERAL_STRING_PARTS.end();
        }

        std::string unescape(const std::string_view body, const char quote) {
            std::string result;
            result.reserve(body.size());

            for (std::size_t i = 0; i < body.size(); ++i) {
                const char c = body[i];
                if (c != '\\' || i + 1 >= body.size()) {
                    result += c;
                    continue;
                }

                const char next = body[i + 1];
                if (quote == '\'') {
                    if (next == '\'' || next == '\\') {
                        result += next;
                        ++i;
                    } else {
                        result += c;
                    }
                    continue;
                }

                switch (next) {
                    case 'n':  result += '\n'; ++i; break;
                    case 't':  result += '\t'; ++i; break;
                    case 'r':  result += '\r'; ++i; break;
                    case '"':
                    case '\\':
                    case '$':  result += next; ++i; break;
                    default:   result += c; break;
                }
            }

            return result;
        }

        bool contains_kind(const SyntaxNode& node, const std::string_view kind) {
            if (node.is(kind)) {
                return true;
            }
            for (const auto& child : node.named_children()) {
                if (contains_kind(child, kind)) {
                    return true;
                }
            }
            return false;
        }

        SyntaxNode first_named_child_of_kind(const SyntaxNode& node, const std::string_view kind) {
            const std::size_t count = node.named_child_count();
            for (std::size_t i = 0; i < count; ++i) {
                if (auto child = node.named_child(i); child.is(kind)) {
                    return child;
                }
            }
            return {};
        }

        std::string_view strip_column_selection(std::string_view path) noexcept {
            if (const auto colon = path.find(':'); colon != std::string_view::npos) {
                path = path.substr(0, colon);
            }
            return path;
        }
    }

    // ============================================================================
    // Node classification
    // ============================================================================

    bool is_class_declaration(const SyntaxNode& node) noexcept {
        return node.is("class_declaration");
    }

    bool is_anonymous_class(const SyntaxNode& node) noexcept {
        if (node.is("anonymous_class")) {
            return true;
        }
        if (!node.is("object_creation_expression")) {
            return false;
        }
        const std::size_t count = node.named_child_count();
        for (std::size_t i = 0; i < count; ++i) {
            if (node.named_child(i).is("declaration_list")) {
                return true;
            }
        }
        return false;
    }

    bool is_method(const SyntaxNode& node) noexcept {
        return node.is("method_declaration");
    }

    bool is_function(const SyntaxNode& node) noexcept {
        return node.is("function_definition");
    }

    bool is_closure(const SyntaxNode& node) noexcept {
        const auto kind = node.kind();
        return kind == "anonymous_function" ||
               kind == "anonymous_function_creation_expression" ||
               kind == "arrow_function";
    }

    bool is_member_call(const SyntaxNode& node) noexcept {
        const auto kind = node.kind();
        return kind == "member_call_expression" || kind == "nullsafe_member_call_expression";
    }

    bool is_static_call(const SyntaxNode& node) noexcept {
        return node.is("scoped_call_expression");
    }

    bool is_function_call(const SyntaxNode& node) noexcept {
        return node.is("function_call_expression");
    }

    bool is_call(const SyntaxNode& node) noexcept {
        return is_member_call(node) || is_static_call(node) || is_function_call(node);
    }

    bool is_property_access(const SyntaxNode& node) noexcept {
        const auto kind = node.kind();
        return kind == "member_access_expression" || kind == "nullsafe_member_access_expression";
    }

    bool is_loop(const SyntaxNode& node) noexcept {
        const auto kind = node.kind();
        return kind == "foreach_statement" || kind == "for_statement" ||
               kind == "while_statement" || kind == "do_statement";
    }

    bool is_string(const SyntaxNode& node) noexcept {
        const auto kind = node.kind();
        return kind == "string" || kind == "encapsed_string";
    }

    // ============================================================================
    // Calls and arguments
    // ============================================================================

    std::string_view call_name(const SyntaxNode& call) noexcept {
        if (is_member_call(call) || is_static_call(call)) {
            return call.child_by_field("name").text();
        }
        if (is_function_call(call)) {
            auto name = call.child_by_field("function").text();
            if (!name.empty() && name.front() == '\\') {
                name.remove_prefix(1);
            }
            return name;
        }
        return {};
    }

    SyntaxNode call_arguments(const SyntaxNode& call) noexcept {
        if (auto args = call.child_by_field("arguments")) {
            return args;
        }
        return first_named_child_of_kind(call, "arguments");
    }

    std::vector<SyntaxNode> argument_values(const SyntaxNode& call) {
        std::vector<SyntaxNode> values;
        const auto args = call_arguments(call);

        for (const auto& arg : args.named_children()) {
            if (!arg.is("argument")) {
                continue;
            }
            // Named arguments carry the name first; the value is always last.
            const std::size_t count = arg.named_child_count();
            if (count > 0) {
                values.push_back(arg.named_child(count - 1));
            }
        }

        return values;
    }

    SyntaxNode first_argument(const SyntaxNode& call) {
        const auto values = argument_values(call);
        return values.empty() ? SyntaxNode{} : values.front();
    }

    // ============================================================================
    // Literals
    // ============================================================================

    std::optional<std::string> string_literal(const SyntaxNode& node) {
        if (!is_string(node)) {
            return std::nullopt;
        }

        for (const auto& child : node.named_children()) {
            if (!is_literal_part(child.kind())) {
                return std::nullopt;
            }
        }

        auto text = node.text();
        if (!text.empty() && (text.front() == 'b' || text.front() == 'B')) {
            text.remove_prefix(1);
        }
        if (text.size() < 2) {
            return std::nullopt;
        }

        const char quote = text.front();
        if ((quote != '\'' && quote != '"') || text.back() != quote) {
            return std::nullopt;
        }

        return unescape(text.substr(1, text.size() - 2), quote);
    }

    bool is_dynamic_string(const SyntaxNode& node) {
        const auto expr = unwrap_parentheses(node);

        if (is_string(expr)) {
            return !string_literal(expr).has_value();
        }

        if (expr.is("heredoc")) {
            return contains_kind(expr, "variable_name");
        }

        if (expr.is("binary_expression") && operator_of(expr) == ".") {
            const auto left = unwrap_parentheses(expr.child_by_field("left"));
            const auto right = unwrap_parentheses(expr.child_by_field("right"));
            const auto is_constant = [](const SyntaxNode& part) {
                return string_literal(part).has_value() ||
                       part.is("integer") || part.is("float") ||
                       (part.is("binary_expression") && !is_dynamic_string(part));
            };
            return !is_constant(left) || !is_constant(right);
        }

        if (is_function_call(expr)) {
            const auto name = call_name(expr);
            if (name == "sprintf" || name == "vsprintf") {
                const auto values = argument_values(expr);
                return std::ranges::any_of(values.begin() + (values.empty() ? 0 : 1), values.end(),
                                           [](const SyntaxNode& v) { return !string_literal(v).has_value(); });
            }
        }

        return false;
    }

    std::string_view operator_of(const SyntaxNode& node) noexcept {
        if (auto op = node.child_by_field("operator")) {
            return op.text();
        }
        const std::size_t count = node.child_count();
        for (std::size_t i = 0; i < count; ++i) {
            if (auto child = node.child(i); !child.is_named()) {
                return child.text();
            }
        }
        return {};
    }

    SyntaxNode unwrap_parentheses(SyntaxNode node) noexcept {
        while (node.is("parenthesized_expression") && node.named_child_count() == 1) {
            node = node.named_child(0);
        }
        return node;
    }

    // ============================================================================
    // Chains
    // ============================================================================

    bool CallChain::contains(const std::string_view name) const noexcept {
        return find(name) != nullptr;
    }

    const ChainLink* CallChain::find(const std::string_view name) const noexcept {
        const auto it = std::ranges::find_if(links, [name](const ChainLink& link) {
            return link.name == name;
        });
        return it == links.end() ? nullptr : &*it;
    }

    std::string_view CallChain::last() const noexcept {
        return links.empty() ? std::string_view{} : links.back().name;
    }

    CallChain decompose_chain(const SyntaxNode& expr) {
        CallChain chain;
        SyntaxNode current = unwrap_parentheses(expr);

        while (!current.is_null()) {
            if (is_member_call(current)) {
                chain.links.push_back({call_name(current), current});
                current = unwrap_parentheses(current.child_by_field("object"));
                continue;
            }

            if (is_static_call(current)) {
                chain.links.push_back({call_name(current), current});
                const auto scope = current.child_by_field("scope");
                const auto kind = scope.kind();
                chain.root_kind = (kind == "name" || kind == "qualified_name" || kind == "relative_scope")
                    ? ChainRoot::StaticClass
                    : ChainRoot::Other;
                chain.root = scope.text();
                chain.root_node = scope;
                break;
            }

            chain.root_node = current;
            if (current.is("variable_name")) {
                chain.root_kind = ChainRoot::Variable;
                chain.root = current.text();
            } else if (is_function_call(current)) {
                chain.root_kind = ChainRoot::Function;
                chain.root = call_name(current);
            } else if (current.is("object_creation_expression") && !is_anonymous_class(current)) {
                chain.root_kind = ChainRoot::New;
                for (const auto& child : current.named_children()) {
                    if (child.is("name") || child.is("qualified_name")) {
                        chain.root = child.text();
                        break;
                    }
                }
            } else if (is_property_access(current)) {
                chain.root_kind = ChainRoot::Property;
                chain.root = current.text();
            } else {
                chain.root_kind = ChainRoot::Other;
            }
            break;
        }

        std::ranges::reverse(chain.links);
        return chain;
    }

    std::optional<PropertyChain> property_chain(const SyntaxNode& access) {
        PropertyChain chain;
        SyntaxNode current = access;

        while (is_property_access(current)) {
            const auto name = current.child_by_field("name");
            if (!name.is("name")) {
                return std::nullopt;
            }
            chain.segments.push_back(name.text());
            current = unwrap_parentheses(current.child_by_field("object"));
        }

        if (!current.is("variable_name") || chain.segments.empty()) {
            return std::nullopt;
        }

        chain.variable = current.text();
        std::ranges::reverse(chain.segments);
        return chain;
    }

    std::vector<std::string> eager_load_paths(const SyntaxNode& call) {
        std::vector<std::string> paths;

        const auto add = [&paths](const SyntaxNode& node) {
            if (auto literal = string_literal(node)) {
                const auto path = strip_column_selection(*literal);
                if (!path.empty()) {
                    paths.emplace_back(path);
                }
            }
        };

        for (const auto& value : argument_values(call)) {
            if (!value.is("array_creation_expression")) {
                add(value);
                continue;
            }
            for (const auto& element : value.named_children()) {
                if (!element.is("array_element_initializer")) {
                    continue;
                }
                // Either 'relation' or 'relation' => fn ($q) => ...; the
                // first child is the relation name in both forms.
                add(element.named_child(0));
            }
        }

        return paths;
    }

    std::string_view declaration_name(const SyntaxNode& node) noexcept {
        return node.child_by_field("name").text();
    }

    SyntaxNode declaration_body(const SyntaxNode& node) noexcept {
        if (auto body = node.child_by_field("body")) {
            return body;
        }
        return first_named_child_of_kind(node, "declaration_list");
    }

    std::string_view base_class_name(const SyntaxNode& class_node) {
        const auto clause = first_named_child_of_kind(class_node, "base_clause");
        for (const auto& child : clause.named_children()) {
            if (child.is("name") || child.is("qualified_name")) {
                return child.text();
            }
        }
        return {};
    }

    std::string_view method_visibility(const SyntaxNode& method) {
        if (auto modifier = first_named_child_of_kind(method, "visibility_modifier")) {
            return modifier.text();
        }
        return "public";
    }

    bool is_static_method(const SyntaxNode& method) noexcept {
        if (first_named_child_of_kind(method, "static_modifier")) {
            return true;
        }
        const std::size_t count = method.child_count();
        for (std::size_t i = 0; i < count; ++i) {
            if (auto child = method.child(i); !child.is_named() && child.text() == "static") {
                return true;
            }
        }
        return false;
    }

    std::vector<PropertyDefault> class_properties(const SyntaxNode& class_node) {
        std::vector<PropertyDefault> properties;
        const auto body = declaration_body(class_node);
        for (const auto& member : body.named_children()) {
            if (!member.is("property_declaration")) {
                continue;
            }
            for (const auto& element : member.named_children()) {
                if (!element.is("property_element")) {
                    continue;
                }
                PropertyDefault property;
                property.element = element;
                const auto variable = element.child_by_field("name")
                    ? element.child_by_field("name")
                    : element.named_child(0);
                property.name = variable.text();

                if (auto value = element.child_by_field("default_value")) {
                    property.value = value;
                } else if (auto initializer = first_named_child_of_kind(element, "property_initializer")) {
                    property.value = initializer.named_child(0);
                } else if (element.named_child_count() == 2) {
                    property.value = element.named_child(1);
                }
                properties.push_back(property);
            }
        }
        return properties;
    }

    std::vector<std::pair<std::string, SyntaxNode>> array_string_values(const SyntaxNode& array) {
        std::vector<std::pair<std::string, SyntaxNode>> values;
        const auto node = unwrap_parentheses(array);
        if (!node.is("array_creation_expression")) {
            return values;
        }
        for (const auto& element : node.named_children()) {
            if (!element.is("array_element_initializer") || element.named_child_count() == 0) {
                continue;
            }
            const auto value = element.named_child(element.named_child_count() - 1);
            if (auto literal = string_literal(value)) {
                values.emplace_back(std::move(*literal), value);
            }
        }
        return values;
    }

}  // namespace lpa::syntax
