//
// Created by gregorian-rayne on 1/14/26.
//

#include "lpa/models/model_registry.hpp"
#include "lpa/models/pluralizer.hpp"
#include "lpa/syntax/name_resolver.hpp"
#include "lpa/syntax/php_nodes.hpp"
#include "lpa/syntax/syntax_tree.hpp"
#include "lpa/utils/file_utils.hpp"
#include "lpa/utils/logging.hpp"
#include "lpa/utils/string_utils.hpp"

#include <algorithm>
#include <ranges>

namespace lpa::models {

    namespace {
        using syntax::SyntaxNode;

        /**
         * Folds a constant string expression ('a' or 'a' . 'b').
         */
        std::optional<std::string> fold_string(const SyntaxNode& node) {
            const auto expr = syntax::unwrap_parentheses(node);
            if (auto literal = syntax::string_literal(expr)) {
                return literal;
            }
            if (expr.is("binary_expression") && syntax::operator_of(expr) == ".") {
                auto left = fold_string(expr.child_by_field("left"));
                auto right = fold_string(expr.child_by_field("right"));
                if (left && right) {
                    return *left + *right;
                }
            }
            return std::nullopt;
        }

        TableDeclaration declaration_from_value(const SyntaxNode& value) {
            if (value.is_null()) {
                return {};
            }
            if (auto folded = fold_string(value)) {
                return {DeclarationKind::Literal, std::move(*folded)};
            }
            return {DeclarationKind::Dynamic, std::string(value.text())};
        }

        void collect_returns(const SyntaxNode& node, std::vector<SyntaxNode>& out) {
            for (const auto& child : node.named_children()) {
                if (syntax::is_closure(child) || syntax::is_anonymous_class(child) || syntax::is_function(child)) {
                    continue;
                }
                if (child.is("return_statement")) {
                    out.push_back(child);
                }
                collect_returns(child, out);
            }
        }

        /**
         * A getTable() body is literal only if its single return sits at the
         * top level of the method and returns a constant string.
         */
        TableDeclaration table_method_declaration(const SyntaxNode& method) {
            const auto body = syntax::declaration_body(method);
            if (body.is_null()) {
                return {};
            }

            std::vector<SyntaxNode> returns;
            collect_returns(body, returns);

            if (returns.size() == 1 && returns.front().parent() == body) {
                const auto value = returns.front().named_child(0);
                if (auto folded = fold_string(value)) {
                    return {DeclarationKind::Literal, std::move(*folded)};
                }
            }
            return {DeclarationKind::Dynamic, std::string(method.text())};
        }

        ClassRecord record_class(const SyntaxNode& class_node, const syntax::NameResolver& names, const fs::path& file) {
            ClassRecord record;
            record.name = names.qualify_declaration(syntax::declaration_name(class_node));
            record.file = file;

            if (const auto base = syntax::base_class_name(class_node); !base.empty()) {
                record.parent = names.resolve(base);
            }

            for (const auto& property : syntax::class_properties(class_node)) {
                if (property.name == "$table") {
                    record.table_property = declaration_from_value(property.value);
                }
            }
            const auto body = syntax::declaration_body(class_node);
            for (const auto& member : body.named_children()) {
                if (syntax::is_method(member) &&
                    string_utils::iequals(syntax::declaration_name(member), "getTable")) {
                    record.table_method = table_method_declaration(member);
                }
            }

            return record;
        }

        void collect_classes(const SyntaxNode& node, syntax::NameResolver& names,
                             const fs::path& file, std::vector<ClassRecord>& out) {
            for (const auto& child : node.named_children()) {
                if (child.is("namespace_definition")) {
                    names.set_namespace(child.child_by_field("name").text());
                    if (const auto body = child.child_by_field("body")) {
                        collect_classes(body, names, file, out);
                    }
                } else if (child.is("namespace_use_declaration")) {
                    names.collect_use_declaration(child);
                } else if (syntax::is_class_declaration(child)) {
                    out.push_back(record_class(child, names, file));
                } else if (child.is("compound_statement") || child.is("declaration_list")) {
                    collect_classes(child, names, file, out);
                }
            }
        }

        const ClassRecord* find_record(const std::unordered_map<std::string, const ClassRecord*>& by_name,
                                       const std::string& name) {
            const auto it = by_name.find(name);
            return it == by_name.end() ? nullptr : it->second;
        }
    }

    std::vector<ClassRecord> collect_class_records(const syntax::SyntaxTree& tree, const fs::path& file) {
        syntax::NameResolver names;
        std::vector<ClassRecord> found;
        collect_classes(tree.root(), names, file, found);
        return found;
    }

    // ============================================================================
    // ModelRegistry
    // ============================================================================

    const std::vector<std::string>& ModelRegistry::default_base_classes() {
        static const std::vector<std::string> bases = {
            "Illuminate\\Database\\Eloquent\\Model",
            "Illuminate\\Foundation\\Auth\\User",
            "Illuminate\\Database\\Eloquent\\Relations\\Pivot",
            "Illuminate\\Database\\Eloquent\\Relations\\MorphPivot",
        };
        return bases;
    }

    ModelRegistry::ModelRegistry() {
        orm_bases_.insert(default_base_classes().begin(), default_base_classes().end());
    }

    Result<std::string, Error> ModelRegistry::resolve_table(const std::string_view class_name) const {
        const auto it = models_.find(std::string(class_name));
        if (it == models_.end()) {
            return Result<std::string, Error>::failure(
                Error::not_found("Class is not a known model", std::string(class_name))
            );
        }
        if (it->second.table.empty()) {
            return Result<std::string, Error>::failure(
                Error::not_found("Model table is not statically resolvable", std::string(class_name))
            );
        }
        return Result<std::string, Error>::success(it->second.table);
    }

    bool ModelRegistry::is_model(const std::string_view class_name) const {
        return models_.contains(std::string(class_name));
    }

    bool ModelRegistry::knows_class(const std::string_view class_name) const {
        return parents_.contains(std::string(class_name));
    }

    bool ModelRegistry::is_orm_base(const std::string_view class_name) const {
        if (orm_bases_.contains(std::string(class_name))) {
            return true;
        }
        // `extends Model` without a resolvable import.
        return string_utils::basename(class_name) == "Model" && !knows_class(class_name);
    }

    std::optional<std::string> ModelRegistry::parent_of(const std::string_view class_name) const {
        const auto it = parents_.find(std::string(class_name));
        if (it == parents_.end() || it->second.empty()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool ModelRegistry::has_model_for_table(const std::string_view table) const {
        return tables_.contains(std::string(table));
    }

    std::vector<ModelEntry> ModelRegistry::entries() const {
        std::vector<ModelEntry> result;
        result.reserve(models_.size());
        for (const auto& entry : models_ | std::views::values) {
            result.push_back(entry);
        }
        std::ranges::sort(result, {}, &ModelEntry::class_name);
        return result;
    }

    void ModelRegistry::clear() {
        parents_.clear();
        models_.clear();
        tables_.clear();
    }

    // ============================================================================
    // RegistryBuilder
    // ============================================================================

    RegistryBuilder::RegistryBuilder(RegistryOptions options)
        : options_(std::move(options)) {}

    Result<std::size_t, Error> RegistryBuilder::add_source(const fs::path& file, std::string source) {
        auto tree = syntax::SyntaxTree::parse(std::move(source));
        if (tree.is_err()) {
            return Result<std::size_t, Error>::failure(tree.error());
        }

        auto found = collect_class_records(tree.value(), file);

        const std::size_t count = found.size();
        for (auto& record : found) {
            add_record(std::move(record));
        }
        return Result<std::size_t, Error>::success(count);
    }

    std::size_t RegistryBuilder::scan_directory(const fs::path& directory) {
        std::error_code ec;
        if (!fs::is_directory(directory, ec)) {
            logging::get()->debug("Model directory {} does not exist", directory.string());
            return 0;
        }

        std::vector<fs::path> files;
        for (auto it = fs::recursive_directory_iterator(directory, fs::directory_options::skip_permission_denied, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_regular_file(ec) && file_utils::is_php_source(it->path())) {
                files.push_back(it->path());
            }
        }
        if (ec) {
            logging::get()->warn("Stopped scanning {}: {}", directory.string(), ec.message());
        }
        std::ranges::sort(files);

        std::size_t parsed = 0;
        for (const auto& file : files) {
            auto content = file_utils::read_file(file);
            if (content.is_err()) {
                logging::get()->debug("Skipping model file {}: {}", file.string(), content.error().to_string());
                continue;
            }
            if (auto added = add_source(file, std::move(content.value())); added.is_err()) {
                logging::get()->debug("Skipping unparseable model file {}: {}", file.string(), added.error().to_string());
                continue;
            }
            ++parsed;
        }
        return parsed;
    }

    void RegistryBuilder::add_record(ClassRecord record) {
        records_.push_back(std::move(record));
    }

    ModelRegistry RegistryBuilder::build() const {
        ModelRegistry registry;
        registry.orm_bases_.insert(options_.base_classes.begin(), options_.base_classes.end());

        std::unordered_map<std::string, const ClassRecord*> by_name;
        for (const auto& record : records_) {
            by_name.emplace(record.name, &record);
            registry.parents_[record.name] = record.parent;
        }

        // Walks the parent graph. A revisited class means a cycle, which
        // leaves the class unresolved.
        const auto reaches_orm_base = [&](const ClassRecord& record) {
            std::unordered_set<std::string> visited{record.name};
            std::string current = record.parent;

            while (!current.empty()) {
                if (registry.is_orm_base(current)) {
                    return true;
                }
                if (!visited.insert(current).second) {
                    return false;
                }
                const auto* next = find_record(by_name, current);
                if (next == nullptr) {
                    return false;
                }
                current = next->parent;
            }
            return false;
        };

        const auto mapped_table = [&](const std::string& name) -> std::optional<std::string> {
            if (const auto it = options_.table_mappings.find(name); it != options_.table_mappings.end()) {
                return it->second;
            }
            const auto short_name = std::string(string_utils::basename(name));
            if (const auto it = options_.table_mappings.find(short_name); it != options_.table_mappings.end()) {
                return it->second;
            }
            return std::nullopt;
        };

        // Returns nullopt for a dynamic declaration without literal fallback.
        const auto resolve_table = [&](const ClassRecord& record) -> std::optional<std::string> {
            if (auto mapped = mapped_table(record.name)) {
                return mapped;
            }

            std::unordered_set<std::string> visited;
            const ClassRecord* current = &record;

            while (current != nullptr && visited.insert(current->name).second) {
                if (current->table_method.kind == DeclarationKind::Literal) {
                    return current->table_method.value;
                }
                if (current->table_property.kind == DeclarationKind::Literal) {
                    return current->table_property.value;
                }
                if (current->table_method.kind == DeclarationKind::Dynamic ||
                    current->table_property.kind == DeclarationKind::Dynamic) {
                    return std::nullopt;
                }
                current = registry.is_orm_base(current->parent) ? nullptr : find_record(by_name, current->parent);
            }

            return table_name_for_class(record.name);
        };

        for (const auto& record : records_) {
            if (!reaches_orm_base(record)) {
                continue;
            }

            ModelEntry entry;
            entry.class_name = record.name;
            entry.parent = record.parent;
            entry.file = record.file;

            if (auto table = resolve_table(record)) {
                entry.table = std::move(*table);
                registry.tables_.insert(entry.table);
            } else {
                logging::get()->debug("Model {} has a dynamic table name; excluded from table matching", record.name);
            }

            registry.models_[record.name] = std::move(entry);
        }

        logging::get()->info("Model registry: {} classes scanned, {} models resolved",
                             records_.size(), registry.models_.size());
        return registry;
    }

}  // namespace lpa::models
