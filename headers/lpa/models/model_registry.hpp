//
// Created by gregorian-rayne on 1/14/26.
//

#ifndef LPA_MODEL_REGISTRY_HPP
#define LPA_MODEL_REGISTRY_HPP

/**
 * @file model_registry.hpp
 * @brief Map from model class to database table.
 *
 * The registry is built once per run from the configured model
 * directories, then shared read-only by every per-file analysis.
 *
 * A class is a model only if its inheritance chain reaches an ORM base
 * class. Its table is resolved with this precedence:
 * - an explicit table_mappings override
 * - a getTable() method that unconditionally returns a string literal
 * - a $table property with a string literal value
 * - the nearest ancestor's declaration, when the class declares neither
 * - the pluralized snake_case class name
 *
 * A class whose own declaration is dynamic (computed at runtime) and has
 * no literal fallback is a model without a table and is never matched
 * against table names.
 */

#include "lpa/result.hpp"
#include "lpa/error.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace lpa::syntax {
    class SyntaxTree;
}

namespace lpa::models {

    namespace fs = std::filesystem;

    /**
     * How a class declares its table.
     */
    enum class DeclarationKind {
        None,       ///< Not declared in this class
        Literal,    ///< A string literal
        Dynamic     ///< An expression that cannot be evaluated statically
    };

    struct TableDeclaration {
        DeclarationKind kind = DeclarationKind::None;
        std::string value;

        [[nodiscard]] bool declared() const noexcept { return kind != DeclarationKind::None; }
    };

    /**
     * Facts about one scanned class, as written in its own body.
     */
    struct ClassRecord {
        std::string name;               ///< Fully-qualified name
        std::string parent;             ///< Fully-qualified parent name, empty if none
        fs::path file;
        TableDeclaration table_property;
        TableDeclaration table_method;
    };

    struct ModelEntry {
        std::string class_name;
        std::string table;              ///< Empty when the table is dynamic
        std::string parent;
        fs::path file;
    };

    struct RegistryOptions {
        std::vector<std::string> base_classes;                  ///< Extra ORM base classes
        std::map<std::string, std::string> table_mappings;      ///< Class (FQN or short) -> table
    };

    /**
     * Extracts the class records of a parsed file.
     */
    [[nodiscard]] std::vector<ClassRecord> collect_class_records(const syntax::SyntaxTree& tree, const fs::path& file);

    /**
     * Resolved, read-only model registry.
     *
     * Safe for concurrent readers.
     */
    class ModelRegistry {
    public:
        ModelRegistry();

        /**
         * Returns the table a model class maps to.
         *
         * @return The table name, or NotFound when the class is not a model
         *         or its table cannot be determined statically.
         */
        [[nodiscard]] Result<std::string, Error> resolve_table(std::string_view class_name) const;

        /**
         * Checks whether a class descends from an ORM base model.
         */
        [[nodiscard]] bool is_model(std::string_view class_name) const;

        /**
         * Checks whether the class was seen while scanning, model or not.
         */
        [[nodiscard]] bool knows_class(std::string_view class_name) const;

        /**
         * Checks whether a class is one of the ORM base classes.
         */
        [[nodiscard]] bool is_orm_base(std::string_view class_name) const;

        /**
         * Returns the immediate parent of a scanned class.
         */
        [[nodiscard]] std::optional<std::string> parent_of(std::string_view class_name) const;

        /**
         * Checks whether any model maps to the given table.
         */
        [[nodiscard]] bool has_model_for_table(std::string_view table) const;

        /**
         * Returns all models, ordered by class name.
         */
        [[nodiscard]] std::vector<ModelEntry> entries() const;

        [[nodiscard]] std::size_t size() const noexcept { return models_.size(); }
        [[nodiscard]] bool empty() const noexcept { return models_.empty(); }

        /**
         * Forgets every class and model. ORM base classes are kept.
         */
        void clear();

        /**
         * The ORM base classes recognized without configuration.
         */
        [[nodiscard]] static const std::vector<std::string>& default_base_classes();

    private:
        friend class RegistryBuilder;
        friend class RegistryCache;

        std::unordered_set<std::string> orm_bases_;
        std::unordered_map<std::string, std::string> parents_;     // every scanned class
        std::unordered_map<std::string, ModelEntry> models_;
        std::unordered_set<std::string> tables_;
    };

    /**
     * Collects class records and resolves them into a ModelRegistry.
     */
    class RegistryBuilder {
    public:
        explicit RegistryBuilder(RegistryOptions options = {});

        /**
         * Parses one PHP source and records its classes.
         *
         * @return Number of classes recorded, or ParseError when the source
         *         does not parse; nothing is recorded then.
         */
        Result<std::size_t, Error> add_source(const fs::path& file, std::string source);

        /**
         * Scans a directory recursively for PHP files.
         *
         * A missing directory records nothing. Unreadable and unparseable
         * files are skipped.
         *
         * @return Number of files that were parsed successfully.
         */
        std::size_t scan_directory(const fs::path& directory);

        void add_record(ClassRecord record);

        [[nodiscard]] const std::vector<ClassRecord>& records() const noexcept { return records_; }

        [[nodiscard]] ModelRegistry build() const;

    private:
        RegistryOptions options_;
        std::vector<ClassRecord> records_;
    };

}  // namespace lpa::models

#endif //LPA_MODEL_REGISTRY_HPP
