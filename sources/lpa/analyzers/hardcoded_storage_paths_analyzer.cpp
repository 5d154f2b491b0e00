//
// Created by gregorian-rayne on 1/16/26.
//

#include "lpa/analyzers/hardcoded_storage_paths_analyzer.hpp"

#include "lpa/scope/vocabulary.hpp"
#include "lpa/syntax/php_nodes.hpp"
#include "lpa/utils/string_utils.hpp"

#include <algorithm>
#include <array>
#include <optional>

namespace lpa::analyzers
{
    namespace {

        namespace vocab = scope::vocabulary;
        using syntax::SyntaxNode;

        constexpr std::array<std::string_view, 49> FILESYSTEM_FUNCTIONS = {
            "file_get_contents", "file_put_contents", "fopen", "fread", "fwrite", "fclose", "file",
            "readfile", "fgets", "fgetc", "fgetcsv", "fputcsv", "file_exists", "is_file", "is_dir",
            "is_readable", "is_writable", "is_writeable", "is_executable", "is_link", "mkdir", "rmdir",
            "opendir", "readdir", "closedir", "scandir", "glob", "unlink", "copy", "rename",
            "move_uploaded_file", "chmod", "chown", "chgrp", "touch", "link", "symlink", "readlink",
            "filesize", "filetype", "filemtime", "fileatime", "filectime", "stat", "lstat", "pathinfo",
            "realpath", "dirname", "basename",
        };

        constexpr std::array<std::string_view, 22> FILESYSTEM_STATIC_METHODS = {
            "get", "put", "exists", "missing", "path", "delete", "copy", "move", "size", "lastModified",
            "files", "allFiles", "directories", "allDirectories", "makeDirectory", "deleteDirectory",
            "append", "prepend", "read", "write", "readStream", "writeStream",
        };

        constexpr std::array<std::string_view, 13> FILESYSTEM_INSTANCE_METHODS = {
            "get", "put", "exists", "delete", "copy", "move", "read", "write", "append", "prepend",
            "size", "lastModified", "path",
        };

        constexpr std::array<std::string_view, 3> RESPONSE_FILE_METHODS = {"download", "file", "streamDownload"};

        constexpr std::array<std::string_view, 4> FILESYSTEM_SERVICES = {
            "files", "filesystem", "Illuminate\\Filesystem\\Filesystem", "Illuminate\\Contracts\\Filesystem\\Filesystem",
        };

        constexpr std::array<std::string_view, 7> FILESYSTEM_VARIABLE_HINTS = {
            "file", "filesystem", "storage", "disk", "fs", "directory", "dir",
        };

        enum class Context { None, Weak, Definite };

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

        bool is_filesystem_facade(const SyntaxNode& scope) noexcept {
            const auto name = plain_name(scope);
            return name == "Storage" || name == "File" ||
                   name == "Illuminate\\Support\\Facades\\Storage" || name == "Illuminate\\Support\\Facades\\File";
        }

        bool is_upload_class(const SyntaxNode& scope) noexcept {
            return string_utils::basename(plain_name(scope)) == "UploadedFile";
        }

        bool is_filesystem_service(const SyntaxNode& call) {
            const auto function = plain_name(call.child_by_field("function"));
            if (function != "app" && function != "resolve") {
                return false;
            }
            const auto first = syntax::first_argument(call);
            if (const auto service = syntax::string_literal(first)) {
                return vocab::contains(FILESYSTEM_SERVICES, *service);
            }
            return first.is("class_constant_access_expression") && string_utils::contains(first.text(), "Filesystem");
        }

        bool is_response_file_call(const SyntaxNode& call, const std::string_view method) {
            if (!vocab::contains(RESPONSE_FILE_METHODS, method)) {
                return false;
            }
            const auto object = syntax::unwrap_parentheses(call.child_by_field("object"));
            if (syntax::is_function_call(object)) {
                return string_utils::iequals(plain_name(object.child_by_field("function")), "response");
            }
            return object.is("variable_name") && string_utils::iequals(object.text(), "$response");
        }

        bool is_filesystem_variable(const SyntaxNode& object) {
            std::string_view name;
            if (object.is("variable_name")) {
                name = object.text();
            } else if (syntax::is_property_access(object)) {
                name = object.child_by_field("name").text();
            }
            if (name.empty()) {
                return false;
            }
            const auto lowered = string_utils::to_lower(name);
            return std::ranges::any_of(FILESYSTEM_VARIABLE_HINTS, [&lowered](const std::string_view hint) {
                return string_utils::contains(lowered, hint);
            });
        }

        bool contains_name(const auto& list, const std::string_view name) {
            return std::ranges::any_of(list, [name](const std::string_view entry) {
                return string_utils::iequals(entry, name);
            });
        }

        Context call_context(const SyntaxNode& call) {
            const auto method = syntax::call_name(call);

            if (syntax::is_function_call(call)) {
                const auto function = string_utils::to_lower(plain_name(call.child_by_field("function")));
                return vocab::contains(FILESYSTEM_FUNCTIONS, function) ? Context::Definite : Context::None;
            }

            if (syntax::is_static_call(call)) {
                const auto scope = call.child_by_field("scope");
                if ((is_filesystem_facade(scope) && contains_name(FILESYSTEM_STATIC_METHODS, method)) ||
                    is_upload_class(scope)) {
                    return Context::Definite;
                }
                return Context::None;
            }

            if (!syntax::is_member_call(call)) {
                return Context::None;
            }
            const auto object = syntax::unwrap_parentheses(call.child_by_field("object"));
            const bool instance_method = contains_name(FILESYSTEM_INSTANCE_METHODS, method);
            if (instance_method && syntax::is_static_call(object) && is_filesystem_facade(object.child_by_field("scope"))) {
                return Context::Definite;
            }
            if (instance_method && syntax::is_function_call(object) && is_filesystem_service(object)) {
                return Context::Definite;
            }
            if (is_response_file_call(call, method)) {
                return Context::Definite;
            }
            return instance_method && is_filesystem_variable(object) ? Context::Weak : Context::None;
        }

        /// Walks out through concatenations, arrays and argument lists to
        /// the call that receives the string as an argument.
        Context filesystem_context(const SyntaxNode& literal) {
            bool in_arguments = false;
            for (auto node = literal.parent(); node; node = node.parent()) {
                if (node.is("arguments")) {
                    in_arguments = true;
                    continue;
                }
                if (node.is("argument") || node.is("array_element_initializer") ||
                    node.is("array_creation_expression") || node.is("parenthesized_expression") ||
                    (node.is("binary_expression") && syntax::operator_of(node) == ".")) {
                    continue;
                }
                if (in_arguments && syntax::is_call(node)) {
                    return call_context(node);
                }
                break;
            }
            return Context::None;
        }

        /// Literal text of a string, interpolated parts left out.
        std::optional<std::string> literal_text(const SyntaxNode& node) {
            if (auto value = syntax::string_literal(node)) {
                return value;
            }
            if (!node.is("encapsed_string") && !node.is("heredoc")) {
                return std::nullopt;
            }
            std::string text;
            std::vector<SyntaxNode> pending{node};
            while (!pending.empty()) {
                const auto current = pending.back();
                pending.pop_back();
                if (current.is("string_content") || current.is("string_value")) {
                    text += current.text();
                    continue;
                }
                if (current != node && !current.is("heredoc_body")) {
                    continue;
                }
                const auto children = current.named_children();
                for (auto it = children.rbegin(); it != children.rend(); ++it) {
                    pending.push_back(*it);
                }
            }
            if (text.empty()) {
                return std::nullopt;
            }
            return text;
        }

        std::string recommendation_for(const PathPattern& pattern) {
            return "Use Laravel path helper: " + pattern.helper +
                   ". This ensures portability across environments and enables different storage drivers";
        }

        class HardcodedPathsVisitor final : public scope::FileVisitor {
        public:
            HardcodedPathsVisitor(const HardcodedStoragePathsAnalyzer& analyzer, FileContext& context)
                : analyzer_(analyzer), context_(context) {}

            void enter(const SyntaxNode& node) override {
                if (!syntax::is_string(node) && !node.is("heredoc")) {
                    return;
                }
                const auto value = literal_text(node);
                if (!value || string_utils::starts_with(string_utils::to_lower(*value), "http://") ||
                    string_utils::starts_with(string_utils::to_lower(*value), "https://") ||
                    analyzer_.is_allowed(*value)) {
                    return;
                }

                if (const auto* pattern = analyzer_.always_flagged(*value)) {
                    report(node, *value, *pattern);
                    return;
                }
                if (const auto* pattern = analyzer_.context_required(*value)) {
                    const auto context = filesystem_context(node);
                    const auto required = pattern->needs_definite_context ? Context::Definite : Context::Weak;
                    if (context != Context::None && context >= required) {
                        report(node, *value, *pattern);
                    }
                }
            }

        private:
            void report(const SyntaxNode& node, const std::string& value, const PathPattern& pattern) {
                context_.report(
                    HardcodedStoragePathsAnalyzer::ID, node, Severity::Medium,
                    "hardcoded-path",
                    "Hardcoded storage path found: \"" + value.substr(0, 50) + "\"",
                    recommendation_for(pattern),
                    {{"helper", pattern.helper}});
            }

            const HardcodedStoragePathsAnalyzer& analyzer_;
            FileContext& context_;
        };

        PathPattern pattern(const char* regex, std::string helper, const bool definite = false) {
            return {std::regex(regex, std::regex::icase), std::move(helper), definite};
        }

    }  // namespace

    HardcodedStoragePathsAnalyzer::HardcodedStoragePathsAnalyzer() {
        always_patterns_.push_back(pattern(R"(/var/www/.*storage)", "storage_path(...)"));
        always_patterns_.push_back(pattern(R"(/var/www/.*public)", "public_path(...)"));
        always_patterns_.push_back(pattern(R"(/var/www/.*app/)", "app_path(...)"));
        always_patterns_.push_back(pattern(R"(/var/www/.*resources)", "resource_path(...)"));
        always_patterns_.push_back(pattern(R"(/var/www/.*database)", "database_path(...)"));
        always_patterns_.push_back(pattern(R"(/var/www/.*config)", "config_path(...)"));
        always_patterns_.push_back(pattern(R"([A-Z]:\\storage\\app\\)", "storage_path('app/...')"));
        always_patterns_.push_back(pattern(R"([A-Z]:\\storage\\logs\\)", "storage_path('logs/...')"));
        always_patterns_.push_back(pattern(R"([A-Z]:\\storage\\framework\\)", "storage_path('framework/...')"));
        always_patterns_.push_back(pattern(R"([A-Z]:\\storage\\)", "storage_path(...)"));
        always_patterns_.push_back(pattern(R"([A-Z]:\\public\\uploads\\)", "public_path('uploads/...')"));
        always_patterns_.push_back(pattern(R"([A-Z]:\\public\\images\\)", "public_path('images/...')"));
        always_patterns_.push_back(pattern(R"([A-Z]:\\public\\)", "public_path(...)"));
        always_patterns_.push_back(pattern(R"([A-Z]:\\app\\)", "app_path(...)"));
        always_patterns_.push_back(pattern(R"([A-Z]:\\resources\\)", "resource_path(...)"));
        always_patterns_.push_back(pattern(R"([A-Z]:\\database\\)", "database_path(...)"));
        always_patterns_.push_back(pattern(R"([A-Z]:\\config\\)", "config_path(...)"));
        always_patterns_.push_back(pattern(R"(\.\.?/storage/)", "storage_path(...)"));
        always_patterns_.push_back(pattern(R"(\.\.?/public/)", "public_path(...)"));
        always_patterns_.push_back(pattern(R"(\.\.?/app/)", "app_path(...)"));
        always_patterns_.push_back(pattern(R"(\.\.?/resources/)", "resource_path(...)"));
        always_patterns_.push_back(pattern(R"(\.\.?/database/)", "database_path(...)"));
        always_patterns_.push_back(pattern(R"(\.\.?/config/)", "config_path(...)"));

        context_patterns_.push_back(pattern(R"(^/storage/app/)", "storage_path('app/...')"));
        context_patterns_.push_back(pattern(R"(^/storage/logs/)", "storage_path('logs/...')"));
        context_patterns_.push_back(pattern(R"(^/storage/framework/)", "storage_path('framework/...')"));
        context_patterns_.push_back(pattern(R"(^/storage/)", "storage_path(...)"));
        context_patterns_.push_back(pattern(R"(^/public/uploads/)", "public_path('uploads/...')"));
        context_patterns_.push_back(pattern(R"(^/public/images/)", "public_path('images/...')"));
        context_patterns_.push_back(pattern(R"(^/public/)", "public_path(...)", true));
        context_patterns_.push_back(pattern(R"(^/app/)", "app_path(...)", true));
        context_patterns_.push_back(pattern(R"(^/resources/)", "resource_path(...)"));
        context_patterns_.push_back(pattern(R"(^/database/)", "database_path(...)"));
        context_patterns_.push_back(pattern(R"(^/config/)", "config_path(...)"));
    }

    Result<void, Error> HardcodedStoragePathsAnalyzer::configure(const AnalyzerSettings& settings) {
        auto allowed = settings.get_strings("allowed_paths");
        if (allowed.is_err()) {
            return Result<void, Error>::failure(allowed.error());
        }
        auto additional = settings.get_string_map("additional_patterns");
        if (additional.is_err()) {
            return Result<void, Error>::failure(additional.error());
        }

        allowed_paths_ = std::move(allowed).value();
        for (const auto& [regex, helper] : additional.value()) {
            try {
                always_patterns_.push_back({std::regex(regex, std::regex::icase), helper, false});
            } catch (const std::regex_error& e) {
                return Result<void, Error>::failure(Error::config_error(
                    "Invalid path pattern '" + regex + "': " + e.what(),
                    "analyzers." + std::string(ID) + ".additional_patterns"));
            }
        }
        return Result<void, Error>::success();
    }

    bool HardcodedStoragePathsAnalyzer::is_allowed(const std::string_view value) const {
        return std::ranges::any_of(allowed_paths_, [value](const std::string& allowed) {
            return string_utils::contains(value, allowed);
        });
    }

    const PathPattern* HardcodedStoragePathsAnalyzer::always_flagged(const std::string& value) const {
        const auto found = std::ranges::find_if(always_patterns_, [&value](const PathPattern& p) {
            return std::regex_search(value, p.regex);
        });
        return found == always_patterns_.end() ? nullptr : &*found;
    }

    const PathPattern* HardcodedStoragePathsAnalyzer::context_required(const std::string& value) const {
        const auto found = std::ranges::find_if(context_patterns_, [&value](const PathPattern& p) {
            return std::regex_search(value, p.regex);
        });
        return found == context_patterns_.end() ? nullptr : &*found;
    }

    std::unique_ptr<scope::FileVisitor> HardcodedStoragePathsAnalyzer::create_visitor(FileContext& context) const {
        return std::make_unique<HardcodedPathsVisitor>(*this, context);
    }

    void register_hardcoded_storage_paths_analyzer() {
        AnalyzerRegistry::instance().register_analyzer([] {
            return std::make_unique<HardcodedStoragePathsAnalyzer>();
        });
    }

}  // namespace lpa::analyzers
