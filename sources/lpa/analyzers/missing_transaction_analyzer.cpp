//
// Created by gregorian-rayne on 1/15/26.
//

#include "lpa/analyzers/missing_transaction_analyzer.hpp"
#include "lpa/analyzers/query_patterns.hpp"

#include "lpa/scope/provenance.hpp"
#include "lpa/scope/vocabulary.hpp"
#include "lpa/syntax/php_nodes.hpp"
#include "lpa/utils/path_utils.hpp"
#include "lpa/utils/string_utils.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <limits>
#include <sstream>
#include <vector>

namespace lpa::analyzers
{
    namespace {

        namespace vocab = scope::vocabulary;

        constexpr std::array<std::string_view, 4> DB_WRITE_METHODS = {
            "insert", "update", "delete", "statement",
        };

        constexpr std::array<std::string_view, 9> STATIC_WRITE_METHODS = {
            "create", "insert", "update", "delete", "forceDelete",
            "upsert", "updateOrInsert", "updateOrCreate", "firstOrCreate",
        };

        constexpr std::array<std::string_view, 18> METHOD_WRITE_METHODS = {
            "save", "delete", "forceDelete", "update", "increment", "decrement",
            "touch", "create", "insert", "updateOrCreate", "firstOrCreate",
            "updateOrInsert", "upsert", "sync", "attach", "detach", "toggle",
            "syncWithoutDetaching",
        };

        /// Facades backed by caches, queues, files and other non-relational stores.
        constexpr std::array<std::string_view, 14> NON_DB_FACADES = {
            "Cache", "Redis", "Session", "Storage", "Queue", "RateLimiter", "Cookie",
            "Log", "Event", "Mail", "Notification", "Bus", "File", "Config",
        };

        constexpr std::array<std::string_view, 5> NON_DB_HELPERS = {
            "cache", "session", "cookie", "logger", "config",
        };

        constexpr std::array<std::string_view, 5> EXCLUDED_DIRECTORIES = {
            "tests", "test", "seeders", "factories", "migrations",
        };

        constexpr std::array<std::string_view, 3> EXCLUDED_SUFFIXES = {
            "Test.php", "Seeder.php", "Factory.php",
        };

        bool is_non_db_root(const syntax::CallChain& chain) {
            switch (chain.root_kind) {
                case syntax::ChainRoot::StaticClass:
                    return vocab::contains(NON_DB_FACADES, string_utils::basename(chain.root));
                case syntax::ChainRoot::Function:
                    return vocab::contains(NON_DB_HELPERS, chain.root);
                default:
                    return false;
            }
        }

        struct ByteRange {
            std::uint32_t begin = 0;
            std::uint32_t end = 0;

            [[nodiscard]] bool contains(const std::uint32_t byte) const noexcept {
                return byte >= begin && byte < end;
            }
        };

        /**
         * Finds the spans protected by beginTransaction() in a method.
         *
         * Each span runs from a beginTransaction() call to the last
         * commit()/rollBack() before the next beginTransaction(), or to the
         * end of the method when nothing closes it.
         */
        std::vector<ByteRange> manual_transaction_ranges(const syntax::SyntaxNode& method) {
            std::vector<std::uint32_t> begins;
            std::vector<syntax::SyntaxNode> ends;

            std::vector<syntax::SyntaxNode> pending{method};
            while (!pending.empty()) {
                const auto node = pending.back();
                pending.pop_back();

                if (syntax::is_member_call(node) || syntax::is_static_call(node)) {
                    const auto name = syntax::call_name(node);
                    if (name == "beginTransaction") {
                        begins.push_back(node.start_byte());
                    } else if (name == "commit" || name == "rollBack" || name == "rollback") {
                        ends.push_back(node);
                    }
                }
                for (const auto& child : node.named_children()) {
                    pending.push_back(child);
                }
            }

            std::ranges::sort(begins);

            std::vector<ByteRange> ranges;
            for (std::size_t i = 0; i < begins.size(); ++i) {
                const auto next = i + 1 < begins.size() ? begins[i + 1] : std::numeric_limits<std::uint32_t>::max();

                ByteRange range{begins[i], method.end_byte()};
                std::uint32_t closed_at = 0;
                for (const auto& end : ends) {
                    if (end.start_byte() > begins[i] && end.start_byte() < next) {
                        closed_at = std::max(closed_at, end.end_byte());
                    }
                }
                if (closed_at != 0) {
                    range.end = closed_at;
                }
                ranges.push_back(range);
            }
            return ranges;
        }

        struct WriteSite {
            std::size_t line = 0;
            bool protected_write = false;
        };

        struct MethodFrame {
            syntax::SyntaxNode node;
            std::string name;
            std::string class_name;
            bool is_function = false;
            std::vector<ByteRange> manual_ranges;
            std::vector<WriteSite> writes;
        };

        class TransactionVisitor final : public scope::FileVisitor {
        public:
            TransactionVisitor(const MissingTransactionAnalyzer& analyzer, FileContext& context)
                : analyzer_(analyzer), context_(context) {}

            void enter(const syntax::SyntaxNode& node) override {
                if (syntax::is_method(node) || syntax::is_function(node)) {
                    push_method(node);
                    return;
                }
                if (methods_.empty() || !is_write_operation(context_, node)) {
                    return;
                }

                auto& frame = methods_.back();
                const bool in_manual = std::ranges::any_of(frame.manual_ranges, [&](const ByteRange& range) {
                    return range.contains(node.start_byte());
                });
                frame.writes.push_back({node.start_line(), in_manual || context_.scopes().in_transaction()});
            }

            void leave(const syntax::SyntaxNode& node) override {
                if (methods_.empty() || methods_.back().node != node) {
                    return;
                }
                check(methods_.back());
                methods_.pop_back();
            }

        private:
            void push_method(const syntax::SyntaxNode& node) {
                MethodFrame frame;
                frame.node = node;
                frame.name = std::string(syntax::declaration_name(node));
                frame.is_function = syntax::is_function(node);
                if (const auto* cls = context_.scopes().current_class(); cls != nullptr && !frame.is_function) {
                    frame.class_name = cls->name.empty() ? "class@anonymous" : cls->name;
                }
                frame.manual_ranges = manual_transaction_ranges(node);
                methods_.push_back(std::move(frame));
            }

            void check(const MethodFrame& frame) {
                std::vector<std::size_t> unprotected;
                for (const auto& write : frame.writes) {
                    if (!write.protected_write) {
                        unprotected.push_back(write.line);
                    }
                }
                if (unprotected.empty() || unprotected.size() < analyzer_.threshold()) {
                    return;
                }

                std::ostringstream message;
                if (frame.is_function) {
                    message << "Function \"" << frame.name << "()\"";
                } else {
                    message << "Method \"" << (frame.class_name.empty() ? "Unknown" : frame.class_name)
                            << "::" << frame.name << "()\"";
                }
                message << " has " << unprotected.size() << " write operations without transaction protection";

                std::ostringstream recommendation;
                recommendation << "Wrap multiple write operations in DB::transaction() so that a failure rolls "
                                  "all of them back. Write operations found at lines: "
                               << string_utils::join(unprotected, ", ");

                context_.report(
                    MissingTransactionAnalyzer::ID, frame.node, Severity::High,
                    "missing-transaction",
                    message.str(),
                    recommendation.str(),
                    {
                        {"method", frame.name},
                        {"class", frame.class_name},
                        {"unprotected_writes", unprotected.size()},
                        {"total_writes", frame.writes.size()},
                        {"lines", unprotected},
                        {"threshold", analyzer_.threshold()},
                    });
            }

            const MissingTransactionAnalyzer& analyzer_;
            FileContext& context_;
            std::vector<MethodFrame> methods_;
        };

    }  // namespace

    bool is_write_operation(const FileContext& context, const syntax::SyntaxNode& call) {
        if (syntax::is_static_call(call)) {
            const auto chain = syntax::decompose_chain(call);
            if (is_non_db_root(chain)) {
                return false;
            }
            const auto method = syntax::call_name(call);
            if (is_db_rooted(chain)) {
                return vocab::contains(DB_WRITE_METHODS, method);
            }
            return vocab::contains(STATIC_WRITE_METHODS, method) && is_model_rooted(context, chain);
        }

        if (syntax::is_member_call(call)) {
            if (!vocab::contains(METHOD_WRITE_METHODS, syntax::call_name(call))) {
                return false;
            }
            return !is_non_db_root(syntax::decompose_chain(call));
        }

        return false;
    }

    Result<void, Error> MissingTransactionAnalyzer::configure(const AnalyzerSettings& settings) {
        auto threshold = settings.get_count("threshold", DEFAULT_THRESHOLD, 1);
        if (threshold.is_err()) {
            return Result<void, Error>::failure(threshold.error());
        }
        threshold_ = threshold.value();
        return Result<void, Error>::success();
    }

    bool MissingTransactionAnalyzer::should_analyze(const std::string_view relative_path) const {
        const auto lowered = string_utils::to_lower(relative_path);
        for (const auto directory : EXCLUDED_DIRECTORIES) {
            if (path_utils::has_directory(lowered, directory)) {
                return false;
            }
        }
        for (const auto suffix : EXCLUDED_SUFFIXES) {
            if (string_utils::ends_with(relative_path, suffix)) {
                return false;
            }
        }
        return true;
    }

    std::unique_ptr<scope::FileVisitor> MissingTransactionAnalyzer::create_visitor(FileContext& context) const {
        return std::make_unique<TransactionVisitor>(*this, context);
    }

    void register_missing_transaction_analyzer() {
        AnalyzerRegistry::instance().register_analyzer([] {
            return std::make_unique<MissingTransactionAnalyzer>();
        });
    }

}  // namespace lpa::analyzers
