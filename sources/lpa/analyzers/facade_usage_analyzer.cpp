//
// Created by gregorian-rayne on 1/16/26.
//

#include "lpa/analyzers/facade_usage_analyzer.hpp"

#include "lpa/syntax/php_nodes.hpp"
#include "lpa/utils/string_utils.hpp"

#include <algorithm>
#include <sstream>

namespace lpa::analyzers
{
    namespace {

        struct ClassFacades {
            syntax::SyntaxNode node;
            std::string name;
            std::vector<std::string> facades;     // first use order
        };

        class FacadeUsageVisitor final : public scope::FileVisitor {
        public:
            FacadeUsageVisitor(const FacadeUsageAnalyzer& analyzer, FileContext& context)
                : analyzer_(analyzer), context_(context) {}

            void enter(const syntax::SyntaxNode& node) override {
                if (syntax::is_class_declaration(node) || syntax::is_anonymous_class(node)) {
                    const auto name = syntax::declaration_name(node);
                    classes_.push_back({node, name.empty() ? "Anonymous" : std::string(name), {}});
                    return;
                }
                if (classes_.empty() || !syntax::is_static_call(node)) {
                    return;
                }

                const auto scope = node.child_by_field("scope");
                if (!scope.is("name") && !scope.is("qualified_name")) {
                    return;
                }
                const auto facade = analyzer_.facade_of(scope.text());
                auto& used = classes_.back().facades;
                if (!facade.empty() && std::ranges::find(used, facade) == used.end()) {
                    used.emplace_back(facade);
                }
            }

            void leave(const syntax::SyntaxNode& node) override {
                if (classes_.empty() || classes_.back().node != node) {
                    return;
                }
                check(classes_.back());
                classes_.pop_back();
            }

        private:
            void check(const ClassFacades& cls) {
                const auto count = cls.facades.size();
                const auto threshold = analyzer_.threshold();
                if (count <= threshold) {
                    return;
                }

                std::ostringstream listed;
                for (std::size_t i = 0; i < count; ++i) {
                    listed << (i == 0 ? "" : ", ") << "'" << cls.facades[i] << "'";
                }

                context_.report_at(
                    FacadeUsageAnalyzer::ID, cls.node.start_line(), cls.node.start_line(),
                    scaled_severity(count - threshold, 5, 3),
                    "too-many-facades",
                    "Class '" + cls.name + "' uses " + std::to_string(count) +
                    " different facades (threshold: " + std::to_string(threshold) + ")",
                    "Class '" + cls.name + "' uses " + std::to_string(count) + " different facades: " + listed.str() +
                    ". Inject the services through the constructor instead of reaching for facades, and consider "
                    "splitting the class if it has too many responsibilities.",
                    {},
                    {{"class", cls.name}, {"facades", cls.facades}, {"count", count}, {"threshold", threshold}});
            }

            const FacadeUsageAnalyzer& analyzer_;
            FileContext& context_;
            std::vector<ClassFacades> classes_;
        };

    }  // namespace

    FacadeUsageAnalyzer::FacadeUsageAnalyzer()
        : facades_{
              "App", "Artisan", "Auth", "Blade", "Broadcast", "Bus", "Cache", "Config",
              "Cookie", "Crypt", "Date", "DB", "Eloquent", "Event", "File", "Gate",
              "Hash", "Http", "Lang", "Log", "Mail", "Notification", "Password",
              "Process", "Queue", "Redirect", "Redis", "Request", "Response", "Route",
              "Schema", "Session", "Storage", "URL", "Validator", "View", "Vite"} {}

    Result<void, Error> FacadeUsageAnalyzer::configure(const AnalyzerSettings& settings) {
        auto threshold = settings.get_count("threshold", DEFAULT_THRESHOLD);
        if (threshold.is_err()) {
            return Result<void, Error>::failure(threshold.error());
        }
        auto facades = settings.get_strings("facades", facades_);
        if (facades.is_err()) {
            return Result<void, Error>::failure(facades.error());
        }

        threshold_ = threshold.value();
        facades_ = std::move(facades).value();
        return Result<void, Error>::success();
    }

    std::string_view FacadeUsageAnalyzer::facade_of(std::string_view scope) const {
        if (!scope.empty() && scope.front() == '\\') {
            scope.remove_prefix(1);
        }
        const auto short_name = string_utils::basename(scope);
        const auto known = std::ranges::find(facades_, short_name);
        return known == facades_.end() ? std::string_view{} : std::string_view(*known);
    }

    std::unique_ptr<scope::FileVisitor> FacadeUsageAnalyzer::create_visitor(FileContext& context) const {
        return std::make_unique<FacadeUsageVisitor>(*this, context);
    }

    void register_facade_usage_analyzer() {
        AnalyzerRegistry::instance().register_analyzer([] {
            return std::make_unique<FacadeUsageAnalyzer>();
        });
    }

}  // namespace lpa::analyzers
