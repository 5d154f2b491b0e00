//
// Created by gregorian-rayne on 1/16/26.
//

#ifndef LPA_SERVICE_CONTAINER_RESOLUTION_ANALYZER_HPP
#define LPA_SERVICE_CONTAINER_RESOLUTION_ANALYZER_HPP

/**
 * @file service_container_resolution_analyzer.hpp
 * @brief Service locator calls that should be dependency injection.
 *
 * Reports app()->make(), App::make(), Container::getInstance()->make(),
 * resolve() and app(Foo::class) outside closures, and container bindings
 * (bind, singleton, instance, scoped) anywhere outside a service provider.
 * Resolving by string name is High, everything else Medium.
 *
 * Tests, migrations, seeders, factories, routes, service providers and
 * classes that have no constructor injection (commands, jobs, listeners
 * and friends) are skipped.
 */

#include "lpa/analyzers/analyzer.hpp"

#include <string>
#include <vector>

namespace lpa::analyzers {

    class ServiceContainerResolutionAnalyzer : public IAnalyzer {
    public:
        static constexpr std::string_view ID = "service-container-resolution";

        ServiceContainerResolutionAnalyzer();

        [[nodiscard]] std::string_view id() const noexcept override {
            return ID;
        }

        [[nodiscard]] std::string_view name() const noexcept override {
            return "Service Container Resolution Analyzer";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Detects manual service container resolution that should use dependency injection";
        }

        [[nodiscard]] Category category() const noexcept override {
            return Category::BestPractices;
        }

        [[nodiscard]] Severity severity() const noexcept override {
            return Severity::Medium;
        }

        [[nodiscard]] Result<void, Error> configure(const AnalyzerSettings& settings) override;

        [[nodiscard]] bool should_analyze(std::string_view relative_path) const override;

        [[nodiscard]] std::unique_ptr<scope::FileVisitor> create_visitor(FileContext& context) const override;

        [[nodiscard]] bool is_whitelisted_class(std::string_view name) const;
        [[nodiscard]] bool is_whitelisted_method(std::string_view method) const;
        [[nodiscard]] bool is_whitelisted_service(std::string_view service) const;
        [[nodiscard]] bool is_resolution_method(std::string_view method) const noexcept;
        [[nodiscard]] bool detects_instantiation_of(std::string_view class_name) const;

    private:
        std::vector<std::string> whitelist_dirs_;
        std::vector<std::string> whitelist_classes_;
        std::vector<std::string> whitelist_methods_;
        std::vector<std::string> whitelist_services_;
        std::vector<std::string> instantiation_patterns_;
        bool detect_psr_get_ = false;
        bool detect_manual_instantiation_ = false;
    };

    void register_service_container_resolution_analyzer();

}  // namespace lpa::analyzers

#endif //LPA_SERVICE_CONTAINER_RESOLUTION_ANALYZER_HPP
