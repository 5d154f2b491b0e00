//
// Created by gregorian-rayne on 1/16/26.
//

#include "lpa/analyzers/service_container_resolution_analyzer.hpp"

#include "support/analyzer_fixture.hpp"

#include <gtest/gtest.h>

namespace lpa::analyzers
{
    using lpa::testing::analyze;
    using lpa::testing::with_code;

    namespace {
        std::string in_class(const std::string& class_name, const std::string& body) {
            return "<?php\n"
                   "namespace App\\Services;\n"
                   "class " + class_name + "\n"
                   "{\n"
                   "    public function handle()\n"
                   "    {\n" +
                   body +
                   "    }\n"
                   "}\n";
        }
    }

    TEST(ServiceContainerResolutionAnalyzerTest, AppMakeWithClassIsMedium) {
        const auto issues = analyze<ServiceContainerResolutionAnalyzer>(in_class("InvoiceService",
            "        $mailer = app()->make(Mailer::class);\n"));

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].severity, Severity::Medium);
        EXPECT_EQ(issues[0].location.line, 7u);
        EXPECT_EQ(issues[0].message, "Manual service resolution in 'InvoiceService::handle': app()->make()");
        EXPECT_EQ(issues[0].metadata["argument_type"], "class");
    }

    TEST(ServiceContainerResolutionAnalyzerTest, StringResolutionIsHigh) {
        const auto issues = analyze<ServiceContainerResolutionAnalyzer>(in_class("InvoiceService",
            "        $pdf = App::make('pdf.renderer');\n"
            "        $gateway = resolve($gatewayClass);\n"
            "        $tax = app(TaxCalculator::class);\n"));

        ASSERT_EQ(issues.size(), 3u);
        EXPECT_EQ(issues[0].metadata["pattern"], "App::make()");
        EXPECT_EQ(issues[0].severity, Severity::High);
        EXPECT_EQ(issues[1].metadata["pattern"], "resolve()");
        EXPECT_EQ(issues[1].metadata["argument_type"], "variable");
        EXPECT_EQ(issues[1].severity, Severity::Medium);
        EXPECT_EQ(issues[2].metadata["pattern"], "app()");
    }

    TEST(ServiceContainerResolutionAnalyzerTest, BindingsAreHighEvenInClosures) {
        const auto issues = analyze<ServiceContainerResolutionAnalyzer>(in_class("InvoiceService",
            "        collect([1])->each(function () {\n"
            "            app()->singleton(Clock::class, FixedClock::class);\n"
            "            $clock = app()->make(Clock::class);\n"
            "        });\n"));

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].code, "container-binding");
        EXPECT_EQ(issues[0].severity, Severity::High);
        EXPECT_EQ(issues[0].location.line, 8u);
    }

    TEST(ServiceContainerResolutionAnalyzerTest, WhitelistedServicesAndMethodsPass) {
        const auto issues = analyze<ServiceContainerResolutionAnalyzer>(in_class("InvoiceService",
            "        $config = app('config');\n"
            "        $app = app();\n"
            "        if (app()->environment('local')) {}\n"
            "        $path = app()->storagePath();\n"));

        EXPECT_TRUE(issues.empty());
    }

    TEST(ServiceContainerResolutionAnalyzerTest, SkippedPlacesAndClasses) {
        const std::string body = "        $mailer = app()->make(Mailer::class);\n";

        EXPECT_TRUE(analyze<ServiceContainerResolutionAnalyzer>(in_class("SendInvoiceJob", body)).empty());
        EXPECT_TRUE(analyze<ServiceContainerResolutionAnalyzer>(in_class("InvoiceService", body),
                                                                "routes/web.php").empty());
        EXPECT_TRUE(analyze<ServiceContainerResolutionAnalyzer>(in_class("InvoiceService", body),
                                                                "database/migrations/2024_01_01_create.php").empty());
        EXPECT_TRUE(analyze<ServiceContainerResolutionAnalyzer>(
            "<?php\n"
            "class BillingProvider extends ServiceProvider\n"
            "{\n"
            "    public function register()\n"
            "    {\n"
            "        $this->app->singleton(Gateway::class, fn () => app()->make(StripeGateway::class));\n"
            "    }\n"
            "}\n",
            "app/Providers/BillingProvider.php").empty());
    }

    TEST(ServiceContainerResolutionAnalyzerTest, OptionalDetections) {
        AnalyzerSettings settings(std::string(ServiceContainerResolutionAnalyzer::ID));
        settings.set("detect_psr_get", true);
        settings.set("detect_manual_instantiation", true);

        const auto issues = analyze<ServiceContainerResolutionAnalyzer>(in_class("InvoiceService",
            "        $cache = app()->get(CacheContract::class);\n"
            "        $repo = new InvoiceRepository();\n"
            "        $total = new Money(10);\n"),
            "app/Services/InvoiceService.php", settings);

        ASSERT_EQ(issues.size(), 2u);
        EXPECT_EQ(issues[0].metadata["pattern"], "app()->get()");
        EXPECT_EQ(issues[1].metadata["pattern"], "new InvoiceRepository()");
        EXPECT_EQ(issues[1].severity, Severity::Low);
        EXPECT_EQ(with_code(issues, "service-locator").size(), 2u);
    }

}  // namespace lpa::analyzers
