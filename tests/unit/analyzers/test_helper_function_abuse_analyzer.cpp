//
// Created by gregorian-rayne on 1/16/26.
//

#include "lpa/analyzers/helper_function_abuse_analyzer.hpp"

#include "support/analyzer_fixture.hpp"

#include <gtest/gtest.h>

namespace lpa::analyzers
{
    using lpa::testing::analyze;

    namespace {
        constexpr auto CHECKOUT =
            "<?php\n"
            "class CheckoutController\n"
            "{\n"
            "    public function store()\n"
            "    {\n"
            "        $user = auth()->user();\n"
            "        $cart = session('cart');\n"
            "        $total = collect($cart)->sum('price');\n"
            "        logger('checkout');\n"
            "        event('checkout.started');\n"
            "        return redirect(route('orders.show', $user->lastOrder()));\n"
            "    }\n"
            "}\n";
    }

    TEST(HelperFunctionAbuseAnalyzerTest, RepeatedCallsCount) {
        const auto issues = analyze<HelperFunctionAbuseAnalyzer>(CHECKOUT);

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].message, "Class 'CheckoutController' uses 7 helper function calls (threshold: 5)");
        EXPECT_EQ(issues[0].severity, Severity::Low);
        EXPECT_EQ(issues[0].location.line, 2u);
        EXPECT_EQ(issues[0].metadata["helpers"]["route"], 1);
        EXPECT_NE(issues[0].recommendation.find("auth() (1x), session() (1x)"), std::string::npos);
    }

    TEST(HelperFunctionAbuseAnalyzerTest, ThresholdAndHelperListAreConfigurable) {
        AnalyzerSettings settings(std::string(HelperFunctionAbuseAnalyzer::ID));
        settings.set("helper_functions", std::vector<std::string>{"auth"});
        settings.set("threshold", std::int64_t{0});

        const auto issues = analyze<HelperFunctionAbuseAnalyzer>(CHECKOUT, "app/Http/Controllers/CheckoutController.php",
                                                                 settings);

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].metadata["count"], 1);
    }

    TEST(HelperFunctionAbuseAnalyzerTest, TraitsAreCheckedAndFreeFunctionsIgnored) {
        const auto issues = analyze<HelperFunctionAbuseAnalyzer>(
            "<?php\n"
            "function boot() { app(); app(); app(); app(); app(); app(); }\n"
            "trait SendsNotices\n"
            "{\n"
            "    public function notice()\n"
            "    {\n"
            "        return tap(now(), fn () => info(today()) ?: report(optional(null)));\n"
            "    }\n"
            "}\n");

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].metadata["class"], "SendsNotices");
        EXPECT_EQ(issues[0].metadata["count"], 6);
    }

    TEST(HelperFunctionAbuseAnalyzerTest, MethodsWithTheSameNamePass) {
        const auto issues = analyze<HelperFunctionAbuseAnalyzer>(
            "<?php\n"
            "class Report\n"
            "{\n"
            "    public function build()\n"
            "    {\n"
            "        $this->view(); $this->route(); $this->config(); Cache::get('a'); $x->session(); $this->app();\n"
            "    }\n"
            "}\n");

        EXPECT_TRUE(issues.empty());
    }

}  // namespace lpa::analyzers
