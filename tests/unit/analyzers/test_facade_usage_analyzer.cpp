//
// Created by gregorian-rayne on 1/16/26.
//

#include "lpa/analyzers/facade_usage_analyzer.hpp"

#include "support/analyzer_fixture.hpp"

#include <gtest/gtest.h>

namespace lpa::analyzers
{
    using lpa::testing::analyze;

    namespace {
        constexpr auto ORDER_PROCESSOR =
            "<?php\n"
            "namespace App\\Services;\n"
            "\n"
            "use Illuminate\\Support\\Facades\\Mail;\n"
            "\n"
            "class OrderProcessor\n"
            "{\n"
            "    public function process($id)\n"
            "    {\n"
            "        $order = DB::table('orders')->find($id);\n"
            "        Cache::put('order', $order, 3600);\n"
            "        Log::info('processing');\n"
            "        Event::dispatch('order.processing');\n"
            "        Mail::to($order->email)->send('confirmation');\n"
            "        Queue::push('invoice');\n"
            "        Log::info('done');\n"
            "        \\Illuminate\\Support\\Facades\\Cache::forget('order');\n"
            "    }\n"
            "}\n";
    }

    TEST(FacadeUsageAnalyzerTest, ClassOverThreshold) {
        const auto issues = analyze<FacadeUsageAnalyzer>(ORDER_PROCESSOR);

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].message, "Class 'OrderProcessor' uses 6 different facades (threshold: 5)");
        EXPECT_EQ(issues[0].severity, Severity::Low);
        EXPECT_EQ(issues[0].location.line, 6u);
        EXPECT_EQ(issues[0].metadata["facades"],
                  nlohmann::json({"DB", "Cache", "Log", "Event", "Mail", "Queue"}));
    }

    TEST(FacadeUsageAnalyzerTest, SeverityGrowsWithExcess) {
        AnalyzerSettings settings(std::string(FacadeUsageAnalyzer::ID));
        settings.set("threshold", std::int64_t{1});

        const auto issues = analyze<FacadeUsageAnalyzer>(ORDER_PROCESSOR, "app/Services/OrderProcessor.php", settings);

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].severity, Severity::High);
    }

    TEST(FacadeUsageAnalyzerTest, UnknownClassesAndTopLevelCallsDoNotCount) {
        const auto issues = analyze<FacadeUsageAnalyzer>(
            "<?php\n"
            "Route::get('/', fn () => view('home'));\n"
            "Cache::flush(); Log::info('x'); DB::select('1'); Auth::user(); Gate::allows('x'); Mail::raw('x');\n"
            "class Invoice\n"
            "{\n"
            "    public function total()\n"
            "    {\n"
            "        return Money::sum(Tax::rate(), Discount::apply(), Currency::of('EUR'), Rounding::up(), Fee::flat());\n"
            "    }\n"
            "}\n");

        EXPECT_TRUE(issues.empty());
    }

    TEST(FacadeUsageAnalyzerTest, NestedAnonymousClassIsCountedSeparately) {
        AnalyzerSettings settings(std::string(FacadeUsageAnalyzer::ID));
        settings.set("threshold", std::int64_t{2});

        const auto issues = analyze<FacadeUsageAnalyzer>(
            "<?php\n"
            "class Outer\n"
            "{\n"
            "    public function make()\n"
            "    {\n"
            "        Cache::get('a');\n"
            "        return new class {\n"
            "            public function run() { Log::info('a'); DB::select('1'); Auth::id(); }\n"
            "        };\n"
            "    }\n"
            "}\n",
            "app/Services/Outer.php", settings);

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].metadata["class"], "Anonymous");
        EXPECT_EQ(issues[0].location.line, 7u);
    }

}  // namespace lpa::analyzers
