//
// Created by gregorian-rayne on 1/15/26.
//

#include "lpa/analyzers/select_asterisk_analyzer.hpp"

#include "support/analyzer_fixture.hpp"

#include <gtest/gtest.h>

namespace lpa::analyzers
{
    using lpa::testing::analyze;

    TEST(SelectAsteriskAnalyzerTest, FetchWithoutSelect) {
        const auto issues = analyze<SelectAsteriskAnalyzer>(
            "<?php\n"
            "namespace App\\Http\\Controllers;\n"
            "use App\\Models\\User;\n"
            "$users = User::where('active', true)->get();\n"
            "$all = User::all();\n");

        ASSERT_EQ(issues.size(), 2u);
        EXPECT_EQ(issues[0].code, "select-asterisk");
        EXPECT_EQ(issues[0].severity, Severity::Low);
        EXPECT_EQ(issues[0].metadata["method"], "get");
        EXPECT_EQ(issues[0].metadata["model"], "App\\Models\\User");
        EXPECT_EQ(issues[1].message, "Query using ->all() without ->select() fetches all columns");
    }

    TEST(SelectAsteriskAnalyzerTest, SelectedColumnsPass) {
        const auto issues = analyze<SelectAsteriskAnalyzer>(
            "<?php\n"
            "$users = User::select('id', 'name')->get();\n"
            "$emails = User::where('active', true)->pluck('email');\n"
            "$first = User::where('id', 1)->first(['id', 'email']);\n"
            "$rows = User::all(['id']);\n");

        EXPECT_TRUE(issues.empty());
    }

    TEST(SelectAsteriskAnalyzerTest, NonModelChainsPass) {
        const auto issues = analyze<SelectAsteriskAnalyzer>(
            "<?php\n"
            "$jobs = DB::table('jobs')->get();\n"
            "$items = collect($rows)->all();\n"
            "$value = Cache::get('key');\n");

        EXPECT_TRUE(issues.empty());
    }

    TEST(SelectAsteriskAnalyzerTest, FileHeaderSuppression) {
        const auto issues = analyze<SelectAsteriskAnalyzer>(
            "<?php\n"
            "// @lpa-ignore select-asterisk\n"
            "$users = User::all();\n");

        EXPECT_TRUE(issues.empty());
    }

}  // namespace lpa::analyzers
