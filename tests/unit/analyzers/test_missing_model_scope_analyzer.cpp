//
// Created by gregorian-rayne on 1/16/26.
//

#include "lpa/analyzers/missing_model_scope_analyzer.hpp"

#include "support/analyzer_fixture.hpp"

#include <gtest/gtest.h>

namespace lpa::analyzers
{
    using lpa::testing::analyze;

    TEST(MissingModelScopeAnalyzerTest, RepeatedWherePairIsReportedOnce) {
        const auto issues = analyze<MissingModelScopeAnalyzer>(
            "<?php\n"
            "class OrderService\n"
            "{\n"
            "    public function open()\n"
            "    {\n"
            "        return Order::where('status', 'open')->where('paid', true)->get();\n"
            "    }\n"
            "\n"
            "    public function countOpen()\n"
            "    {\n"
            "        return Order::where('status', 'open')->where('paid', true)->count();\n"
            "    }\n"
            "}\n");

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].severity, Severity::Low);
        EXPECT_EQ(issues[0].location.line, 6u);
        EXPECT_EQ(issues[0].message,
                  "Query pattern \"where('status', 'open', ...)->where('paid', 'true', ...)\" "
                  "appears 2 times across the codebase");
        EXPECT_EQ(issues[0].metadata["signature"], "where(status,open)->where(paid,true)");
        EXPECT_EQ(issues[0].metadata["occurrences"], 2);
        EXPECT_NE(issues[0].recommendation.find("Example.php:6, Example.php:11"), std::string::npos);
    }

    TEST(MissingModelScopeAnalyzerTest, SubChainOfLongerQueryMatches) {
        const auto issues = analyze<MissingModelScopeAnalyzer>(
            "<?php\n"
            "$a = User::where('active', 1)->whereNotNull('email_verified_at')->get();\n"
            "$b = User::where('role', 'admin')->where('active', 1)->whereNotNull('email_verified_at')->orderBy('name')->get();\n");

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].location.line, 2u);
        EXPECT_EQ(issues[0].metadata["signature"], "where(active,1)->whereNotNull(email_verified_at)");
    }

    TEST(MissingModelScopeAnalyzerTest, SingleOccurrencesAndSingleWheresPass) {
        const auto issues = analyze<MissingModelScopeAnalyzer>(
            "<?php\n"
            "$a = User::where('active', 1)->get();\n"
            "$b = User::where('active', 1)->first();\n"
            "$c = Post::where('published', true)->where('featured', true)->get();\n"
            "$d = Post::where('published', true)->where('pinned', true)->get();\n");

        EXPECT_TRUE(issues.empty());
    }

    TEST(MissingModelScopeAnalyzerTest, TerminalChainCountsOnce) {
        const auto issues = analyze<MissingModelScopeAnalyzer>(
            "<?php\n"
            "$total = Invoice::where('due', true)->where('paid', false)->get()->count();\n");

        EXPECT_TRUE(issues.empty());
    }

    TEST(MissingModelScopeAnalyzerTest, VariableArgumentsAreLeftOut) {
        const auto issues = analyze<MissingModelScopeAnalyzer>(
            "<?php\n"
            "$mine = Task::where('user_id', $user->id)->where('done', false)->get();\n"
            "$theirs = Task::where('user_id', $other)->where('done', false)->get();\n");

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].metadata["signature"], "where(user_id)->where(done,false)");
        EXPECT_EQ(issues[0].metadata["pattern"], "where('user_id', ...)->where('done', 'false', ...)");
    }

}  // namespace lpa::analyzers
