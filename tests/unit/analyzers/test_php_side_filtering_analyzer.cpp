//
// Created by gregorian-rayne on 1/15/26.
//

#include "lpa/analyzers/php_side_filtering_analyzer.hpp"

#include "support/analyzer_fixture.hpp"

#include <gtest/gtest.h>

namespace lpa::analyzers
{
    using lpa::testing::analyze;

    TEST(PhpSideFilteringAnalyzerTest, FilterAfterAll) {
        const auto issues = analyze<PhpSideFilteringAnalyzer>(
            "<?php\n"
            "$active = User::all()->filter(fn ($user) => $user->active);\n");

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].code, "php-side-filtering");
        EXPECT_EQ(issues[0].severity, Severity::Critical);
        EXPECT_EQ(issues[0].metadata["pattern"], "all->filter");
        EXPECT_EQ(issues[0].metadata["fetch_method"], "all");
        EXPECT_EQ(issues[0].metadata["filter_method"], "filter");
        EXPECT_EQ(issues[0].message, "Filtering data in PHP instead of database: all->filter");
    }

    TEST(PhpSideFilteringAnalyzerTest, RejectAndWhereInOnVariables) {
        const auto issues = analyze<PhpSideFilteringAnalyzer>(
            "<?php\n"
            "$open = $query->where('team_id', 1)->get()->reject(fn ($o) => $o->closed);\n"
            "$mine = $this->orders->get()->whereIn('id', $ids);\n");

        ASSERT_EQ(issues.size(), 2u);
        EXPECT_EQ(issues[0].metadata["pattern"], "where->get->reject");
        EXPECT_NE(issues[0].recommendation.find("reject()"), std::string::npos);
        EXPECT_EQ(issues[1].metadata["filter_method"], "whereIn");
    }

    TEST(PhpSideFilteringAnalyzerTest, DatabaseFilteringPasses) {
        const auto issues = analyze<PhpSideFilteringAnalyzer>(
            "<?php\n"
            "$active = User::where('active', true)->get();\n"
            "$sorted = User::all()->sortBy('name');\n"
            "$items = collect($rows)->all()->filter();\n");

        EXPECT_TRUE(issues.empty());
    }

}  // namespace lpa::analyzers
