//
// Created by gregorian-rayne on 1/16/26.
//

#include "lpa/analyzers/raw_eloquent_avoidance_analyzer.hpp"

#include "support/analyzer_fixture.hpp"

#include <gtest/gtest.h>

namespace lpa::analyzers
{
    using lpa::testing::analyze;
    using lpa::testing::with_code;

    TEST(RawEloquentAvoidanceAnalyzerTest, SimpleRawAggregate) {
        const auto issues = analyze<RawEloquentAvoidanceAnalyzer>(
            "<?php\n"
            "$total = DB::table('orders')->select(DB::raw('COUNT(*)'))->first();\n"
            "$sum = DB::raw('sum(amount)');\n");

        ASSERT_EQ(issues.size(), 2u);
        EXPECT_EQ(issues[0].code, "raw-aggregate");
        EXPECT_EQ(issues[0].message, "Using DB::raw() for simple query that could use Eloquent methods");
        EXPECT_NE(issues[0].recommendation.find("Model::count()"), std::string::npos);
        EXPECT_NE(issues[1].recommendation.find("Model::sum('column')"), std::string::npos);
    }

    TEST(RawEloquentAvoidanceAnalyzerTest, SimpleSelectAndModifications) {
        const auto issues = analyze<RawEloquentAvoidanceAnalyzer>(
            "<?php\n"
            "$users = DB::select('select * from users where id = ?', [$id]);\n"
            "DB::insert('insert into users (name) values (?)', [$name]);\n"
            "DB::update('update users set votes = 100 where name = ?', [$name]);\n"
            "DB::delete('delete from users where id = ?', [$id]);\n");

        ASSERT_EQ(issues.size(), 4u);
        ASSERT_EQ(with_code(issues, "raw-select").size(), 1u);
        EXPECT_EQ(with_code(issues, "raw-select")[0].message, "Simple SELECT query using DB::select() could use Eloquent");

        const auto modifications = with_code(issues, "raw-modification");
        ASSERT_EQ(modifications.size(), 3u);
        EXPECT_EQ(modifications[0].message, "Simple INSERT query could use Eloquent");
        EXPECT_EQ(modifications[1].message, "Simple UPDATE query could use Eloquent");
        EXPECT_EQ(modifications[2].message, "Simple DELETE query could use Eloquent");
    }

    TEST(RawEloquentAvoidanceAnalyzerTest, ComplexQueriesPass) {
        const auto issues = analyze<RawEloquentAvoidanceAnalyzer>(
            "<?php\n"
            "DB::select('select u.* from users u join teams t on t.id = u.team_id');\n"
            "DB::raw('count(distinct user_id)');\n"
            "DB::update('update users set team_id = (select id from teams limit 1)');\n"
            "DB::select($sql);\n");

        EXPECT_TRUE(issues.empty());
    }

    TEST(RawEloquentAvoidanceAnalyzerTest, Classifiers) {
        EXPECT_TRUE(is_simple_aggregate("  MAX( price ) "));
        EXPECT_FALSE(is_simple_aggregate("max(price) + 1"));
        EXPECT_TRUE(is_simple_select("SELECT id, name FROM users"));
        EXPECT_FALSE(is_simple_select("select * from users where active = 1"));
        EXPECT_TRUE(is_simple_modification("DELETE FROM sessions WHERE user_id = ?"));
        EXPECT_FALSE(is_simple_modification("delete from sessions"));
    }
}
