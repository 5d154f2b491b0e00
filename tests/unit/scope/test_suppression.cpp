//
// Created by gregorian-rayne on 1/14/26.
//

#include "lpa/scope/suppression.hpp"

#include "support/php_fixture.hpp"

#include <gtest/gtest.h>

namespace lpa::scope
{
    using lpa::testing::find_first;
    using lpa::testing::parse_php;

    TEST(RuleSetTest, MarkerWithoutRulesCoversAll) {
        const auto rules = RuleSet::parse_marker("// @lpa-ignore");

        ASSERT_TRUE(rules.has_value());
        EXPECT_TRUE(rules->all);
        EXPECT_TRUE(rules->covers("sql-injection"));
    }

    TEST(RuleSetTest, MarkerWithRules) {
        const auto rules = RuleSet::parse_marker("/* @lpa-ignore sql-injection, fat-model-detection */");

        ASSERT_TRUE(rules.has_value());
        EXPECT_FALSE(rules->all);
        EXPECT_TRUE(rules->covers("sql-injection"));
        EXPECT_TRUE(rules->covers("fat-model-detection"));
        EXPECT_FALSE(rules->covers("eloquent-n-plus-one"));
    }

    TEST(RuleSetTest, NoMarker) {
        EXPECT_FALSE(RuleSet::parse_marker("// just a comment").has_value());
        EXPECT_FALSE(RuleSet::parse_marker("// @lpa-ignored").has_value());
    }

    TEST(RuleSetTest, Merge) {
        RuleSet rules;
        rules.rules.insert("a");

        RuleSet other;
        other.all = true;
        rules.merge(other);

        EXPECT_TRUE(rules.all);
        EXPECT_TRUE(rules.covers("b"));
    }

    TEST(SuppressionIndexTest, FileHeader) {
        const auto tree = parse_php(
            "<?php\n"
            "// @lpa-ignore select-asterisk\n"
            "namespace App;\n"
            "$x = 1;\n");

        const auto index = SuppressionIndex::build(tree);

        EXPECT_TRUE(index.file_rules().covers("select-asterisk"));
        EXPECT_FALSE(index.file_rules().covers("sql-injection"));
    }

    TEST(SuppressionIndexTest, ClassMarker) {
        const auto tree = parse_php(
            "<?php\n"
            "namespace App;\n"
            "/** @lpa-ignore fat-model-detection */\n"
            "class Order extends Model {}\n");

        const auto index = SuppressionIndex::build(tree);
        const auto* rules = index.class_rules(find_first(tree.root(), "class_declaration"));

        ASSERT_NE(rules, nullptr);
        EXPECT_TRUE(rules->covers("fat-model-detection"));
        EXPECT_TRUE(index.file_rules().empty());
    }

    TEST(SuppressionIndexTest, LineMarkerCoversNextLine) {
        const auto tree = parse_php(
            "<?php\n"
            "$a = 1;\n"
            "// @lpa-ignore sql-injection\n"
            "DB::select(\"SELECT * FROM users WHERE id = $id\");\n"
            "DB::select(\"SELECT * FROM users WHERE id = $id\");\n");

        const auto index = SuppressionIndex::build(tree);

        EXPECT_TRUE(index.line_suppressed("sql-injection", 3));
        EXPECT_TRUE(index.line_suppressed("sql-injection", 4));
        EXPECT_FALSE(index.line_suppressed("sql-injection", 5));
        EXPECT_FALSE(index.line_suppressed("select-asterisk", 4));
    }
}
