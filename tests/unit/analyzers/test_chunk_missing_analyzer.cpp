//
// Created by gregorian-rayne on 1/16/26.
//

#include "lpa/analyzers/chunk_missing_analyzer.hpp"

#include "support/analyzer_fixture.hpp"

#include <gtest/gtest.h>

namespace lpa::analyzers
{
    using lpa::testing::analyze;

    namespace {
        std::string in_method(const std::string& body) {
            return "<?php\n"
                   "class ReportService\n"
                   "{\n"
                   "    public function run()\n"
                   "    {\n" +
                   body +
                   "    }\n"
                   "}\n";
        }
    }

    TEST(ChunkMissingAnalyzerTest, LoopOverAllDirectly) {
        const auto issues = analyze<ChunkMissingAnalyzer>(in_method(
            "        foreach (User::all() as $user) {\n"
            "            $user->notify();\n"
            "        }\n"));

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].code, "loop-without-chunk");
        EXPECT_EQ(issues[0].severity, Severity::High);
        EXPECT_EQ(issues[0].location.line, 6u);
        EXPECT_EQ(issues[0].metadata["method"], "all");
    }

    TEST(ChunkMissingAnalyzerTest, LoopOverAssignedGet) {
        const auto issues = analyze<ChunkMissingAnalyzer>(in_method(
            "        $orders = Order::where('paid', true)->get();\n"
            "        foreach ($orders as $order) {\n"
            "            $order->archive();\n"
            "        }\n"));

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].code, "loop-over-unbounded-variable");
        EXPECT_EQ(issues[0].metadata["variable"], "$orders");
        EXPECT_EQ(issues[0].metadata["assigned_line"], 6);
        EXPECT_EQ(issues[0].location.line, 7u);
    }

    TEST(ChunkMissingAnalyzerTest, StreamingAndBoundedQueriesPass) {
        const auto issues = analyze<ChunkMissingAnalyzer>(in_method(
            "        foreach (User::cursor() as $user) {}\n"
            "        foreach (User::where('active', true)->take(10)->get() as $user) {}\n"
            "        foreach (User::latest()->limit(5)->get() as $user) {}\n"
            "        User::chunk(100, function ($users) {\n"
            "            foreach ($users as $user) {}\n"
            "        });\n"));

        EXPECT_TRUE(issues.empty());
    }

    TEST(ChunkMissingAnalyzerTest, CollectionAllIsNotAQuery) {
        const auto issues = analyze<ChunkMissingAnalyzer>(in_method(
            "        foreach ($this->items->all() as $item) {}\n"
            "        foreach ($collection->all() as $item) {}\n"));

        EXPECT_TRUE(issues.empty());
    }

    TEST(ChunkMissingAnalyzerTest, ReassignmentClearsVariable) {
        const auto issues = analyze<ChunkMissingAnalyzer>(in_method(
            "        $users = User::all();\n"
            "        $users = $users->take(3);\n"
            "        foreach ($users as $user) {}\n"));

        EXPECT_TRUE(issues.empty());
    }

    TEST(ChunkMissingAnalyzerTest, AssignmentsDoNotLeakAcrossMethods) {
        const auto issues = analyze<ChunkMissingAnalyzer>(
            "<?php\n"
            "class Sync\n"
            "{\n"
            "    public function load()\n"
            "    {\n"
            "        $rows = Row::all();\n"
            "        return $rows;\n"
            "    }\n"
            "\n"
            "    public function run(array $rows)\n"
            "    {\n"
            "        foreach ($rows as $row) {}\n"
            "    }\n"
            "}\n");

        EXPECT_TRUE(issues.empty());
    }

    TEST(ChunkMissingAnalyzerTest, OuterAssignmentSurvivesClosure) {
        const auto issues = analyze<ChunkMissingAnalyzer>(in_method(
            "        $users = User::all();\n"
            "        $format = function ($user) { return $user->name; };\n"
            "        foreach ($users as $user) {}\n"));

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].metadata["variable"], "$users");
    }
}
