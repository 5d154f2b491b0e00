//
// Created by gregorian-rayne on 1/15/26.
//

#include "lpa/engine/report.hpp"

#include <gtest/gtest.h>

namespace lpa::engine
{
    namespace {
        Issue make_issue(const Severity severity, const std::size_t line = 1) {
            Issue issue;
            issue.rule_id = "test-rule";
            issue.severity = severity;
            issue.message = "Something";
            issue.location.file = "app/A.php";
            issue.location.line = line;
            issue.location.end_line = line;
            return issue;
        }

        AnalyzerResult make_result(const std::string& id, const Status status) {
            AnalyzerResult result;
            result.rule_id = id;
            result.name = id;
            result.status = status;
            return result;
        }
    }

    TEST(AnalyzerResultTest, SkippedWithoutFiles) {
        AnalyzerResult result;
        result.issues.push_back(make_issue(Severity::Critical));

        result.refresh_status();

        EXPECT_EQ(result.status, Status::Skipped);
    }

    TEST(AnalyzerResultTest, PassedWhenEveryFileWasSkipped) {
        AnalyzerResult result;
        result.files_skipped = 2;

        result.refresh_status();

        EXPECT_EQ(result.status, Status::Passed);
    }

    TEST(AnalyzerResultTest, PassedWithoutIssues) {
        AnalyzerResult result;
        result.files_analyzed = 3;

        result.refresh_status();

        EXPECT_EQ(result.status, Status::Passed);
    }

    TEST(AnalyzerResultTest, FailingSeverityDecidesStatus) {
        AnalyzerResult result;
        result.files_analyzed = 1;
        result.failing_severity = Severity::Medium;
        result.issues.push_back(make_issue(Severity::Low));

        result.refresh_status();
        EXPECT_EQ(result.status, Status::Warning);

        result.issues.push_back(make_issue(Severity::Medium, 2));
        result.refresh_status();
        EXPECT_EQ(result.status, Status::Failed);
    }

    TEST(AnalysisReportTest, ScoreCountsRanAnalyzers) {
        AnalysisReport report;
        report.results.push_back(make_result("a", Status::Passed));
        report.results.push_back(make_result("b", Status::Failed));
        report.results.push_back(make_result("c", Status::Passed));
        report.results.push_back(make_result("d", Status::Warning));
        report.results.push_back(make_result("e", Status::Skipped));

        EXPECT_DOUBLE_EQ(report.score(), 50.0);
        EXPECT_EQ(report.count(Status::Passed), 2u);
        EXPECT_EQ(report.count(Status::Skipped), 1u);
    }

    TEST(AnalysisReportTest, ScoreWithNothingRun) {
        AnalysisReport report;
        report.results.push_back(make_result("a", Status::Skipped));

        EXPECT_DOUBLE_EQ(report.score(), 100.0);
    }

    TEST(AnalysisReportTest, UnreportedResultsAreNotCounted) {
        AnalysisReport report;
        auto hidden = make_result("hidden", Status::Failed);
        hidden.reported = false;
        hidden.issues.push_back(make_issue(Severity::Critical));
        report.results.push_back(std::move(hidden));
        report.results.push_back(make_result("shown", Status::Passed));

        EXPECT_EQ(report.count(Status::Failed), 0u);
        EXPECT_EQ(report.total_issues(), 0u);
        EXPECT_DOUBLE_EQ(report.score(), 100.0);
        EXPECT_FALSE(report.exceeds(Severity::Low));
    }

    TEST(AnalysisReportTest, Exceeds) {
        AnalysisReport report;
        auto result = make_result("a", Status::Warning);
        result.issues.push_back(make_issue(Severity::Medium));
        report.results.push_back(std::move(result));

        EXPECT_TRUE(report.exceeds(Severity::Low));
        EXPECT_TRUE(report.exceeds(Severity::Medium));
        EXPECT_FALSE(report.exceeds(Severity::High));
        EXPECT_FALSE(report.exceeds(std::nullopt));
    }

    TEST(AnalysisReportTest, Find) {
        AnalysisReport report;
        report.results.push_back(make_result("sql-injection", Status::Passed));

        ASSERT_NE(report.find("sql-injection"), nullptr);
        EXPECT_EQ(report.find("sql-injection")->rule_id, "sql-injection");
        EXPECT_EQ(report.find("fat-model"), nullptr);
    }

    TEST(ParseFailOnTest, Levels) {
        auto never = parse_fail_on("never");
        ASSERT_TRUE(never.is_ok());
        EXPECT_FALSE(never.value().has_value());

        auto high = parse_fail_on("high");
        ASSERT_TRUE(high.is_ok());
        EXPECT_EQ(high.value(), Severity::High);

        auto bad = parse_fail_on("severe");
        ASSERT_TRUE(bad.is_err());
        EXPECT_EQ(bad.error().code(), ErrorCode::InvalidArgument);
    }

}  // namespace lpa::engine
