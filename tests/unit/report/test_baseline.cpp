//
// Created by gregorian-rayne on 1/15/26.
//

#include "lpa/report/baseline.hpp"
#include "lpa/utils/file_utils.hpp"

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

namespace lpa::report
{
    namespace {
        Issue make_issue(const std::string& rule, const std::string& file, const std::size_t line,
                         const std::string& message) {
            Issue issue;
            issue.rule_id = rule;
            issue.severity = Severity::High;
            issue.message = message;
            issue.location.file = file;
            issue.location.line = line;
            issue.location.end_line = line;
            return issue;
        }

        engine::AnalysisReport make_report() {
            engine::AnalysisReport report;

            engine::AnalyzerResult sql;
            sql.rule_id = "sql-injection";
            sql.failing_severity = Severity::High;
            sql.files_analyzed = 2;
            sql.issues.push_back(make_issue("sql-injection", "app/A.php", 4, "Possible SQL injection in DB::select()"));
            sql.issues.push_back(make_issue("sql-injection", "app/B.php", 9, "Possible SQL injection in DB::select()"));
            sql.refresh_status();
            report.results.push_back(std::move(sql));

            engine::AnalyzerResult hidden;
            hidden.rule_id = "fat-model";
            hidden.reported = false;
            hidden.files_analyzed = 1;
            hidden.issues.push_back(make_issue("fat-model", "app/Models/Order.php", 7, "Model is large"));
            hidden.refresh_status();
            report.results.push_back(std::move(hidden));

            return report;
        }
    }

    TEST(BaselineTest, HashDependsOnLocationAndMessage) {
        const auto issue = make_issue("sql-injection", "app/A.php", 4, "msg");
        auto moved = issue;
        moved.location.line = 5;
        auto other_rule = issue;
        other_rule.rule_id = "select-asterisk";

        EXPECT_EQ(Baseline::hash_issue(issue).size(), 64u);
        EXPECT_NE(Baseline::hash_issue(issue), Baseline::hash_issue(moved));
        EXPECT_EQ(Baseline::hash_issue(issue), Baseline::hash_issue(other_rule));
    }

    TEST(BaselineTest, FromReportSkipsUnreportedRules) {
        const auto baseline = Baseline::from_report(make_report());

        EXPECT_EQ(baseline.size(), 2u);
        EXPECT_EQ(baseline.entries().count("fat-model"), 0u);
        ASSERT_EQ(baseline.entries().at("sql-injection").size(), 2u);
        EXPECT_EQ(baseline.entries().at("sql-injection")[0].path, "app/A.php");
        EXPECT_EQ(baseline.entries().at("sql-injection")[0].line, 4u);
    }

    TEST(BaselineTest, FilterDropsKnownIssues) {
        Baseline baseline;
        const auto known = make_issue("sql-injection", "app/A.php", 4, "Possible SQL injection in DB::select()");
        baseline.add("sql-injection", BaselineEntry{"app/A.php", 4, known.message, Baseline::hash_issue(known)});

        auto report = make_report();
        const auto dropped = baseline.filter(report);

        EXPECT_EQ(dropped, 1u);
        const auto* sql = report.find("sql-injection");
        ASSERT_NE(sql, nullptr);
        ASSERT_EQ(sql->issues.size(), 1u);
        EXPECT_EQ(sql->issues[0].location.file, fs::path("app/B.php"));
        EXPECT_EQ(sql->status, Status::Failed);
    }

    TEST(BaselineTest, FilterEverythingPasses) {
        auto report = make_report();
        const auto baseline = Baseline::from_report(report);

        EXPECT_EQ(baseline.filter(report), 2u);
        EXPECT_EQ(report.find("sql-injection")->status, Status::Passed);
        EXPECT_EQ(report.find("fat-model")->issues.size(), 1u);
    }

    TEST(BaselineTest, AddIgnoresDuplicates) {
        Baseline baseline;

        EXPECT_TRUE(baseline.add("sql-injection", BaselineEntry{"app/A.php", 1, "m", "abc"}));
        EXPECT_FALSE(baseline.add("sql-injection", BaselineEntry{"app/A.php", 1, "m", "abc"}));
        EXPECT_TRUE(baseline.add("select-asterisk", BaselineEntry{"app/A.php", 1, "m", "abc"}));
        EXPECT_EQ(baseline.size(), 2u);
        EXPECT_TRUE(baseline.contains("select-asterisk", "abc"));
        EXPECT_FALSE(baseline.contains("fat-model", "abc"));
    }

    TEST(BaselineTest, MergeKeepsExistingEntries) {
        Baseline previous;
        previous.add("sql-injection", BaselineEntry{"app/Old.php", 3, "old", "h1"});
        previous.add("sql-injection", BaselineEntry{"app/A.php", 1, "m", "h2"});

        Baseline current;
        current.add("sql-injection", BaselineEntry{"app/A.php", 1, "m", "h2"});
        current.add("fat-model", BaselineEntry{"app/Models/B.php", 2, "n", "h3"});

        EXPECT_EQ(current.merge(previous), 1u);
        EXPECT_EQ(current.size(), 3u);
        EXPECT_TRUE(current.contains("sql-injection", "h1"));
    }

    TEST(BaselineTest, ParseIgnoresEntriesWithoutHash) {
        auto baseline = Baseline::parse(R"({
            "generated_at": "2026-01-15T10:00:00Z",
            "errors": {
                "sql-injection": [
                    {"type": "hash", "path": "app/A.php", "line": 4, "message": "m", "hash": "h1"},
                    {"type": "hash", "path": "app/B.php", "line": 5, "message": "m"},
                    "not an object"
                ],
                "fat-model": "not a list"
            }
        })");

        ASSERT_TRUE(baseline.is_ok());
        EXPECT_EQ(baseline.value().size(), 1u);
        EXPECT_TRUE(baseline.value().contains("sql-injection", "h1"));
        EXPECT_EQ(baseline.value().entries().at("sql-injection")[0].line, 4u);
    }

    TEST(BaselineTest, ParseErrors) {
        auto malformed = Baseline::parse("{ not json");
        ASSERT_TRUE(malformed.is_err());
        EXPECT_EQ(malformed.error().code(), ErrorCode::ParseError);

        auto no_errors = Baseline::parse(R"({"version": "1.2.0"})");
        ASSERT_TRUE(no_errors.is_err());
        EXPECT_EQ(no_errors.error().code(), ErrorCode::ParseError);
    }

    TEST(BaselineTest, JsonLayout) {
        Baseline baseline;
        baseline.add("sql-injection", BaselineEntry{"app/B.php", 9, "second", "h2"});
        baseline.add("sql-injection", BaselineEntry{"app/A.php", 4, "first", "h1"});

        const auto json = nlohmann::json::parse(baseline.to_json(std::chrono::system_clock::now()));

        EXPECT_EQ(json["version"], "1.2.0");
        EXPECT_TRUE(json.contains("generated_at"));
        const auto& entries = json["errors"]["sql-injection"];
        ASSERT_EQ(entries.size(), 2u);
        EXPECT_EQ(entries[0]["path"], "app/A.php");
        EXPECT_EQ(entries[0]["type"], "hash");
        EXPECT_EQ(entries[1]["hash"], "h2");
    }

    class BaselineFileTest : public ::testing::Test {
    protected:
        void SetUp() override {
            path_ = fs::temp_directory_path() / "lpa_baseline_test" / ".lpa-baseline.json";
            fs::remove_all(path_.parent_path());
        }

        void TearDown() override {
            fs::remove_all(path_.parent_path());
        }

        fs::path path_;
    };

    TEST_F(BaselineFileTest, SaveThenLoad) {
        const auto saved = Baseline::from_report(make_report());

        ASSERT_TRUE(saved.save(path_, std::chrono::system_clock::now()).is_ok());
        auto loaded = Baseline::load(path_);

        ASSERT_TRUE(loaded.is_ok());
        EXPECT_EQ(loaded.value().size(), saved.size());
        auto report = make_report();
        EXPECT_EQ(loaded.value().filter(report), 2u);
    }

    TEST_F(BaselineFileTest, LoadMissingFile) {
        auto loaded = Baseline::load(path_);

        ASSERT_TRUE(loaded.is_err());
        EXPECT_EQ(loaded.error().code(), ErrorCode::NotFound);
    }

}  // namespace lpa::report
