//
// Created by gregorian-rayne on 1/12/26.
//

#include "lpa/types.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

namespace lpa
{
    TEST(SeverityTest, RoundTripNames) {
        for (const auto severity : {Severity::Low, Severity::Medium, Severity::High, Severity::Critical}) {
            EXPECT_EQ(severity_from_string(to_string(severity)), severity);
        }
        EXPECT_FALSE(severity_from_string("HIGH").has_value());
        EXPECT_FALSE(severity_from_string("never").has_value());
    }

    TEST(SeverityTest, Ordered) {
        EXPECT_LT(Severity::Low, Severity::Medium);
        EXPECT_LT(Severity::High, Severity::Critical);
    }

    TEST(CategoryTest, Names) {
        EXPECT_STREQ(to_string(Category::BestPractices), "best-practices");
        EXPECT_EQ(category_from_string("security"), Category::Security);
        EXPECT_FALSE(category_from_string("style").has_value());
    }

    TEST(StatusTest, Names) {
        EXPECT_STREQ(to_string(Status::Passed), "passed");
        EXPECT_STREQ(to_string(Status::Skipped), "skipped");
    }

    TEST(IssueTest, OrderByFileLineMessage) {
        auto make = [](std::string file, const std::size_t line, std::string message) {
            Issue issue;
            issue.location.file = std::move(file);
            issue.location.line = line;
            issue.message = std::move(message);
            return issue;
        };

        std::vector<Issue> issues = {
            make("b.php", 1, "x"),
            make("a.php", 9, "x"),
            make("a.php", 2, "z"),
            make("a.php", 2, "y"),
        };
        std::ranges::sort(issues, issue_less);

        EXPECT_EQ(issues[0].message, "y");
        EXPECT_EQ(issues[1].message, "z");
        EXPECT_EQ(issues[2].location.line, 9u);
        EXPECT_EQ(issues[3].location.file, fs::path("b.php"));
    }

    TEST(SourceLocationTest, HasLocation) {
        SourceLocation location;
        EXPECT_FALSE(location.has_location());

        location.file = "routes/web.php";
        location.line = 4;
        EXPECT_TRUE(location.has_location());
    }
}
