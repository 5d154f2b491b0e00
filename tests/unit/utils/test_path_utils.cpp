//
// Created by gregorian-rayne on 1/13/26.
//

#include "lpa/utils/path_utils.hpp"

#include <gtest/gtest.h>

namespace lpa::path_utils
{
    TEST(GlobMatchTest, StarCrossesDirectories) {
        EXPECT_TRUE(glob_match("vendor/laravel/framework/src/Model.php", "vendor/*"));
        EXPECT_TRUE(glob_match("app/Models/User.php", "*.php"));
        EXPECT_FALSE(glob_match("app/Models/User.php", "vendor/*"));
    }

    TEST(GlobMatchTest, Anchored) {
        EXPECT_FALSE(glob_match("app/vendor/x.php", "vendor/*"));
        EXPECT_TRUE(glob_match("app/vendor/x.php", "*vendor/*"));
    }

    TEST(GlobMatchTest, QuestionMarkAndCase) {
        EXPECT_TRUE(glob_match("App/Models/User.php", "app/models/use?.php"));
        EXPECT_FALSE(glob_match("app/Models/Users.php", "app/models/use?.php"));
    }

    TEST(GlobMatchTest, ClassNames) {
        EXPECT_TRUE(glob_match("ReportRepository", "*Repository"));
        EXPECT_FALSE(glob_match("ReportService", "*Repository"));
    }

    TEST(HasDirectoryTest, IgnoresFileName) {
        EXPECT_TRUE(has_directory("database/seeders/UserSeeder.php", "seeders"));
        EXPECT_TRUE(has_directory("tests/Feature/UserTest.php", "tests"));
        EXPECT_FALSE(has_directory("app/tests.php", "tests"));
        EXPECT_FALSE(has_directory("app/Tests/X.php", "tests"));
    }

    TEST(IsWithinDirectoryTest, MultiSegmentDirectories) {
        EXPECT_TRUE(is_within_directory("database/seeders/UserSeeder.php", "database/seeders"));
        EXPECT_TRUE(is_within_directory("modules/Billing/tests/InvoiceTest.php", "tests"));
        EXPECT_FALSE(is_within_directory("database/seeders.php", "database/seeders"));
        EXPECT_FALSE(is_within_directory("app/mytests/X.php", "tests"));
        EXPECT_FALSE(is_within_directory("tests", "tests"));
    }

    TEST(MakeRelativeTest, InsideAndOutside) {
        EXPECT_EQ(make_relative("/srv/app/app/Models/User.php", "/srv/app"), fs::path("app/Models/User.php"));
        EXPECT_EQ(make_relative("/etc/hosts", "/srv/app"), fs::path("/etc/hosts"));
    }

    TEST(ToForwardSlashesTest, Basic) {
        EXPECT_EQ(to_forward_slashes(fs::path("app/Http/Controllers")), "app/Http/Controllers");
    }
}
