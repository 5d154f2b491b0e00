//
// Created by gregorian-rayne on 1/16/26.
//

#include "lpa/analyzers/config_outside_config_analyzer.hpp"

#include "support/analyzer_fixture.hpp"

#include <gtest/gtest.h>

namespace lpa::analyzers
{
    using lpa::testing::analyze;

    TEST(ConfigOutsideConfigAnalyzerTest, HardcodedUrl) {
        const auto issues = analyze<ConfigOutsideConfigAnalyzer>(
            "<?php\n"
            "$response = Http::get('https://api.payments.test/v2/charges');\n");

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].code, "hardcoded-url");
        EXPECT_EQ(issues[0].severity, Severity::Medium);
        EXPECT_EQ(issues[0].message, "Hardcoded URL: \"https://api.payments.test/v2/charges\"");
        EXPECT_EQ(issues[0].location.line, 2u);
    }

    TEST(ConfigOutsideConfigAnalyzerTest, LongUrlIsShortenedInMessage) {
        const auto issues = analyze<ConfigOutsideConfigAnalyzer>(
            "<?php\n"
            "$url = \"https://hooks.internal.test/services/T00000000/B00000000/XXXXXXXXXXXXXXXXXXXXXXXX\";\n");

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].message, "Hardcoded URL: \"https://hooks.internal.test/services/T00000000/B00\"");
    }

    TEST(ConfigOutsideConfigAnalyzerTest, PossibleSecret) {
        const auto issues = analyze<ConfigOutsideConfigAnalyzer>(
            "<?php\n"
            "$client = new Client('sk4eC39HqLyjWDarjtT1zdp7dcsk4eC39Hq');\n"
            "$short = 'abcdefghijklmnopqrstuvwxyz';\n"
            "$sentence = 'this has spaces and is quite long enough to count';\n");

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].code, "hardcoded-secret");
        EXPECT_EQ(issues[0].severity, Severity::High);
    }

    TEST(ConfigOutsideConfigAnalyzerTest, DocumentationLinksAndConfigFilesPass) {
        const std::string source =
            "<?php\n"
            "// see https://laravel.com/docs\n"
            "$docs = 'https://laravel.com/docs/eloquent';\n"
            "$sample = 'https://example.com/callback';\n"
            "$dynamic = \"https://{$host}/api\";\n";

        EXPECT_TRUE(analyze<ConfigOutsideConfigAnalyzer>(source).empty());
        EXPECT_TRUE(analyze<ConfigOutsideConfigAnalyzer>(
            "<?php\nreturn ['url' => 'https://api.payments.test'];\n", "config/services.php").empty());
    }

    TEST(ConfigOutsideConfigAnalyzerTest, Predicates) {
        EXPECT_TRUE(is_hardcoded_url("http://internal.test"));
        EXPECT_FALSE(is_hardcoded_url("ftp://internal.test"));
        EXPECT_FALSE(is_hardcoded_url("https://github.com/laravel/framework"));
        EXPECT_TRUE(looks_like_secret("A1b2C3d4E5f6G7h8I9j0K1l2M3n4O5p6"));
        EXPECT_FALSE(looks_like_secret("A1b2C3d4E5f6G7h8I9j0-K1l2M3n4O5p6"));
    }

}  // namespace lpa::analyzers
