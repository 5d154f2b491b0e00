//
// Created by gregorian-rayne on 1/14/26.
//

#include "lpa/config/config.hpp"
#include "lpa/analyzers/n_plus_one_analyzer.hpp"
#include "lpa/analyzers/sql_injection_analyzer.hpp"
#include "lpa/analyzers/fat_model_analyzer.hpp"

#include <gtest/gtest.h>

namespace lpa::config
{
    TEST(ConfigTest, Defaults) {
        const auto config = Config::default_config();

        EXPECT_EQ(config.general.base_path, ".");
        EXPECT_EQ(config.general.paths, (std::vector<std::string>{"app", "config", "database", "routes"}));
        EXPECT_EQ(config.report.fail_on, "high");
        EXPECT_FALSE(config.models.cache);
        EXPECT_TRUE(config.validate().is_ok());
    }

    TEST(ConfigTest, LoadSections) {
        auto config = Config::load_from_string(R"(
[general]
base_path = "/srv/shop"
paths = ["app"]
threads = 4

[models]
base_classes = ["App\\Models\\BaseModel"]
table_mappings = { "App\\Models\\Person" = "people" }
cache = true

[analyzers]
disabled = ["select-asterisk"]

[report]
fail_on = "critical"
dont_report = ["fat-model"]
format = "json"

[logging]
level = "debug"
)");

        ASSERT_TRUE(config.is_ok()) << config.error().to_string();
        const auto& c = config.value();
        EXPECT_EQ(c.general.base_path, "/srv/shop");
        EXPECT_EQ(c.general.paths, std::vector<std::string>{"app"});
        EXPECT_EQ(c.general.threads, 4);
        EXPECT_EQ(c.models.base_classes, std::vector<std::string>{"App\\Models\\BaseModel"});
        EXPECT_EQ(c.models.table_mappings.at("App\\Models\\Person"), "people");
        EXPECT_TRUE(c.models.cache);
        EXPECT_EQ(c.analyzers.disabled, std::vector<std::string>{"select-asterisk"});
        EXPECT_EQ(c.report.dont_report, std::vector<std::string>{"fat-model"});
        EXPECT_EQ(c.logging.level, "debug");

        auto fail_on = c.fail_on_level();
        ASSERT_TRUE(fail_on.is_ok());
        EXPECT_EQ(fail_on.value(), Severity::Critical);

        auto format = c.output_format();
        ASSERT_TRUE(format.is_ok());
        EXPECT_EQ(format.value(), OutputFormat::Json);
    }

    TEST(ConfigTest, AnalyzerSettingsTables) {
        auto config = Config::load_from_string(R"(
[analyzers.fat-model]
method_threshold = 20
excluded_paths = ["app/Legacy/*"]
)");

        ASSERT_TRUE(config.is_ok()) << config.error().to_string();

        const auto settings = config.value().settings_for(analyzers::FatModelAnalyzer::ID);
        EXPECT_EQ(settings.rule_id(), "fat-model");
        auto threshold = settings.get_count("method_threshold", 15);
        ASSERT_TRUE(threshold.is_ok());
        EXPECT_EQ(threshold.value(), 20u);

        auto excluded = settings.get_strings("excluded_paths");
        ASSERT_TRUE(excluded.is_ok());
        EXPECT_EQ(excluded.value(), std::vector<std::string>{"app/Legacy/*"});

        const auto other = config.value().settings_for("sql-injection");
        EXPECT_EQ(other.rule_id(), "sql-injection");
        EXPECT_TRUE(other.empty());
    }

    TEST(ConfigTest, ReportsEveryProblem) {
        auto config = Config::load_from_string(R"(
[general]
threads = -1
paths = "app"

[report]
fail_on = "sometimes"
)");

        ASSERT_TRUE(config.is_err());
        EXPECT_EQ(config.error().code(), ErrorCode::ConfigError);
        const auto& message = config.error().message();
        EXPECT_NE(message.find("general.threads must be non-negative"), std::string::npos);
        EXPECT_NE(message.find("general.paths must be an array of strings"), std::string::npos);
        EXPECT_NE(message.find("report.fail_on"), std::string::npos);
    }

    TEST(ConfigTest, UnknownCategoryAndFormat) {
        Config config;
        config.analyzers.categories = {"style"};
        config.report.format = "html";

        auto valid = config.validate();

        ASSERT_TRUE(valid.is_err());
        EXPECT_NE(valid.error().message().find("unknown category \"style\""), std::string::npos);
        EXPECT_NE(valid.error().message().find("report.format"), std::string::npos);
    }

    TEST(ConfigTest, MalformedToml) {
        auto config = Config::load_from_string("[general\npaths = [");

        ASSERT_TRUE(config.is_err());
        EXPECT_EQ(config.error().code(), ErrorCode::ParseError);
    }

    TEST(ConfigTest, MissingFile) {
        auto config = Config::load_from_file("/nonexistent/lpa.toml");

        ASSERT_TRUE(config.is_err());
        EXPECT_EQ(config.error().code(), ErrorCode::IoError);
    }

    TEST(ConfigTest, EnabledAnalyzers) {
        Config config;
        const analyzers::NPlusOneAnalyzer n_plus_one;
        const analyzers::SqlInjectionAnalyzer sql_injection;

        EXPECT_TRUE(config.is_enabled(n_plus_one));
        EXPECT_TRUE(config.is_enabled(sql_injection));

        config.analyzers.categories = {"performance"};
        EXPECT_TRUE(config.is_enabled(n_plus_one));
        EXPECT_FALSE(config.is_enabled(sql_injection));

        config.analyzers.disabled = {std::string(analyzers::NPlusOneAnalyzer::ID)};
        EXPECT_FALSE(config.is_enabled(n_plus_one));
    }

    TEST(ConfigTest, ResolvePaths) {
        Config config;
        config.general.base_path = "/srv/shop";

        EXPECT_EQ(config.resolve("lpa-baseline.json"), fs::path("/srv/shop/lpa-baseline.json"));
        EXPECT_EQ(config.resolve("/tmp/out.json"), fs::path("/tmp/out.json"));
    }

    TEST(ConfigTest, RenderedConfigLoadsBack) {
        Config config;
        config.general.paths = {"app", "routes"};
        config.models.table_mappings = {{"App\\Models\\Person", "people"}};
        config.report.fail_on = "never";
        analyzers::AnalyzerSettings settings("fat-model");
        settings.set("method_threshold", std::int64_t{25});
        config.analyzers.settings.emplace("fat-model", settings);

        auto loaded = Config::load_from_string(config.to_string());

        ASSERT_TRUE(loaded.is_ok()) << loaded.error().to_string();
        EXPECT_EQ(loaded.value().general.paths, config.general.paths);
        EXPECT_EQ(loaded.value().models.table_mappings, config.models.table_mappings);
        EXPECT_EQ(loaded.value().report.fail_on, "never");
        auto threshold = loaded.value().settings_for("fat-model").get_count("method_threshold", 15);
        ASSERT_TRUE(threshold.is_ok());
        EXPECT_EQ(threshold.value(), 25u);
    }

    TEST(OutputFormatTest, Names) {
        EXPECT_EQ(output_format_from_string("md"), OutputFormat::Markdown);
        EXPECT_EQ(output_format_from_string("text"), OutputFormat::Text);
        EXPECT_FALSE(output_format_from_string("xml").has_value());
        EXPECT_STREQ(to_string(OutputFormat::Json), "json");
    }

}  // namespace lpa::config
