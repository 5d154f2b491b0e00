//
// Created by gregorian-rayne on 1/15/26.
//

/**
 * End-to-end workflow over a small Laravel project on disk:
 * configuration, discovery, model registry, analysis, baseline and export.
 */

#include "lpa/cli/workspace.hpp"
#include "lpa/analyzers/all_analyzers.hpp"
#include "lpa/config/config.hpp"
#include "lpa/exporters/exporter.hpp"
#include "lpa/report/baseline.hpp"
#include "lpa/utils/file_utils.hpp"

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

namespace lpa::test
{
    namespace {
        constexpr auto POST_MODEL =
            "<?php\n"
            "namespace App\\Models;\n"
            "\n"
            "use Illuminate\\Database\\Eloquent\\Model;\n"
            "\n"
            "class Post extends Model\n"
            "{\n"
            "    public function user()\n"
            "    {\n"
            "        return $this->belongsTo(User::class);\n"
            "    }\n"
            "}\n";

        constexpr auto POST_CONTROLLER =
            "<?php\n"
            "namespace App\\Http\\Controllers;\n"
            "\n"
            "use App\\Models\\Post;\n"
            "\n"
            "class PostController\n"
            "{\n"
            "    public function index()\n"
            "    {\n"
            "        $posts = Post::all();\n"
            "        foreach ($posts as $post) {\n"
            "            echo $post->user->name;\n"
            "        }\n"
            "        try {\n"
            "            $this->sync();\n"
            "        } catch (\\Exception $e) {\n"
            "            report($e);\n"
            "        }\n"
            "    }\n"
            "}\n";

        constexpr auto WEB_ROUTES =
            "<?php\n"
            "use Illuminate\\Support\\Facades\\DB;\n"
            "use Illuminate\\Support\\Facades\\Route;\n"
            "\n"
            "Route::get('/stats', function () {\n"
            "    return DB::table('posts')->count();\n"
            "});\n";

        constexpr auto CATCH_ALL =
            "<?php\n"
            "try {\n"
            "    run();\n"
            "} catch (\\Exception $e) {\n"
            "}\n";

        constexpr auto CONFIG =
            "[general]\n"
            "paths = [\"app\", \"routes\", \"vendor\"]\n"
            "\n"
            "[analyzers]\n"
            "disabled = [\"fat-model\"]\n"
            "\n"
            "[analyzers.generic-exception-catch]\n"
            "excluded_paths = [\"app/Legacy/*\"]\n"
            "\n"
            "[report]\n"
            "fail_on = \"critical\"\n"
            "dont_report = [\"select-asterisk\"]\n";
    }

    class FullAnalysisWorkflowTest : public ::testing::Test {
    protected:
        void SetUp() override {
            project_ = fs::temp_directory_path() / "lpa_workflow_project";
            fs::remove_all(project_);

            write("app/Models/Post.php", POST_MODEL);
            write("app/Http/Controllers/PostController.php", POST_CONTROLLER);
            write("app/Legacy/OldImporter.php", CATCH_ALL);
            write("routes/web.php", WEB_ROUTES);
            write("vendor/acme/lib/Client.php", CATCH_ALL);
            write("lpa.toml", CONFIG);

            analyzers::register_all_analyzers();
        }

        void TearDown() override {
            fs::remove_all(project_);
        }

        void write(const std::string& relative, const std::string& content) const {
            ASSERT_TRUE(file_utils::write_file(project_ / relative, content).is_ok());
        }

        [[nodiscard]] config::Config load_config() const {
            auto loaded = config::Config::load_from_file(project_ / "lpa.toml");
            EXPECT_TRUE(loaded.is_ok()) << loaded.error().to_string();
            auto config = loaded.is_ok() ? std::move(loaded).value() : config::Config::default_config();
            config.general.base_path = project_.string();
            return config;
        }

        fs::path project_;
    };

    TEST_F(FullAnalysisWorkflowTest, AnalyzesProject) {
        const auto config = load_config();

        auto report = cli::run_analysis(config, {});
        ASSERT_TRUE(report.is_ok()) << report.error().to_string();
        const auto& r = report.value();

        // vendor/ is excluded by default
        EXPECT_EQ(r.files_total, 4u);
        EXPECT_EQ(r.find("fat-model"), nullptr);

        const auto* n_plus_one = r.find("eloquent-n-plus-one");
        ASSERT_NE(n_plus_one, nullptr);
        ASSERT_EQ(n_plus_one->issues.size(), 1u);
        EXPECT_EQ(n_plus_one->issues[0].location.file, fs::path("app/Http/Controllers/PostController.php"));
        EXPECT_EQ(n_plus_one->issues[0].location.line, 12u);

        const auto* catches = r.find("generic-exception-catch");
        ASSERT_NE(catches, nullptr);
        ASSERT_EQ(catches->issues.size(), 1u);
        EXPECT_EQ(catches->issues[0].location.line, 16u);

        const auto* routes = r.find("logic-in-routes");
        ASSERT_NE(routes, nullptr);
        EXPECT_EQ(routes->files_analyzed, 1u);
        ASSERT_EQ(routes->issues.size(), 1u);
        EXPECT_EQ(routes->issues[0].code, "route-has-db-queries");

        const auto* select = r.find("select-asterisk");
        ASSERT_NE(select, nullptr);
        EXPECT_FALSE(select->reported);

        auto fail_on = config.fail_on_level();
        ASSERT_TRUE(fail_on.is_ok());
        EXPECT_TRUE(r.exceeds(fail_on.value()));
    }

    TEST_F(FullAnalysisWorkflowTest, RegistryFromModelPaths) {
        const auto config = load_config();

        const auto registry = cli::build_registry(config);

        EXPECT_EQ(registry.size(), 1u);
        EXPECT_TRUE(registry.is_model("App\\Models\\Post"));
    }

    TEST_F(FullAnalysisWorkflowTest, BaselineSilencesKnownIssues) {
        const auto config = load_config();
        const auto baseline_path = config.resolve(config.report.baseline_file);

        auto first = cli::run_analysis(config, {});
        ASSERT_TRUE(first.is_ok());
        const auto baseline = report::Baseline::from_report(first.value());
        ASSERT_TRUE(baseline.save(baseline_path, std::chrono::system_clock::now()).is_ok());

        auto second = cli::run_analysis(config, {});
        ASSERT_TRUE(second.is_ok());
        auto loaded = report::Baseline::load(baseline_path);
        ASSERT_TRUE(loaded.is_ok());

        auto filtered = std::move(second).value();
        EXPECT_EQ(loaded.value().filter(filtered), baseline.size());
        EXPECT_EQ(filtered.total_issues(), 0u);
        EXPECT_FALSE(filtered.exceeds(Severity::Low));
    }

    TEST_F(FullAnalysisWorkflowTest, OnlySelectedAnalyzers) {
        const auto config = load_config();
        cli::RunOptions options;
        options.only = {"logic-in-routes"};
        options.threads = 1;

        auto report = cli::run_analysis(config, options);

        ASSERT_TRUE(report.is_ok());
        ASSERT_EQ(report.value().results.size(), 1u);
        EXPECT_EQ(report.value().results[0].rule_id, "logic-in-routes");

        options.only = {"no-such-rule"};
        auto unknown = cli::run_analysis(config, options);
        ASSERT_TRUE(unknown.is_err());
        EXPECT_EQ(unknown.error().code(), ErrorCode::InvalidArgument);
    }

    TEST_F(FullAnalysisWorkflowTest, ExportsReportedAnalyzers) {
        const auto config = load_config();
        auto report = cli::run_analysis(config, {});
        ASSERT_TRUE(report.is_ok());

        const auto out = project_ / "reports" / "lpa.json";
        auto exporter = exporters::ExporterFactory::create_for_file(out);
        ASSERT_TRUE(exporter.is_ok());
        ASSERT_TRUE(exporter.value()->export_to_file(out, report.value(), {}).is_ok());

        auto content = file_utils::read_file(out);
        ASSERT_TRUE(content.is_ok());
        const auto doc = nlohmann::json::parse(content.value());
        for (const auto& analyzer : doc["analyzers"]) {
            EXPECT_NE(analyzer["id"], "select-asterisk");
        }
        EXPECT_EQ(doc["summary"]["files"], 4);
    }

}  // namespace lpa::test
