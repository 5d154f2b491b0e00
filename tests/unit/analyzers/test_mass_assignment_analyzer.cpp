//
// Created by gregorian-rayne on 1/16/26.
//

#include "lpa/analyzers/mass_assignment_analyzer.hpp"

#include "support/analyzer_fixture.hpp"
#include "support/php_fixture.hpp"

#include <gtest/gtest.h>

namespace lpa::analyzers
{
    using lpa::testing::analyze;
    using lpa::testing::with_code;

    TEST(MassAssignmentAnalyzerTest, ModelWithoutProtection) {
        const auto issues = analyze<MassAssignmentAnalyzer>(
            "<?php\n"
            "namespace App\\Models;\n"
            "\n"
            "use Illuminate\\Database\\Eloquent\\Model;\n"
            "\n"
            "class Post extends Model\n"
            "{\n"
            "    protected $table = 'posts';\n"
            "}\n",
            "app/Models/Post.php");

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].code, "missing-model-protection");
        EXPECT_EQ(issues[0].severity, Severity::High);
        EXPECT_EQ(issues[0].location.line, 6u);
        EXPECT_EQ(issues[0].message, "Model 'Post' lacks mass assignment protection ($fillable or $guarded)");
    }

    TEST(MassAssignmentAnalyzerTest, EmptyGuardedIsCritical) {
        const auto issues = analyze<MassAssignmentAnalyzer>(
            "<?php\n"
            "class Post extends Model\n"
            "{\n"
            "    protected $guarded = [];\n"
            "}\n",
            "app/Models/Post.php");

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].code, "empty-guarded");
        EXPECT_EQ(issues[0].severity, Severity::Critical);
    }

    TEST(MassAssignmentAnalyzerTest, ProtectedModelsAndPlainClassesPass) {
        EXPECT_TRUE(analyze<MassAssignmentAnalyzer>(
            "<?php\n"
            "class Post extends Model\n"
            "{\n"
            "    protected $fillable = ['title', 'body'];\n"
            "}\n"
            "class Comment extends Model\n"
            "{\n"
            "    protected $guarded = ['*'];\n"
            "}\n"
            "class Mailer\n"
            "{\n"
            "    protected $queue = 'mail';\n"
            "}\n").empty());
    }

    TEST(MassAssignmentAnalyzerTest, ClassesUnderModelsNamespaceAreModels) {
        const auto issues = analyze<MassAssignmentAnalyzer>(
            "<?php\n"
            "namespace App\\Models;\n"
            "\n"
            "class Tag extends BaseRecord\n"
            "{\n"
            "}\n",
            "app/Models/Tag.php");

        EXPECT_EQ(with_code(issues, "missing-model-protection").size(), 1u);
    }

    TEST(MassAssignmentAnalyzerTest, RequestDataPassedToWrites) {
        const auto issues = analyze<MassAssignmentAnalyzer>(
            "<?php\n"
            "class PostController\n"
            "{\n"
            "    public function store(Request $request)\n"
            "    {\n"
            "        Post::create($request->all());\n"
            "        $post->fill(request()->input());\n"
            "        DB::table('posts')->insert(Request::all());\n"
            "        $post->update($request->except(['is_admin']));\n"
            "    }\n"
            "}\n",
            "app/Http/Controllers/PostController.php");

        ASSERT_EQ(issues.size(), 4u);
        for (const auto& issue : issues) {
            EXPECT_EQ(issue.code, "request-data");
            EXPECT_EQ(issue.severity, Severity::Critical);
        }
        EXPECT_EQ(issues[0].message,
                  "Static call to create() with unfiltered request data may result in mass assignment vulnerability");
        EXPECT_EQ(issues[1].message,
                  "Instance call to fill() with unfiltered request data may result in mass assignment vulnerability");
        EXPECT_EQ(issues[2].message,
                  "Query builder call to insert() with unfiltered request data may result in mass assignment vulnerability");
        EXPECT_EQ(issues[2].metadata["call_type"], "builder");
        EXPECT_EQ(issues[3].location.line, 9u);
    }

    TEST(MassAssignmentAnalyzerTest, FilteredRequestDataPasses) {
        EXPECT_TRUE(analyze<MassAssignmentAnalyzer>(
            "<?php\n"
            "class PostController\n"
            "{\n"
            "    public function update(Request $request, Post $post)\n"
            "    {\n"
            "        Post::create($request->validated());\n"
            "        $post->update($request->only(['title']));\n"
            "        $post->fill(['title' => $request->input('title')]);\n"
            "        $post->update($request->input('payload'));\n"
            "        $post->save($request->all());\n"
            "    }\n"
            "}\n",
            "app/Http/Controllers/PostController.php").empty());
    }

    TEST(MassAssignmentAnalyzerTest, Predicate) {
        const auto check = [](const std::string& expression) {
            const auto tree = lpa::testing::parse_php("<?php\n$x = " + expression + ";\n");
            const auto assignment = lpa::testing::find_first(tree.root(), "assignment_expression");
            return is_unfiltered_request_data(assignment.child_by_field("right"));
        };

        EXPECT_TRUE(check("request()->all()"));
        EXPECT_TRUE(check("$request->json()"));
        EXPECT_TRUE(check("Input::get()"));
        EXPECT_TRUE(check("\\Illuminate\\Http\\Request::post()"));
        EXPECT_FALSE(check("$request->input('name')"));
        EXPECT_FALSE(check("$data->all()"));
        EXPECT_FALSE(check("request('name')"));
    }

}  // namespace lpa::analyzers
