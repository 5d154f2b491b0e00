//
// Created by gregorian-rayne on 1/15/26.
//

#include "lpa/analyzers/n_plus_one_analyzer.hpp"

#include "support/analyzer_fixture.hpp"

#include <gtest/gtest.h>

namespace lpa::analyzers
{
    using lpa::testing::analyze;
    using lpa::testing::with_code;

    namespace {
        std::string in_method(const std::string& body) {
            return "<?php\n"
                   "class PostController\n"
                   "{\n"
                   "    public function index()\n"
                   "    {\n" +
                   body +
                   "    }\n"
                   "}\n";
        }
    }

    TEST(NPlusOneAnalyzerTest, LazyRelationInLoop) {
        const auto issues = analyze<NPlusOneAnalyzer>(in_method(
            "        $posts = Post::all();\n"
            "        foreach ($posts as $post) {\n"
            "            echo $post->user->name;\n"
            "        }\n"));

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].rule_id, NPlusOneAnalyzer::ID);
        EXPECT_EQ(issues[0].code, "lazy-loaded-relationship");
        EXPECT_EQ(issues[0].severity, Severity::High);
        EXPECT_EQ(issues[0].metadata["relationship"], "user");
        EXPECT_EQ(issues[0].metadata["loop_type"], "foreach");
        EXPECT_EQ(issues[0].location.line, 8u);
        EXPECT_NE(issues[0].recommendation.find("->with('user')"), std::string::npos);
    }

    TEST(NPlusOneAnalyzerTest, EagerLoadedRelationPasses) {
        const auto issues = analyze<NPlusOneAnalyzer>(in_method(
            "        $posts = Post::with('user')->get();\n"
            "        foreach ($posts as $post) {\n"
            "            echo $post->user->name;\n"
            "        }\n"));

        EXPECT_TRUE(issues.empty());
    }

    TEST(NPlusOneAnalyzerTest, IteratedQueryDirectly) {
        const auto issues = analyze<NPlusOneAnalyzer>(in_method(
            "        foreach (Post::where('published', true)->get() as $post) {\n"
            "            echo $post->author->name;\n"
            "        }\n"));

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].metadata["relationship"], "author");
    }

    TEST(NPlusOneAnalyzerTest, RepeatedAccessReportedOnce) {
        const auto issues = analyze<NPlusOneAnalyzer>(in_method(
            "        $posts = Post::all();\n"
            "        foreach ($posts as $post) {\n"
            "            echo $post->user->name;\n"
            "            echo $post->user->email;\n"
            "        }\n"));

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].metadata["relationship"], "user");
    }

    TEST(NPlusOneAnalyzerTest, DeepestUncoveredPathIsNamed) {
        const auto issues = analyze<NPlusOneAnalyzer>(in_method(
            "        $posts = Post::with('user')->get();\n"
            "        foreach ($posts as $post) {\n"
            "            echo $post->user->profile->bio;\n"
            "        }\n"));

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].metadata["relationship"], "user.profile");
    }

    TEST(NPlusOneAnalyzerTest, NestedLoopAttributesToInnerVariable) {
        const auto issues = analyze<NPlusOneAnalyzer>(in_method(
            "        $posts = Post::with('comments')->get();\n"
            "        foreach ($posts as $post) {\n"
            "            foreach ($post->comments as $comment) {\n"
            "                echo $comment->author->name;\n"
            "                echo $comment->author->email;\n"
            "            }\n"
            "        }\n"));

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].metadata["relationship"], "author");
        EXPECT_EQ(issues[0].metadata["variable"], "$comment");
        EXPECT_EQ(issues[0].location.line, 9u);
    }

    TEST(NPlusOneAnalyzerTest, NestedEagerLoadCoversPrefix) {
        const auto issues = analyze<NPlusOneAnalyzer>(in_method(
            "        $posts = Post::with('user.profile')->get();\n"
            "        foreach ($posts as $post) {\n"
            "            echo $post->user->name;\n"
            "            echo $post->user->profile->bio;\n"
            "        }\n"));

        EXPECT_TRUE(issues.empty());
    }

    TEST(NPlusOneAnalyzerTest, PlainAttributesAreNotRelations) {
        const auto issues = analyze<NPlusOneAnalyzer>(in_method(
            "        $posts = Post::all();\n"
            "        foreach ($posts as $post) {\n"
            "            echo $post->title;\n"
            "            echo $post->created_at;\n"
            "        }\n"));

        EXPECT_TRUE(issues.empty());
    }

    TEST(NPlusOneAnalyzerTest, ConfiguredPlainAttributes) {
        AnalyzerSettings settings(std::string(NPlusOneAnalyzer::ID));
        settings.set("plain_attributes", std::vector<std::string>{"author"});

        const auto issues = analyze<NPlusOneAnalyzer>(in_method(
            "        $posts = Post::all();\n"
            "        foreach ($posts as $post) {\n"
            "            echo $post->author;\n"
            "        }\n"), "app/Http/Controllers/PostController.php", settings);

        EXPECT_TRUE(issues.empty());
    }

    TEST(NPlusOneAnalyzerTest, RelationLoadedGuardSuppressesOnlyThatPath) {
        const auto issues = analyze<NPlusOneAnalyzer>(in_method(
            "        $posts = Post::all();\n"
            "        foreach ($posts as $post) {\n"
            "            if ($post->relationLoaded('user')) {\n"
            "                echo $post->user->name;\n"
            "            }\n"
            "            echo $post->comments;\n"
            "        }\n"
            "        foreach ($posts as $post) {\n"
            "            echo $post->user->name;\n"
            "        }\n"));

        ASSERT_EQ(issues.size(), 2u);
        EXPECT_EQ(issues[0].metadata["relationship"], "comments");
        EXPECT_EQ(issues[1].metadata["relationship"], "user");
        EXPECT_EQ(issues[1].location.line, 14u);
    }

    TEST(NPlusOneAnalyzerTest, LazyEagerLoadBeforeLoop) {
        const auto issues = analyze<NPlusOneAnalyzer>(in_method(
            "        $posts = Post::all();\n"
            "        $posts->load('user');\n"
            "        foreach ($posts as $post) {\n"
            "            echo $post->user->name;\n"
            "        }\n"));

        EXPECT_TRUE(issues.empty());
    }

    TEST(NPlusOneAnalyzerTest, UntrackedCollectionsAreIgnored) {
        const auto issues = analyze<NPlusOneAnalyzer>(in_method(
            "        foreach ($items as $item) {\n"
            "            echo $item->owner->name;\n"
            "        }\n"
            "        for ($i = 0; $i < 10; $i++) {\n"
            "            echo $i;\n"
            "        }\n"));

        EXPECT_TRUE(issues.empty());
    }

    TEST(NPlusOneAnalyzerTest, QueryInsideLoop) {
        const auto issues = analyze<NPlusOneAnalyzer>(in_method(
            "        foreach ($ids as $id) {\n"
            "            $user = User::find($id);\n"
            "        }\n"));

        const auto queries = with_code(issues, "query-in-loop");
        ASSERT_EQ(queries.size(), 1u);
        EXPECT_EQ(queries[0].location.line, 7u);
        EXPECT_EQ(queries[0].metadata["loop_type"], "foreach");
        EXPECT_EQ(queries[0].metadata["query"], "User::find($id)");
    }

    TEST(NPlusOneAnalyzerTest, QueryInsideWhileLoop) {
        const auto issues = analyze<NPlusOneAnalyzer>(in_method(
            "        while ($running) {\n"
            "            $count = DB::table('jobs')->count();\n"
            "        }\n"));

        const auto queries = with_code(issues, "query-in-loop");
        ASSERT_EQ(queries.size(), 1u);
        EXPECT_EQ(queries[0].metadata["loop_type"], "while");
    }

    TEST(NPlusOneAnalyzerTest, IteratedQueryIsNotInsideLoop) {
        const auto issues = analyze<NPlusOneAnalyzer>(in_method(
            "        foreach (User::all() as $user) {\n"
            "            echo $user->email;\n"
            "        }\n"));

        EXPECT_TRUE(issues.empty());
    }

    TEST(NPlusOneAnalyzerTest, QueriesInLoopsCanBeDisabled) {
        AnalyzerSettings settings(std::string(NPlusOneAnalyzer::ID));
        settings.set("check_queries_in_loops", false);

        const auto issues = analyze<NPlusOneAnalyzer>(in_method(
            "        foreach ($ids as $id) {\n"
            "            $user = User::find($id);\n"
            "        }\n"), "app/Http/Controllers/PostController.php", settings);

        EXPECT_TRUE(issues.empty());
    }

    TEST(NPlusOneAnalyzerTest, RejectsMalformedSettings) {
        AnalyzerSettings settings(std::string(NPlusOneAnalyzer::ID));
        settings.set("check_queries_in_loops", std::string("sometimes"));

        NPlusOneAnalyzer analyzer;
        const auto configured = analyzer.configure(settings);

        ASSERT_TRUE(configured.is_err());
        EXPECT_EQ(configured.error().code(), ErrorCode::ConfigError);
    }

    TEST(NPlusOneAnalyzerTest, UnparseableFileProducesNothing) {
        const auto issues = analyze<NPlusOneAnalyzer>("<?php\nforeach ($posts as $post {\n echo $post->user;\n");

        EXPECT_TRUE(issues.empty());
    }

    TEST(NPlusOneAnalyzerTest, RepeatedRunsAreIdentical) {
        const std::string source = in_method(
            "        $posts = Post::all();\n"
            "        foreach ($posts as $post) {\n"
            "            echo $post->user->name;\n"
            "            echo $post->tags;\n"
            "            $author = Author::find($post->id);\n"
            "        }\n");

        const auto first = analyze<NPlusOneAnalyzer>(source);
        const auto second = analyze<NPlusOneAnalyzer>(source);

        ASSERT_EQ(first.size(), second.size());
        ASSERT_EQ(first.size(), 3u);
        for (std::size_t i = 0; i < first.size(); ++i) {
            EXPECT_EQ(first[i].message, second[i].message);
            EXPECT_EQ(first[i].location.line, second[i].location.line);
            EXPECT_EQ(first[i].code, second[i].code);
        }
    }

}  // namespace lpa::analyzers
