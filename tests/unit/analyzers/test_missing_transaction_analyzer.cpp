//
// Created by gregorian-rayne on 1/15/26.
//

#include "lpa/analyzers/missing_transaction_analyzer.hpp"

#include "support/analyzer_fixture.hpp"

#include <gtest/gtest.h>

namespace lpa::analyzers
{
    using lpa::testing::analyze;

    namespace {
        std::string order_service(const std::string& body) {
            return "<?php\n"
                   "namespace App\\Services;\n"
                   "\n"
                   "use App\\Models\\Order;\n"
                   "use App\\Models\\Invoice;\n"
                   "use Illuminate\\Support\\Facades\\DB;\n"
                   "\n"
                   "class OrderService\n"
                   "{\n"
                   "    public function place(array $data)\n"
                   "    {\n" +
                   body +
                   "    }\n"
                   "}\n";
        }
    }

    TEST(MissingTransactionAnalyzerTest, TwoUnprotectedWritesFail) {
        const auto issues = analyze<MissingTransactionAnalyzer>(order_service(
            "        $order = Order::create($data);\n"
            "        Invoice::create(['order_id' => $order->id]);\n"));

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].code, "missing-transaction");
        EXPECT_EQ(issues[0].severity, Severity::High);
        EXPECT_EQ(issues[0].location.line, 10u);
        EXPECT_EQ(issues[0].metadata["unprotected_writes"], 2);
        EXPECT_EQ(issues[0].metadata["lines"], nlohmann::json::array({12, 13}));
        EXPECT_EQ(issues[0].message,
                  "Method \"OrderService::place()\" has 2 write operations without transaction protection");
    }

    TEST(MissingTransactionAnalyzerTest, SingleWritePasses) {
        const auto issues = analyze<MissingTransactionAnalyzer>(order_service(
            "        Order::create($data);\n"));

        EXPECT_TRUE(issues.empty());
    }

    TEST(MissingTransactionAnalyzerTest, WritesInsideTransactionClosurePass) {
        const auto issues = analyze<MissingTransactionAnalyzer>(order_service(
            "        DB::transaction(function () use ($data) {\n"
            "            $order = Order::create($data);\n"
            "            $order->items()->attach($data['items']);\n"
            "            Invoice::create(['order_id' => $order->id]);\n"
            "        });\n"));

        EXPECT_TRUE(issues.empty());
    }

    TEST(MissingTransactionAnalyzerTest, LaterTransactionDoesNotProtectEarlierWrites) {
        const auto issues = analyze<MissingTransactionAnalyzer>(order_service(
            "        $order = Order::create($data);\n"
            "        $order->save();\n"
            "        DB::transaction(function () {\n"
            "        });\n"));

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].metadata["unprotected_writes"], 2);
    }

    TEST(MissingTransactionAnalyzerTest, OnlyTheTransactionClosureIsProtected) {
        const auto issues = analyze<MissingTransactionAnalyzer>(order_service(
            "        $callback = function () use ($data) {\n"
            "            Order::create($data);\n"
            "            Invoice::create($data);\n"
            "        };\n"
            "        DB::transaction(function () {\n"
            "        });\n"));

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].metadata["unprotected_writes"], 2);
    }

    TEST(MissingTransactionAnalyzerTest, ManualTransactionWithTryCatch) {
        const auto issues = analyze<MissingTransactionAnalyzer>(order_service(
            "        DB::beginTransaction();\n"
            "        try {\n"
            "            $order = Order::create($data);\n"
            "            Invoice::create(['order_id' => $order->id]);\n"
            "            DB::commit();\n"
            "        } catch (\\Throwable $e) {\n"
            "            DB::rollBack();\n"
            "            throw $e;\n"
            "        }\n"));

        EXPECT_TRUE(issues.empty());
    }

    TEST(MissingTransactionAnalyzerTest, WritesAfterCommitAreUnprotected) {
        const auto issues = analyze<MissingTransactionAnalyzer>(order_service(
            "        DB::beginTransaction();\n"
            "        Order::create($data);\n"
            "        DB::commit();\n"
            "        Invoice::create($data);\n"
            "        DB::table('audit')->insert(['event' => 'order']);\n"));

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].metadata["unprotected_writes"], 2);
        EXPECT_EQ(issues[0].metadata["total_writes"], 3);
    }

    TEST(MissingTransactionAnalyzerTest, NonRelationalStoresAreNotWrites) {
        const auto issues = analyze<MissingTransactionAnalyzer>(order_service(
            "        Cache::put('orders', $data);\n"
            "        Cache::forget('stats');\n"
            "        Storage::delete('orders.csv');\n"
            "        session()->put('last_order', $data);\n"
            "        Order::create($data);\n"));

        EXPECT_TRUE(issues.empty());
    }

    TEST(MissingTransactionAnalyzerTest, ReadsAreNotWrites) {
        const auto issues = analyze<MissingTransactionAnalyzer>(order_service(
            "        $orders = Order::where('status', 'open')->get();\n"
            "        $count = DB::table('orders')->count();\n"
            "        $first = Order::first();\n"));

        EXPECT_TRUE(issues.empty());
    }

    TEST(MissingTransactionAnalyzerTest, WritesCountPerMethod) {
        const auto issues = analyze<MissingTransactionAnalyzer>(
            "<?php\n"
            "class OrderService\n"
            "{\n"
            "    public function first($order)\n"
            "    {\n"
            "        $order->save();\n"
            "    }\n"
            "\n"
            "    public function second($order)\n"
            "    {\n"
            "        $order->delete();\n"
            "    }\n"
            "}\n");

        EXPECT_TRUE(issues.empty());
    }

    TEST(MissingTransactionAnalyzerTest, PlainFunctions) {
        const auto issues = analyze<MissingTransactionAnalyzer>(
            "<?php\n"
            "function import_orders($rows)\n"
            "{\n"
            "    DB::table('orders')->insert($rows);\n"
            "    DB::table('imports')->insert(['count' => 1]);\n"
            "}\n");

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].message,
                  "Function \"import_orders()\" has 2 write operations without transaction protection");
    }

    TEST(MissingTransactionAnalyzerTest, ConfiguredThreshold) {
        AnalyzerSettings settings(std::string(MissingTransactionAnalyzer::ID));
        settings.set("threshold", std::int64_t{3});

        const auto issues = analyze<MissingTransactionAnalyzer>(order_service(
            "        Order::create($data);\n"
            "        Invoice::create($data);\n"),
            "app/Services/OrderService.php", settings);

        EXPECT_TRUE(issues.empty());
    }

    TEST(MissingTransactionAnalyzerTest, ThresholdMustBePositive) {
        AnalyzerSettings settings(std::string(MissingTransactionAnalyzer::ID));
        settings.set("threshold", std::int64_t{0});

        MissingTransactionAnalyzer analyzer;
        const auto configured = analyzer.configure(settings);

        ASSERT_TRUE(configured.is_err());
        EXPECT_EQ(configured.error().code(), ErrorCode::ConfigError);
    }

    TEST(MissingTransactionAnalyzerTest, ExcludedFileRoles) {
        const MissingTransactionAnalyzer analyzer;

        EXPECT_FALSE(analyzer.should_analyze("tests/Feature/OrderTest.php"));
        EXPECT_FALSE(analyzer.should_analyze("database/seeders/DatabaseSeeder.php"));
        EXPECT_FALSE(analyzer.should_analyze("database/factories/OrderFactory.php"));
        EXPECT_FALSE(analyzer.should_analyze("database/migrations/2024_01_01_create_orders.php"));
        EXPECT_FALSE(analyzer.should_analyze("app/Support/ImportTest.php"));
        EXPECT_TRUE(analyzer.should_analyze("app/Services/OrderService.php"));
    }

    TEST(MissingTransactionAnalyzerTest, SeederIsSkippedWhole) {
        const auto issues = analyze<MissingTransactionAnalyzer>(order_service(
            "        Order::create($data);\n"
            "        Invoice::create($data);\n"),
            "database/seeders/OrderSeeder.php");

        EXPECT_TRUE(issues.empty());
    }

    TEST(MissingTransactionAnalyzerTest, LineSuppression) {
        const auto issues = analyze<MissingTransactionAnalyzer>(
            "<?php\n"
            "class OrderService\n"
            "{\n"
            "    // @lpa-ignore missing-database-transactions\n"
            "    public function place($order, $invoice)\n"
            "    {\n"
            "        $order->save();\n"
            "        $invoice->save();\n"
            "    }\n"
            "}\n");

        EXPECT_TRUE(issues.empty());
    }

}  // namespace lpa::analyzers
