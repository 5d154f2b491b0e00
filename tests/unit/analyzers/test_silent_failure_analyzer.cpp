//
// Created by gregorian-rayne on 1/16/26.
//

#include "lpa/analyzers/silent_failure_analyzer.hpp"

#include "support/analyzer_fixture.hpp"

#include <gtest/gtest.h>

namespace lpa::analyzers
{
    using lpa::testing::analyze;
    using lpa::testing::with_code;

    namespace {
        std::string in_method(const std::string& body, const std::string& class_name = "PaymentService") {
            return "<?php\n"
                   "class " + class_name + "\n"
                   "{\n"
                   "    public function charge($order)\n"
                   "    {\n" +
                   body +
                   "    }\n"
                   "}\n";
        }
    }

    TEST(SilentFailureAnalyzerTest, EmptyCatchBlock) {
        const auto issues = analyze<SilentFailureAnalyzer>(in_method(
            "        try {\n"
            "            $order->charge();\n"
            "        } catch (PaymentException $e) {\n"
            "        }\n"));

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].code, "empty-catch");
        EXPECT_EQ(issues[0].severity, Severity::High);
        EXPECT_EQ(issues[0].location.line, 8u);
    }

    TEST(SilentFailureAnalyzerTest, IntentionalCommentAllowsEmptyCatch) {
        const auto issues = analyze<SilentFailureAnalyzer>(in_method(
            "        try {\n"
            "            $order->charge();\n"
            "        } catch (PaymentException $e) {\n"
            "            // safe to ignore, the webhook retries\n"
            "        }\n"));

        EXPECT_TRUE(issues.empty());
    }

    TEST(SilentFailureAnalyzerTest, PlainCommentStillEmpty) {
        const auto issues = analyze<SilentFailureAnalyzer>(in_method(
            "        try {\n"
            "            $order->charge();\n"
            "        } catch (PaymentException $e) {\n"
            "            // TODO\n"
            "        }\n"));

        EXPECT_EQ(with_code(issues, "empty-catch").size(), 1u);
    }

    TEST(SilentFailureAnalyzerTest, BroadCatchWithoutRethrow) {
        const auto issues = analyze<SilentFailureAnalyzer>(in_method(
            "        try {\n"
            "            $order->charge();\n"
            "        } catch (\\Throwable $e) {\n"
            "            Log::error($e->getMessage());\n"
            "        }\n"));

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].code, "broad-catch");
        EXPECT_EQ(issues[0].severity, Severity::High);
        EXPECT_EQ(issues[0].message, "Catching Throwable is overly broad and can mask fatal errors");
    }

    TEST(SilentFailureAnalyzerTest, BroadCatchThatRethrowsPasses) {
        const auto issues = analyze<SilentFailureAnalyzer>(in_method(
            "        try {\n"
            "            $order->charge();\n"
            "        } catch (Exception $e) {\n"
            "            DB::rollBack();\n"
            "            throw $e;\n"
            "        }\n"));

        EXPECT_TRUE(issues.empty());
    }

    TEST(SilentFailureAnalyzerTest, CatchWithoutLoggingOrRethrow) {
        const auto issues = analyze<SilentFailureAnalyzer>(in_method(
            "        try {\n"
            "            $order->charge();\n"
            "        } catch (PaymentException $e) {\n"
            "            $order->markFailed();\n"
            "        }\n"));

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].code, "unlogged-catch");
        EXPECT_EQ(issues[0].severity, Severity::Medium);
    }

    TEST(SilentFailureAnalyzerTest, HandledCatchesPass) {
        const auto issues = analyze<SilentFailureAnalyzer>(in_method(
            "        try {\n"
            "            $order->charge();\n"
            "        } catch (PaymentException $e) {\n"
            "            $order->fail($e->getMessage());\n"
            "        }\n"
            "        try {\n"
            "            $order->ship();\n"
            "        } catch (ShippingException $e) {\n"
            "            report('shipping failed');\n"
            "        }\n"
            "        try {\n"
            "            $rate = $order->rate();\n"
            "        } catch (RateException $e) {\n"
            "            $rate = $this->defaultRate();\n"
            "        }\n"
            "        try {\n"
            "            $order->notify();\n"
            "        } catch (MailException $e) {\n"
            "            return false;\n"
            "        }\n"));

        EXPECT_TRUE(issues.empty());
    }

    TEST(SilentFailureAnalyzerTest, ExpectedExceptionsAreSkipped) {
        const auto issues = analyze<SilentFailureAnalyzer>(in_method(
            "        try {\n"
            "            $order->load();\n"
            "        } catch (ModelNotFoundException $e) {\n"
            "        }\n"
            "        try {\n"
            "            $order->load();\n"
            "        } catch (ModelNotFoundException | \\Exception $e) {\n"
            "        }\n"));

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].code, "empty-catch");
        EXPECT_EQ(issues[0].location.line, 12u);
    }

    TEST(SilentFailureAnalyzerTest, ErrorSuppressionSeverities) {
        const auto issues = analyze<SilentFailureAnalyzer>(in_method(
            "        $data = @json_decode($order->payload);\n"
            "        $result = @$handler($order);\n"
            "        try {\n"
            "            $order->charge();\n"
            "        } catch (PaymentException $e) {\n"
            "            @trigger_error($e->getMessage());\n"
            "            throw $e;\n"
            "        }\n"));

        const auto suppressions = with_code(issues, "error-suppression");
        ASSERT_EQ(suppressions.size(), 3u);
        EXPECT_EQ(suppressions[0].severity, Severity::Medium);
        EXPECT_EQ(suppressions[0].message, "Error suppression operator (@) hides errors");
        EXPECT_EQ(suppressions[1].severity, Severity::High);
        EXPECT_EQ(suppressions[1].message, "Dynamic error suppression is particularly dangerous");
        EXPECT_EQ(suppressions[2].severity, Severity::High);
        EXPECT_EQ(suppressions[2].message,
                  "Error suppression operator (@) inside catch block creates double silencing");
    }

    TEST(SilentFailureAnalyzerTest, CleanupSuppressionIsAllowed) {
        const auto issues = analyze<SilentFailureAnalyzer>(in_method(
            "        @unlink($order->receipt_path);\n"
            "        @Storage::delete($order->receipt_path);\n"
            "        @$handle->close();\n"));

        EXPECT_TRUE(issues.empty());
    }

    TEST(SilentFailureAnalyzerTest, ConfiguredSuppressionFunctions) {
        AnalyzerSettings settings(std::string(SilentFailureAnalyzer::ID));
        settings.set("whitelist_error_suppression_functions", std::vector<std::string>{"json_*"});

        const auto issues = analyze<SilentFailureAnalyzer>(in_method(
            "        $data = @json_decode($order->payload);\n"
            "        @unlink($order->receipt_path);\n"),
            "app/Services/PaymentService.php", settings);

        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(issues[0].location.line, 7u);
    }

    TEST(SilentFailureAnalyzerTest, TestsAndSeedersAreSkipped) {
        const std::string source = in_method(
            "        try {\n"
            "            $order->charge();\n"
            "        } catch (PaymentException $e) {\n"
            "        }\n");

        EXPECT_TRUE(analyze<SilentFailureAnalyzer>(source, "tests/Feature/PaymentTest.php").empty());
        EXPECT_TRUE(analyze<SilentFailureAnalyzer>(source, "database/seeders/OrderSeeder.php").empty());
        EXPECT_TRUE(analyze<SilentFailureAnalyzer>(in_method(
            "        try {\n"
            "            $order->charge();\n"
            "        } catch (PaymentException $e) {\n"
            "        }\n", "OrderSeeder")).empty());
    }

}  // namespace lpa::analyzers
