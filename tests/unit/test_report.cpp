#include <gtest/gtest.h>
#include <sstream>
#include "conformance/aggregator.h"
#include "conformance/report.h"

using namespace costconform;

namespace {

ConformanceResult sample_result() {
    RunRecord record;
    record.plugin_name = "report-plugin";
    record.requested_level = ConformanceLevel::Standard;
    record.started = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
    record.duration = std::chrono::milliseconds(1500);

    TestResult ok;
    ok.name = "Name_ResponseSchema";
    ok.category = TestCategory::SpecValidation;
    ok.duration = std::chrono::milliseconds(2);

    TestResult bad;
    bad.name = "GetPricingSpec_ValidRequest";
    bad.category = TestCategory::RPCCorrectness;
    bad.status = TestStatus::Failed;
    bad.error = "INTERNAL: pricing down";

    TestResult latency;
    latency.name = "Name_Latency";
    latency.category = TestCategory::Performance;
    latency.level = ConformanceLevel::Standard;
    latency.metrics.push_back({"latency_mean", 1.5, "ms"});

    record.results = {ok, bad, latency};
    record.category_warnings[TestCategory::Performance].push_back("noisy host");
    return aggregate(record);
}

}  // namespace

// ========== Structured report ==========

TEST(ReportTest, test_structured_report_keys) {
    auto j = to_structured_report(sample_result());
    EXPECT_EQ(j["version"], "1.0.0");
    EXPECT_EQ(j["timestamp"], "2023-11-14T22:13:20Z");
    EXPECT_EQ(j["plugin_name"], "report-plugin");
    EXPECT_EQ(j["requested_level"], "Standard");
    EXPECT_EQ(j["level_achieved"], "None");
    EXPECT_DOUBLE_EQ(j["duration_ms"].get<double>(), 1500.0);
    EXPECT_EQ(j["summary"]["total"], 3);
    EXPECT_EQ(j["summary"]["failed"], 1);
    EXPECT_TRUE(j["summary_text"].is_string());
}

TEST(ReportTest, test_every_category_is_listed) {
    auto j = to_structured_report(sample_result());
    ASSERT_EQ(j["categories"].size(), 4u);
    EXPECT_EQ(j["categories"][0]["name"], "spec_validation");
    EXPECT_EQ(j["categories"][3]["name"], "concurrency");
    EXPECT_EQ(j["categories"][3]["attempted"], false);
    EXPECT_EQ(j["categories"][3]["tests"].size(), 0u);
}

TEST(ReportTest, test_category_without_results_is_unattempted) {
    ConformanceResult result;
    auto j = to_structured_report(result);
    ASSERT_EQ(j["categories"].size(), 4u);
    for (const auto& c : j["categories"]) {
        EXPECT_EQ(c["attempted"], false);
        EXPECT_EQ(c["satisfied"], false);
    }
}

TEST(ReportTest, test_test_details) {
    auto j = to_structured_report(sample_result());
    const auto& rpc = j["categories"][1];
    ASSERT_EQ(rpc["tests"].size(), 1u);
    EXPECT_EQ(rpc["tests"][0]["name"], "GetPricingSpec_ValidRequest");
    EXPECT_EQ(rpc["tests"][0]["status"], "failed");
    EXPECT_EQ(rpc["tests"][0]["error"], "INTERNAL: pricing down");

    const auto& perf = j["categories"][2];
    EXPECT_EQ(perf["warnings"][0], "noisy host");
    EXPECT_EQ(perf["tests"][0]["metrics"][0]["name"], "latency_mean");
    EXPECT_FALSE(j["categories"][0]["tests"][0].contains("error"));
}

TEST(ReportTest, test_json_text_parses) {
    std::string text = to_json(sample_result(), 2);
    auto j = nlohmann::json::parse(text);
    EXPECT_EQ(j["plugin_name"], "report-plugin");
}

// ========== Text report ==========

TEST(ReportTest, test_print_report_box) {
    std::ostringstream out;
    print_report(sample_result(), out);
    std::string text = out.str();
    EXPECT_NE(text.find("Plugin Conformance Test Report"), std::string::npos);
    EXPECT_NE(text.find("Plugin: report-plugin"), std::string::npos);
    EXPECT_NE(text.find("Level Achieved: None"), std::string::npos);
    EXPECT_NE(text.find("Failed Tests"), std::string::npos);
    EXPECT_NE(text.find("GetPricingSpec_ValidRequest"), std::string::npos);
    EXPECT_NE(text.find("SOME TESTS FAILED"), std::string::npos);
}

TEST(ReportTest, test_format_category_results) {
    std::string text = format_category_results(sample_result());
    EXPECT_NE(text.find("rpc_correctness: 0 passed, 1 failed, 0 skipped"), std::string::npos);
    EXPECT_NE(text.find("concurrency: not attempted"), std::string::npos);
}
