#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include "common/errors.h"
#include "conformance/concurrency.h"
#include "conformance/report.h"
#include "conformance/suite.h"
#include "mock/mock_cost_source.h"

using namespace costconform;

namespace {

SuiteConfig fast_config(MockCostSource& mock, ConformanceLevel level = ConformanceLevel::Standard) {
    SuiteConfig config = SuiteConfig::for_level(level, &mock);
    config.test_timeout = std::chrono::seconds(10);
    config.performance.warmup_iterations = 1;
    config.performance.timed_iterations = 3;
    config.race_detection = false;
    config.log_level = "warn";
    return config;
}

ConformanceSuite make_suite(SuiteConfig config) {
    ConformanceSuite suite(std::move(config));
    suite.register_default_modules();
    return suite;
}

const TestResult* find(const CategoryResult& category, const std::string& name) {
    for (const auto& r : category.results) {
        if (r.name == name) return &r;
    }
    return nullptr;
}

const TestResult* find(const ConformanceResult& result, const std::string& name) {
    for (const auto& c : result.categories) {
        if (const TestResult* r = find(c, name)) return r;
    }
    return nullptr;
}

}  // namespace

// ========== Scenarios ==========

TEST(SuiteScenarioTest, test_valid_pricing_spec_has_no_failures) {
    MockCostSource mock;
    PricingSpec spec;
    spec.provider = "aws";
    spec.resource_type = "ec2";
    spec.sku = "t3.micro";
    spec.region = "us-east-1";
    spec.billing_mode = "on_demand";
    spec.rate_per_unit = 0.0104;
    spec.currency = "USD";
    GetPricingSpecResponse response;
    response.spec = spec;
    mock.respond_with(response);

    auto suite = make_suite(fast_config(mock));
    CategoryResult category = suite.run_category(TestCategory::SpecValidation);
    const TestResult* r = find(category, "GetPricingSpec_ResponseSchema");
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->status, TestStatus::Passed);
    EXPECT_EQ(category.failed, 0);
    EXPECT_TRUE(category.satisfied());
}

TEST(SuiteScenarioTest, test_missing_currency_is_one_failure) {
    MockCostSource mock;
    ActualCostResult point;
    point.timestamp = Timestamp(std::chrono::seconds(1700000000));
    point.cost = 0.42;
    point.usage_amount = 1.0;
    point.usage_unit = "hour";
    GetActualCostResponse response;
    response.results.push_back(point);
    mock.respond_with(response);

    auto suite = make_suite(fast_config(mock));
    CategoryResult category = suite.run_category(TestCategory::SpecValidation);
    EXPECT_EQ(category.failed, 1);
    const TestResult* r = find(category, "GetActualCost_ResponseSchema");
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->status, TestStatus::Failed);
    ASSERT_TRUE(r->error.has_value());
    EXPECT_NE(r->error->find("1 schema violation(s)"), std::string::npos);
    EXPECT_NE(r->error->find("currency"), std::string::npos);
}

TEST(SuiteScenarioTest, test_slow_projected_cost_fails_latency) {
    MockCostSource mock;
    mock.delay(Method::GetProjectedCost, std::chrono::milliseconds(3000));
    auto config = fast_config(mock);
    config.performance.warmup_iterations = 0;
    config.performance.timed_iterations = 1;

    auto suite = make_suite(config);
    CategoryResult category = suite.run_category(TestCategory::Performance);
    const TestResult* r = find(category, "GetProjectedCost_Latency");
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->status, TestStatus::Failed);
    ASSERT_TRUE(r->error.has_value());
    EXPECT_NE(r->error->find("exceeds ceiling 200.0ms"), std::string::npos);

    double mean = 0.0;
    for (const auto& m : r->metrics) {
        if (m.name == "latency_mean") mean = m.value;
    }
    EXPECT_GE(mean, 3000.0);
    EXPECT_LT(mean, 4500.0);
    EXPECT_EQ(find(category, "Name_Latency")->status, TestStatus::Passed);
}

TEST(SuiteScenarioTest, test_unimplemented_budgets_are_skipped) {
    MockCostSource mock;
    mock.fail_with(Method::GetBudgets, StatusCode::Unimplemented, "budgets not supported");

    auto suite = make_suite(fast_config(mock));
    ConformanceResult result = suite.run(ConformanceLevel::Standard);

    const CategoryResult* rpc = result.category(TestCategory::RPCCorrectness);
    ASSERT_NE(rpc, nullptr);
    for (const auto& r : rpc->results) {
        if (r.name.rfind("GetBudgets_", 0) == 0) {
            EXPECT_EQ(r.status, TestStatus::Skipped) << r.name;
        }
    }
    EXPECT_EQ(rpc->failed, 0);
    ASSERT_TRUE(result.achieved_level.has_value());
    EXPECT_EQ(*result.achieved_level, ConformanceLevel::Standard);
}

TEST(SuiteScenarioTest, test_name_fan_out_is_identical) {
    MockCostSource mock;
    mock.respond_with(NameResponse{"fan-out-plugin"});
    auto config = fast_config(mock);
    config.concurrency_fan_out = 10;

    auto suite = make_suite(config);
    CategoryResult category = suite.run_category(TestCategory::Concurrency);
    const TestResult* r = find(category, "Name_ResponseConsistency");
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->status, TestStatus::Passed);
    double fan_out = 0.0;
    double distinct = 0.0;
    for (const auto& m : r->metrics) {
        if (m.name == "fan_out") fan_out = m.value;
        if (m.name == "distinct_responses") distinct = m.value;
    }
    EXPECT_DOUBLE_EQ(fan_out, 10.0);
    EXPECT_DOUBLE_EQ(distinct, 1.0);
    // Probe calls plus two fan-outs of ten.
    EXPECT_GE(mock.call_count(Method::Name), 20u);
}

TEST(SuiteScenarioTest, test_fault_in_estimate_cost_is_contained) {
    MockCostSource mock;
    mock.fault_on(Method::EstimateCost, "estimator exploded");

    auto suite = make_suite(fast_config(mock));
    ConformanceResult result = suite.run(ConformanceLevel::Basic);

    const TestResult* failed = find(result, "EstimateCost_ValidRequest");
    ASSERT_NE(failed, nullptr);
    EXPECT_EQ(failed->status, TestStatus::Failed);
    EXPECT_NE(failed->error->find("estimator exploded"), std::string::npos);

    const TestResult* recs = find(result, "GetRecommendations_ValidRequest");
    ASSERT_NE(recs, nullptr);
    EXPECT_EQ(recs->status, TestStatus::Passed);
    const TestResult* budgets = find(result, "GetBudgets_ValidRequest");
    ASSERT_NE(budgets, nullptr);
    EXPECT_EQ(budgets->status, TestStatus::Passed);
    EXPECT_FALSE(result.achieved_level.has_value());
}

// ========== Suite properties ==========

TEST(SuiteScenarioTest, test_default_double_reaches_standard) {
    MockCostSource mock;
    auto suite = make_suite(fast_config(mock));
    ConformanceResult result = suite.run();
    ASSERT_TRUE(result.achieved_level.has_value());
    EXPECT_EQ(*result.achieved_level, ConformanceLevel::Standard);
    EXPECT_EQ(result.plugin_name, "mock-test-plugin");
    EXPECT_EQ(result.count(TestStatus::Failed), 0);
    for (const auto& c : result.categories) {
        EXPECT_TRUE(c.attempted) << to_string(c.category);
    }
    const CategoryResult* concurrency = result.category(TestCategory::Concurrency);
    ASSERT_EQ(concurrency->warnings.size(), 1u);
    EXPECT_EQ(concurrency->warnings[0], kRaceDetectionInactiveWarning);
}

TEST(SuiteScenarioTest, test_basic_run_skips_standard_categories) {
    MockCostSource mock;
    auto suite = make_suite(fast_config(mock, ConformanceLevel::Basic));
    ConformanceResult result = suite.run();
    ASSERT_TRUE(result.achieved_level.has_value());
    EXPECT_EQ(*result.achieved_level, ConformanceLevel::Basic);
    EXPECT_FALSE(result.category(TestCategory::Performance)->attempted);
    EXPECT_FALSE(result.category(TestCategory::Concurrency)->attempted);

    auto report = to_structured_report(result);
    EXPECT_EQ(report["level_achieved"], "Basic");
    EXPECT_EQ(report["categories"][2]["attempted"], false);
}

TEST(SuiteScenarioTest, test_runs_are_idempotent) {
    MockCostSource mock;
    mock.fail_with(Method::GetPricingSpec, StatusCode::Internal, "flaky pricing");
    auto suite = make_suite(fast_config(mock));
    ConformanceResult first = suite.run();
    ConformanceResult second = suite.run();
    EXPECT_EQ(first.achieved_level, second.achieved_level);
    for (size_t i = 0; i < first.categories.size(); ++i) {
        EXPECT_EQ(first.categories[i].passed, second.categories[i].passed);
        EXPECT_EQ(first.categories[i].failed, second.categories[i].failed);
        EXPECT_EQ(first.categories[i].skipped, second.categories[i].skipped);
    }
}

TEST(SuiteScenarioTest, test_spec_failure_still_runs_every_category) {
    MockCostSource mock;
    mock.respond_with(NameResponse{""});
    auto suite = make_suite(fast_config(mock));
    ConformanceResult result = suite.run();
    EXPECT_FALSE(result.achieved_level.has_value());
    EXPECT_GT(result.category(TestCategory::SpecValidation)->failed, 0);
    for (const auto& c : result.categories) {
        EXPECT_TRUE(c.attempted) << to_string(c.category);
    }
}

TEST(SuiteScenarioTest, test_empty_capability_set_skips_optional_checks) {
    MockCostSource mock;
    mock.enable(Method::EstimateCost, false)
        .enable(Method::GetRecommendations, false)
        .enable(Method::GetBudgets, false);
    auto suite = make_suite(fast_config(mock));
    ConformanceResult result = suite.run();

    EXPECT_EQ(result.count(TestStatus::Failed), 0);
    EXPECT_EQ(mock.call_count(Method::EstimateCost), 0u);
    EXPECT_EQ(mock.call_count(Method::GetRecommendations), 0u);
    EXPECT_EQ(mock.call_count(Method::GetBudgets), 0u);
    const TestResult* r = find(result, "GetBudgets_ValidRequest");
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->status, TestStatus::Skipped);
    ASSERT_TRUE(result.achieved_level.has_value());
    EXPECT_EQ(*result.achieved_level, ConformanceLevel::Standard);
}

TEST(SuiteScenarioTest, test_error_plugin_achieves_nothing) {
    auto mock = error_mock();
    auto suite = make_suite(fast_config(*mock, ConformanceLevel::Basic));
    ConformanceResult result = suite.run();
    EXPECT_EQ(result.plugin_name, "unknown");
    EXPECT_FALSE(result.achieved_level.has_value());
    EXPECT_GT(result.count(TestStatus::Failed), 0);
}

TEST(SuiteScenarioTest, test_convenience_entry_point) {
    MockCostSource mock;
    ConformanceResult result = run_basic_conformance(mock);
    ASSERT_TRUE(result.achieved_level.has_value());
    EXPECT_EQ(*result.achieved_level, ConformanceLevel::Basic);
    EXPECT_EQ(result.requested_level, ConformanceLevel::Basic);
}

TEST(SuiteScenarioTest, test_suite_does_not_change_logger_level) {
    auto previous = spdlog::get_level();
    spdlog::set_level(spdlog::level::err);

    MockCostSource quiet;
    MockCostSource chatty;
    auto quiet_config = fast_config(quiet);
    auto chatty_config = fast_config(chatty);
    chatty_config.log_level = "debug";
    ConformanceSuite first(quiet_config);
    ConformanceSuite second(chatty_config);
    EXPECT_EQ(spdlog::get_level(), spdlog::level::err);

    apply_log_level(second.config());
    EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);
    spdlog::set_level(previous);
}

// ========== Infrastructure failures ==========

TEST(SuiteScenarioTest, test_misconfigured_double_aborts_run) {
    MockCostSource mock;
    mock.fault_on(Method::Name, "");
    auto suite = make_suite(fast_config(mock));
    EXPECT_THROW(suite.run(), ConfigurationError);
}

TEST(SuiteScenarioTest, test_missing_target_is_rejected) {
    SuiteConfig config;
    EXPECT_THROW(ConformanceSuite suite(config), ConfigurationError);
}

TEST(SuiteScenarioTest, test_invalid_config_is_rejected) {
    MockCostSource mock;
    auto config = fast_config(mock);
    config.performance.timed_iterations = 0;
    EXPECT_THROW(ConformanceSuite suite(config), ConfigurationError);
}
