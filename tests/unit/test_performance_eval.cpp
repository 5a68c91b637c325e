#include <gtest/gtest.h>
#include "conformance/baselines.h"
#include "conformance/performance.h"

using namespace costconform;

namespace {

LatencyStats stats_with_mean(int mean_ms) {
    LatencyStats stats;
    stats.iterations = 10;
    stats.min = std::chrono::milliseconds(mean_ms / 2);
    stats.mean = std::chrono::milliseconds(mean_ms);
    stats.max = std::chrono::milliseconds(mean_ms * 2);
    return stats;
}

TestResult latency_result() {
    TestResult r;
    r.name = "Name_Latency";
    r.category = TestCategory::Performance;
    r.level = ConformanceLevel::Standard;
    return r;
}

const Metric* metric(const TestResult& r, const std::string& name) {
    for (const auto& m : r.metrics) {
        if (m.name == name) return &m;
    }
    return nullptr;
}

}  // namespace

// ========== Latency evaluation ==========

TEST(PerformanceEvalTest, test_fast_call_passes_without_warning) {
    auto r = latency_result();
    evaluate_latency(r, stats_with_mean(10), std::chrono::milliseconds(100), 0, PerformanceConfig{});
    EXPECT_EQ(r.status, TestStatus::Passed);
    EXPECT_TRUE(r.warnings.empty());
    ASSERT_NE(metric(r, "latency_mean"), nullptr);
    EXPECT_DOUBLE_EQ(metric(r, "latency_mean")->value, 10.0);
}

TEST(PerformanceEvalTest, test_within_tolerance_passes) {
    auto r = latency_result();
    evaluate_latency(r, stats_with_mean(105), std::chrono::milliseconds(100), 0, PerformanceConfig{});
    EXPECT_EQ(r.status, TestStatus::Passed);
}

TEST(PerformanceEvalTest, test_near_edge_passes_with_warning) {
    auto r = latency_result();
    evaluate_latency(r, stats_with_mean(95), std::chrono::milliseconds(100), 0, PerformanceConfig{});
    EXPECT_EQ(r.status, TestStatus::Passed);
    EXPECT_EQ(r.warnings.size(), 1u);
}

TEST(PerformanceEvalTest, test_over_margin_fails_with_measurement) {
    auto r = latency_result();
    evaluate_latency(r, stats_with_mean(3000), std::chrono::milliseconds(200), 0,
                     PerformanceConfig{});
    EXPECT_EQ(r.status, TestStatus::Failed);
    ASSERT_TRUE(r.error.has_value());
    EXPECT_NE(r.error->find("3000.0ms"), std::string::npos);
    EXPECT_NE(r.error->find("200.0ms"), std::string::npos);
}

TEST(PerformanceEvalTest, test_tolerance_is_configurable) {
    PerformanceConfig strict;
    strict.tolerance = 0.0;
    auto r = latency_result();
    evaluate_latency(r, stats_with_mean(105), std::chrono::milliseconds(100), 0, strict);
    EXPECT_EQ(r.status, TestStatus::Failed);
}

TEST(PerformanceEvalTest, test_allocation_ceiling_enforced_when_set) {
    auto stats = stats_with_mean(1);
    stats.heap_growth_per_call = 4096.0;

    auto reported = latency_result();
    evaluate_latency(reported, stats, std::chrono::milliseconds(100), 0, PerformanceConfig{});
    EXPECT_EQ(reported.status, TestStatus::Passed);
    ASSERT_NE(metric(reported, "heap_growth_per_call"), nullptr);

    auto enforced = latency_result();
    evaluate_latency(enforced, stats, std::chrono::milliseconds(100), 1024, PerformanceConfig{});
    EXPECT_EQ(enforced.status, TestStatus::Failed);
}

// ========== Baselines ==========

TEST(PerformanceEvalTest, test_default_baselines) {
    auto name = find_baseline("Name", {});
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(name->standard_ceiling, std::chrono::milliseconds(100));
    EXPECT_EQ(name->advanced_ceiling, std::chrono::milliseconds(50));

    auto thirty_days = find_baseline("GetActualCost_30d", {});
    ASSERT_TRUE(thirty_days.has_value());
    EXPECT_FALSE(thirty_days->measured_at_standard);
    EXPECT_EQ(thirty_days->method, Method::GetActualCost);

    EXPECT_FALSE(find_baseline("Unknown", {}).has_value());
}

TEST(PerformanceEvalTest, test_override_keeps_measured_method) {
    PerformanceBaseline custom;
    custom.standard_ceiling = std::chrono::milliseconds(1);
    std::map<std::string, PerformanceBaseline> overrides{{"GetBudgets", custom}};
    auto found = find_baseline("GetBudgets", overrides);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->method, Method::GetBudgets);
    EXPECT_EQ(found->standard_ceiling, std::chrono::milliseconds(1));
}
