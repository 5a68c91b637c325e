#include <gtest/gtest.h>
#include <algorithm>
#include "conformance/aggregator.h"

using namespace costconform;

namespace {

TestResult result(const std::string& name, TestCategory category, ConformanceLevel level,
                  TestStatus status = TestStatus::Passed) {
    TestResult r;
    r.name = name;
    r.category = category;
    r.level = level;
    r.status = status;
    if (status == TestStatus::Failed) r.error = name + " failed";
    return r;
}

// One passing check per category at every level it covers.
RunRecord passing_run(ConformanceLevel requested) {
    RunRecord record;
    record.plugin_name = "example";
    record.requested_level = requested;
    record.results = {
        result("Name_ResponseSchema", TestCategory::SpecValidation, ConformanceLevel::Basic),
        result("Name_ValidRequest", TestCategory::RPCCorrectness, ConformanceLevel::Basic),
        result("Name_Latency", TestCategory::Performance, ConformanceLevel::Standard),
        result("Name_LatencyAdvanced", TestCategory::Performance, ConformanceLevel::Advanced),
        result("Name_ParallelRequests", TestCategory::Concurrency, ConformanceLevel::Standard),
        result("Name_HighFanOut", TestCategory::Concurrency, ConformanceLevel::Advanced),
    };
    return record;
}

}  // namespace

// ========== Level achievement ==========

TEST(AggregatorTest, test_all_passing_reaches_requested_level) {
    for (auto level :
         {ConformanceLevel::Basic, ConformanceLevel::Standard, ConformanceLevel::Advanced}) {
        auto out = aggregate(passing_run(level));
        ASSERT_TRUE(out.achieved_level.has_value());
        EXPECT_EQ(*out.achieved_level, level);
    }
}

TEST(AggregatorTest, test_basic_failure_means_no_level) {
    auto record = passing_run(ConformanceLevel::Advanced);
    record.results.push_back(result("GetPricingSpec_ResponseSchema", TestCategory::SpecValidation,
                                    ConformanceLevel::Basic, TestStatus::Failed));
    auto out = aggregate(record);
    EXPECT_FALSE(out.achieved_level.has_value());
}

TEST(AggregatorTest, test_advanced_only_failure_keeps_standard) {
    auto record = passing_run(ConformanceLevel::Advanced);
    record.results.push_back(result("GetActualCost_30d_LatencyAdvanced", TestCategory::Performance,
                                    ConformanceLevel::Advanced, TestStatus::Failed));
    auto out = aggregate(record);
    ASSERT_TRUE(out.achieved_level.has_value());
    EXPECT_EQ(*out.achieved_level, ConformanceLevel::Standard);
}

TEST(AggregatorTest, test_standard_failure_keeps_basic) {
    auto record = passing_run(ConformanceLevel::Standard);
    record.results.push_back(result("Supports_ResponseConsistency", TestCategory::Concurrency,
                                    ConformanceLevel::Standard, TestStatus::Failed));
    auto out = aggregate(record);
    ASSERT_TRUE(out.achieved_level.has_value());
    EXPECT_EQ(*out.achieved_level, ConformanceLevel::Basic);
}

TEST(AggregatorTest, test_timeout_and_cancel_block_level) {
    auto timed_out = passing_run(ConformanceLevel::Basic);
    timed_out.results.push_back(result("GetActualCost_ValidRequest", TestCategory::RPCCorrectness,
                                       ConformanceLevel::Basic, TestStatus::TimedOut));
    EXPECT_FALSE(aggregate(timed_out).achieved_level.has_value());

    auto cancelled = passing_run(ConformanceLevel::Basic);
    cancelled.results.push_back(result("GetActualCost_ValidRequest", TestCategory::RPCCorrectness,
                                       ConformanceLevel::Basic, TestStatus::Cancelled));
    EXPECT_FALSE(aggregate(cancelled).achieved_level.has_value());
}

TEST(AggregatorTest, test_skips_do_not_block) {
    auto record = passing_run(ConformanceLevel::Standard);
    record.results.push_back(result("GetBudgets_ValidRequest", TestCategory::RPCCorrectness,
                                    ConformanceLevel::Basic, TestStatus::Skipped));
    auto out = aggregate(record);
    ASSERT_TRUE(out.achieved_level.has_value());
    EXPECT_EQ(*out.achieved_level, ConformanceLevel::Standard);
    EXPECT_EQ(out.count(TestStatus::Skipped), 1);
}

TEST(AggregatorTest, test_unattempted_required_category_blocks) {
    auto record = passing_run(ConformanceLevel::Standard);
    record.results.erase(
        std::remove_if(record.results.begin(), record.results.end(),
                       [](const TestResult& r) { return r.category == TestCategory::Concurrency; }),
        record.results.end());
    auto out = aggregate(record);
    ASSERT_TRUE(out.achieved_level.has_value());
    EXPECT_EQ(*out.achieved_level, ConformanceLevel::Basic);
    const CategoryResult* concurrency = out.category(TestCategory::Concurrency);
    ASSERT_NE(concurrency, nullptr);
    EXPECT_FALSE(concurrency->attempted);
    EXPECT_FALSE(concurrency->satisfied());
}

TEST(AggregatorTest, test_empty_run_has_all_categories_unattempted) {
    RunRecord record;
    auto out = aggregate(record);
    ASSERT_EQ(out.categories.size(), 4u);
    for (const auto& c : out.categories) {
        EXPECT_FALSE(c.attempted);
    }
    EXPECT_FALSE(out.achieved_level.has_value());
    EXPECT_EQ(out.plugin_name, "unknown");
}

TEST(AggregatorTest, test_never_above_requested) {
    auto out = aggregate(passing_run(ConformanceLevel::Basic));
    ASSERT_TRUE(out.achieved_level.has_value());
    EXPECT_EQ(*out.achieved_level, ConformanceLevel::Basic);
}

// ========== Purity ==========

TEST(AggregatorTest, test_aggregation_is_order_independent) {
    auto record = passing_run(ConformanceLevel::Advanced);
    record.results.push_back(result("GetBudgets_ValidRequest", TestCategory::RPCCorrectness,
                                    ConformanceLevel::Basic, TestStatus::Failed));
    auto reversed = record;
    std::reverse(reversed.results.begin(), reversed.results.end());

    auto a = aggregate(record);
    auto b = aggregate(reversed);
    EXPECT_EQ(a.achieved_level, b.achieved_level);
    EXPECT_EQ(a.summary, b.summary);
    for (size_t i = 0; i < a.categories.size(); ++i) {
        ASSERT_EQ(a.categories[i].results.size(), b.categories[i].results.size());
        for (size_t j = 0; j < a.categories[i].results.size(); ++j) {
            EXPECT_EQ(a.categories[i].results[j].name, b.categories[i].results[j].name);
        }
    }
}

TEST(AggregatorTest, test_category_counts) {
    std::vector<TestResult> results = {
        result("a", TestCategory::RPCCorrectness, ConformanceLevel::Basic),
        result("b", TestCategory::RPCCorrectness, ConformanceLevel::Basic, TestStatus::Failed),
        result("c", TestCategory::RPCCorrectness, ConformanceLevel::Basic, TestStatus::Skipped),
        result("d", TestCategory::RPCCorrectness, ConformanceLevel::Basic, TestStatus::TimedOut),
    };
    auto c = aggregate_category(TestCategory::RPCCorrectness, results, {"w", "w"});
    EXPECT_TRUE(c.attempted);
    EXPECT_EQ(c.passed, 1);
    EXPECT_EQ(c.failed, 1);
    EXPECT_EQ(c.skipped, 1);
    EXPECT_EQ(c.timed_out, 1);
    EXPECT_EQ(c.total(), 4);
    EXPECT_FALSE(c.satisfied());
    EXPECT_EQ(c.warnings.size(), 1u);
}

TEST(AggregatorTest, test_required_categories) {
    EXPECT_EQ(required_categories(ConformanceLevel::Basic).size(), 2u);
    EXPECT_EQ(required_categories(ConformanceLevel::Standard).size(), 4u);
    EXPECT_EQ(required_categories(ConformanceLevel::Advanced).size(), 4u);
}

TEST(AggregatorTest, test_summary_names_plugin_and_levels) {
    auto out = aggregate(passing_run(ConformanceLevel::Standard));
    EXPECT_NE(out.summary.find("example"), std::string::npos);
    EXPECT_NE(out.summary.find("achieved Standard"), std::string::npos);
    EXPECT_NE(out.summary.find("requested Standard"), std::string::npos);
}
