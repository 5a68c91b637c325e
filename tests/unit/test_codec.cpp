#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <nlohmann/json.hpp>
#include "contract/codec.h"

using namespace costconform;

// ========== Encoding ==========

TEST(CodecTest, test_resource_descriptor_fields) {
    SupportsRequest request{ResourceDescriptor{"aws", "ec2", "t3.micro", "us-east-1", {{"env", "prod"}}}};
    auto j = nlohmann::json::parse(encode(request));
    EXPECT_EQ(j["resource"]["provider"], "aws");
    EXPECT_EQ(j["resource"]["resource_type"], "ec2");
    EXPECT_EQ(j["resource"]["tags"]["env"], "prod");
}

TEST(CodecTest, test_absent_optional_is_omitted) {
    auto j = nlohmann::json::parse(encode(SupportsRequest{}));
    EXPECT_FALSE(j.contains("resource"));
}

TEST(CodecTest, test_timestamp_encoded_as_seconds_and_nanos) {
    GetActualCostRequest request;
    request.resource_id = "r";
    request.start = Timestamp(std::chrono::seconds(1700000000)) + std::chrono::microseconds(5);
    auto j = nlohmann::json::parse(encode(request));
    EXPECT_EQ(j["start"]["seconds"], 1700000000);
    EXPECT_EQ(j["start"]["nanos"], 5000);
    EXPECT_FALSE(j.contains("end"));
}

TEST(CodecTest, test_encoding_is_stable) {
    ResourceDescriptor resource{"gcp", "compute", "n1", "europe-west1", {{"b", "2"}, {"a", "1"}}};
    EXPECT_EQ(encode(GetProjectedCostRequest{resource}), encode(GetProjectedCostRequest{resource}));
}

TEST(CodecTest, test_non_finite_numbers_encoded_as_strings) {
    GetProjectedCostResponse response;
    response.unit_price = std::numeric_limits<double>::quiet_NaN();
    response.cost_per_month = -std::numeric_limits<double>::infinity();
    response.currency = "USD";
    auto j = nlohmann::json::parse(encode(response));
    EXPECT_EQ(j["unit_price"], "NaN");
    EXPECT_EQ(j["cost_per_month"], "-Infinity");
}

// ========== Decoding ==========

TEST(CodecTest, test_non_finite_numbers_survive_the_wire) {
    EstimateCostResponse response;
    response.currency = "USD";
    response.cost_monthly = std::numeric_limits<double>::infinity();
    auto decoded = decode<EstimateCostResponse>(encode(response));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(std::isinf(decoded->cost_monthly));
    EXPECT_GT(decoded->cost_monthly, 0.0);

    auto projected = decode<GetProjectedCostResponse>(R"({"unit_price":"NaN","cost_per_month":1.5})");
    ASSERT_TRUE(projected.has_value());
    EXPECT_TRUE(std::isnan(projected->unit_price));
    EXPECT_DOUBLE_EQ(projected->cost_per_month, 1.5);
}

TEST(CodecTest, test_unknown_number_string_is_rejected) {
    EXPECT_FALSE(decode<GetProjectedCostResponse>(R"({"unit_price":"cheap"})").has_value());
}

TEST(CodecTest, test_decode_restores_timestamps) {
    GetActualCostRequest request;
    request.resource_id = "aws:ec2:t3.micro";
    request.start = Timestamp(std::chrono::seconds(1700000000));
    request.end = Timestamp(std::chrono::seconds(1700003600));
    auto decoded = decode<GetActualCostRequest>(encode(request));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->resource_id, request.resource_id);
    EXPECT_EQ(decoded->start, request.start);
    EXPECT_EQ(decoded->end, request.end);
}

TEST(CodecTest, test_missing_keys_decode_to_empty_values) {
    auto decoded = decode<GetActualCostResponse>(R"({"results":[{"cost":1.5}]})");
    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ(decoded->results.size(), 1u);
    EXPECT_DOUBLE_EQ(decoded->results[0].cost, 1.5);
    EXPECT_TRUE(decoded->results[0].currency.empty());
    EXPECT_FALSE(decoded->results[0].timestamp.has_value());
}

TEST(CodecTest, test_null_sub_message_decodes_to_nullopt) {
    auto decoded = decode<GetPricingSpecResponse>(R"({"spec":null})");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_FALSE(decoded->spec.has_value());
}

TEST(CodecTest, test_malformed_payload_is_rejected) {
    EXPECT_FALSE(decode<NameResponse>("{not json").has_value());
    EXPECT_FALSE(decode<NameResponse>("[1,2,3]").has_value());
    EXPECT_FALSE(decode<NameResponse>("").has_value());
}

TEST(CodecTest, test_wrong_field_type_is_rejected) {
    EXPECT_FALSE(decode<NameResponse>(R"({"name":42})").has_value());
    EXPECT_FALSE(decode<GetActualCostRequest>(R"({"start":"yesterday"})").has_value());
}

TEST(CodecTest, test_budgets_response_keeps_optional_parts) {
    GetBudgetsResponse response;
    Budget budget;
    budget.id = "b1";
    budget.amount = BudgetAmount{100.0, "USD"};
    budget.period = "monthly";
    response.budgets.push_back(budget);
    response.summary = BudgetSummary{1, 1, 0, 0};

    auto decoded = decode<GetBudgetsResponse>(encode(response));
    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ(decoded->budgets.size(), 1u);
    ASSERT_TRUE(decoded->budgets[0].amount.has_value());
    EXPECT_EQ(decoded->budgets[0].amount->currency, "USD");
    EXPECT_FALSE(decoded->budgets[0].status.has_value());
    ASSERT_TRUE(decoded->summary.has_value());
    EXPECT_EQ(decoded->summary->total_budgets, 1);
}
