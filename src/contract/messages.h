#pragma once
#ifndef COSTCONFORM_MESSAGES_H
#define COSTCONFORM_MESSAGES_H

#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace costconform {

using Timestamp = std::chrono::system_clock::time_point;

// Methods of the cost source contract. The first five are mandatory.
enum class Method {
    Name,
    Supports,
    GetActualCost,
    GetProjectedCost,
    GetPricingSpec,
    EstimateCost,
    GetRecommendations,
    GetBudgets,
};

constexpr std::array<Method, 8> kAllMethods = {
    Method::Name,           Method::Supports,     Method::GetActualCost,
    Method::GetProjectedCost, Method::GetPricingSpec, Method::EstimateCost,
    Method::GetRecommendations, Method::GetBudgets,
};

const char* method_name(Method method);
bool is_optional_method(Method method);
// Capability string a plugin advertises through Supports for an optional
// method; nullptr for mandatory methods.
const char* capability_for(Method method);

namespace capability {
constexpr const char* kEstimateCost = "estimate_cost";
constexpr const char* kRecommendations = "recommendations";
constexpr const char* kBudgets = "budgets";
}  // namespace capability

struct ResourceDescriptor {
    std::string provider;
    std::string resource_type;
    std::string sku;
    std::string region;
    std::map<std::string, std::string> tags;
};

struct NameRequest {};

struct NameResponse {
    std::string name;
};

struct SupportsRequest {
    std::optional<ResourceDescriptor> resource;
};

struct SupportsResponse {
    bool supported = false;
    std::string reason;
    std::vector<std::string> capabilities;
};

struct GetActualCostRequest {
    std::string resource_id;
    std::optional<Timestamp> start;
    std::optional<Timestamp> end;
};

struct ActualCostResult {
    std::optional<Timestamp> timestamp;
    double cost = 0.0;
    double usage_amount = 0.0;
    std::string usage_unit;
    std::string currency;
    std::string source;
};

struct GetActualCostResponse {
    std::vector<ActualCostResult> results;
};

struct GetProjectedCostRequest {
    std::optional<ResourceDescriptor> resource;
};

struct GetProjectedCostResponse {
    double unit_price = 0.0;
    std::string currency;
    double cost_per_month = 0.0;
    std::string billing_detail;
};

struct GetPricingSpecRequest {
    std::optional<ResourceDescriptor> resource;
};

struct PricingSpec {
    std::string provider;
    std::string resource_type;
    std::string sku;
    std::string region;
    std::string billing_mode;
    double rate_per_unit = 0.0;
    std::string currency;
    std::string description;
};

struct GetPricingSpecResponse {
    std::optional<PricingSpec> spec;
};

struct EstimateCostRequest {
    std::string resource_type;
    std::map<std::string, std::string> attributes;
};

struct EstimateCostResponse {
    std::string currency;
    double cost_monthly = 0.0;
};

struct GetRecommendationsRequest {
    std::vector<ResourceDescriptor> target_resources;
    int32_t page_size = 0;
    std::string page_token;
};

struct Recommendation {
    std::string id;
    std::string category;
    std::string action_type;
    std::string resource_id;
    double estimated_savings = 0.0;
    std::string currency;
    double confidence = 0.0;
};

struct GetRecommendationsResponse {
    std::vector<Recommendation> recommendations;
    std::string next_page_token;
};

struct GetBudgetsRequest {
    std::string provider_filter;
    bool include_status = false;
};

struct BudgetAmount {
    double limit = 0.0;
    std::string currency;
};

struct BudgetStatus {
    double current_spend = 0.0;
    double percentage_used = 0.0;
    std::string health;
};

struct Budget {
    std::string id;
    std::string name;
    std::string source;
    std::optional<BudgetAmount> amount;
    std::string period;
    std::optional<BudgetStatus> status;
};

struct BudgetSummary {
    int32_t total_budgets = 0;
    int32_t budgets_ok = 0;
    int32_t budgets_warning = 0;
    int32_t budgets_exceeded = 0;
};

struct GetBudgetsResponse {
    std::vector<Budget> budgets;
    std::optional<BudgetSummary> summary;
};

}  // namespace costconform

#endif  // COSTCONFORM_MESSAGES_H
