#include "contract/codec.h"

#include <cmath>
#include <limits>

namespace costconform {

using nlohmann::json;

namespace {

template <typename T>
void read(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        it->get_to(out);
    }
}

// Non-finite numbers travel as the strings "NaN", "Infinity" and "-Infinity",
// as in the protobuf JSON mapping; plain JSON has no literal for them.
json number(double value) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value > 0 ? "Infinity" : "-Infinity";
    return value;
}

void read(const json& j, const char* key, double& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    if (it->is_string()) {
        const auto& text = it->get_ref<const std::string&>();
        if (text == "NaN") {
            out = std::numeric_limits<double>::quiet_NaN();
        } else if (text == "Infinity") {
            out = std::numeric_limits<double>::infinity();
        } else if (text == "-Infinity") {
            out = -std::numeric_limits<double>::infinity();
        } else {
            throw json::type_error::create(302, std::string(key) + " must be a number", &j);
        }
        return;
    }
    it->get_to(out);
}

template <typename T>
void read_optional(const json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out.reset();
        return;
    }
    out = it->get<T>();
}

template <typename T>
void write_optional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

json timestamp_to_json(const Timestamp& ts) {
    auto since_epoch = ts.time_since_epoch();
    auto seconds = std::chrono::floor<std::chrono::seconds>(since_epoch);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - seconds);
    return json{{"seconds", seconds.count()}, {"nanos", nanos.count()}};
}

Timestamp timestamp_from_json(const json& j) {
    int64_t seconds = 0;
    int64_t nanos = 0;
    read(j, "seconds", seconds);
    read(j, "nanos", nanos);
    auto since_epoch = std::chrono::seconds(seconds) + std::chrono::nanoseconds(nanos);
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(since_epoch));
}

void write_timestamp(json& j, const char* key, const std::optional<Timestamp>& ts) {
    if (ts) {
        j[key] = timestamp_to_json(*ts);
    }
}

void read_timestamp(const json& j, const char* key, std::optional<Timestamp>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out.reset();
        return;
    }
    if (!it->is_object()) {
        throw json::type_error::create(302, std::string(key) + " must be an object", &j);
    }
    out = timestamp_from_json(*it);
}

}  // namespace

void to_json(json& j, const ResourceDescriptor& value) {
    j = json{{"provider", value.provider},
             {"resource_type", value.resource_type},
             {"sku", value.sku},
             {"region", value.region},
             {"tags", value.tags}};
}

void from_json(const json& j, ResourceDescriptor& value) {
    read(j, "provider", value.provider);
    read(j, "resource_type", value.resource_type);
    read(j, "sku", value.sku);
    read(j, "region", value.region);
    read(j, "tags", value.tags);
}

void to_json(json& j, const NameRequest&) {
    j = json::object();
}

void from_json(const json&, NameRequest&) {}

void to_json(json& j, const NameResponse& value) {
    j = json{{"name", value.name}};
}

void from_json(const json& j, NameResponse& value) {
    read(j, "name", value.name);
}

void to_json(json& j, const SupportsRequest& value) {
    j = json::object();
    write_optional(j, "resource", value.resource);
}

void from_json(const json& j, SupportsRequest& value) {
    read_optional(j, "resource", value.resource);
}

void to_json(json& j, const SupportsResponse& value) {
    j = json{{"supported", value.supported},
             {"reason", value.reason},
             {"capabilities", value.capabilities}};
}

void from_json(const json& j, SupportsResponse& value) {
    read(j, "supported", value.supported);
    read(j, "reason", value.reason);
    read(j, "capabilities", value.capabilities);
}

void to_json(json& j, const GetActualCostRequest& value) {
    j = json{{"resource_id", value.resource_id}};
    write_timestamp(j, "start", value.start);
    write_timestamp(j, "end", value.end);
}

void from_json(const json& j, GetActualCostRequest& value) {
    read(j, "resource_id", value.resource_id);
    read_timestamp(j, "start", value.start);
    read_timestamp(j, "end", value.end);
}

void to_json(json& j, const ActualCostResult& value) {
    j = json{{"cost", number(value.cost)},
             {"usage_amount", number(value.usage_amount)},
             {"usage_unit", value.usage_unit},
             {"currency", value.currency},
             {"source", value.source}};
    write_timestamp(j, "timestamp", value.timestamp);
}

void from_json(const json& j, ActualCostResult& value) {
    read_timestamp(j, "timestamp", value.timestamp);
    read(j, "cost", value.cost);
    read(j, "usage_amount", value.usage_amount);
    read(j, "usage_unit", value.usage_unit);
    read(j, "currency", value.currency);
    read(j, "source", value.source);
}

void to_json(json& j, const GetActualCostResponse& value) {
    j = json{{"results", value.results}};
}

void from_json(const json& j, GetActualCostResponse& value) {
    read(j, "results", value.results);
}

void to_json(json& j, const GetProjectedCostRequest& value) {
    j = json::object();
    write_optional(j, "resource", value.resource);
}

void from_json(const json& j, GetProjectedCostRequest& value) {
    read_optional(j, "resource", value.resource);
}

void to_json(json& j, const GetProjectedCostResponse& value) {
    j = json{{"unit_price", number(value.unit_price)},
             {"currency", value.currency},
             {"cost_per_month", number(value.cost_per_month)},
             {"billing_detail", value.billing_detail}};
}

void from_json(const json& j, GetProjectedCostResponse& value) {
    read(j, "unit_price", value.unit_price);
    read(j, "currency", value.currency);
    read(j, "cost_per_month", value.cost_per_month);
    read(j, "billing_detail", value.billing_detail);
}

void to_json(json& j, const GetPricingSpecRequest& value) {
    j = json::object();
    write_optional(j, "resource", value.resource);
}

void from_json(const json& j, GetPricingSpecRequest& value) {
    read_optional(j, "resource", value.resource);
}

void to_json(json& j, const PricingSpec& value) {
    j = json{{"provider", value.provider},
             {"resource_type", value.resource_type},
             {"sku", value.sku},
             {"region", value.region},
             {"billing_mode", value.billing_mode},
             {"rate_per_unit", number(value.rate_per_unit)},
             {"currency", value.currency},
             {"description", value.description}};
}

void from_json(const json& j, PricingSpec& value) {
    read(j, "provider", value.provider);
    read(j, "resource_type", value.resource_type);
    read(j, "sku", value.sku);
    read(j, "region", value.region);
    read(j, "billing_mode", value.billing_mode);
    read(j, "rate_per_unit", value.rate_per_unit);
    read(j, "currency", value.currency);
    read(j, "description", value.description);
}

void to_json(json& j, const GetPricingSpecResponse& value) {
    j = json::object();
    write_optional(j, "spec", value.spec);
}

void from_json(const json& j, GetPricingSpecResponse& value) {
    read_optional(j, "spec", value.spec);
}

void to_json(json& j, const EstimateCostRequest& value) {
    j = json{{"resource_type", value.resource_type}, {"attributes", value.attributes}};
}

void from_json(const json& j, EstimateCostRequest& value) {
    read(j, "resource_type", value.resource_type);
    read(j, "attributes", value.attributes);
}

void to_json(json& j, const EstimateCostResponse& value) {
    j = json{{"currency", value.currency}, {"cost_monthly", number(value.cost_monthly)}};
}

void from_json(const json& j, EstimateCostResponse& value) {
    read(j, "currency", value.currency);
    read(j, "cost_monthly", value.cost_monthly);
}

void to_json(json& j, const GetRecommendationsRequest& value) {
    j = json{{"target_resources", value.target_resources},
             {"page_size", value.page_size},
             {"page_token", value.page_token}};
}

void from_json(const json& j, GetRecommendationsRequest& value) {
    read(j, "target_resources", value.target_resources);
    read(j, "page_size", value.page_size);
    read(j, "page_token", value.page_token);
}

void to_json(json& j, const Recommendation& value) {
    j = json{{"id", value.id},
             {"category", value.category},
             {"action_type", value.action_type},
             {"resource_id", value.resource_id},
             {"estimated_savings", number(value.estimated_savings)},
             {"currency", value.currency},
             {"confidence", number(value.confidence)}};
}

void from_json(const json& j, Recommendation& value) {
    read(j, "id", value.id);
    read(j, "category", value.category);
    read(j, "action_type", value.action_type);
    read(j, "resource_id", value.resource_id);
    read(j, "estimated_savings", value.estimated_savings);
    read(j, "currency", value.currency);
    read(j, "confidence", value.confidence);
}

void to_json(json& j, const GetRecommendationsResponse& value) {
    j = json{{"recommendations", value.recommendations},
             {"next_page_token", value.next_page_token}};
}

void from_json(const json& j, GetRecommendationsResponse& value) {
    read(j, "recommendations", value.recommendations);
    read(j, "next_page_token", value.next_page_token);
}

void to_json(json& j, const GetBudgetsRequest& value) {
    j = json{{"provider_filter", value.provider_filter},
             {"include_status", value.include_status}};
}

void from_json(const json& j, GetBudgetsRequest& value) {
    read(j, "provider_filter", value.provider_filter);
    read(j, "include_status", value.include_status);
}

void to_json(json& j, const BudgetAmount& value) {
    j = json{{"limit", number(value.limit)}, {"currency", value.currency}};
}

void from_json(const json& j, BudgetAmount& value) {
    read(j, "limit", value.limit);
    read(j, "currency", value.currency);
}

void to_json(json& j, const BudgetStatus& value) {
    j = json{{"current_spend", number(value.current_spend)},
             {"percentage_used", number(value.percentage_used)},
             {"health", value.health}};
}

void from_json(const json& j, BudgetStatus& value) {
    read(j, "current_spend", value.current_spend);
    read(j, "percentage_used", value.percentage_used);
    read(j, "health", value.health);
}

void to_json(json& j, const Budget& value) {
    j = json{{"id", value.id},
             {"name", value.name},
             {"source", value.source},
             {"period", value.period}};
    write_optional(j, "amount", value.amount);
    write_optional(j, "status", value.status);
}

void from_json(const json& j, Budget& value) {
    read(j, "id", value.id);
    read(j, "name", value.name);
    read(j, "source", value.source);
    read_optional(j, "amount", value.amount);
    read(j, "period", value.period);
    read_optional(j, "status", value.status);
}

void to_json(json& j, const BudgetSummary& value) {
    j = json{{"total_budgets", value.total_budgets},
             {"budgets_ok", value.budgets_ok},
             {"budgets_warning", value.budgets_warning},
             {"budgets_exceeded", value.budgets_exceeded}};
}

void from_json(const json& j, BudgetSummary& value) {
    read(j, "total_budgets", value.total_budgets);
    read(j, "budgets_ok", value.budgets_ok);
    read(j, "budgets_warning", value.budgets_warning);
    read(j, "budgets_exceeded", value.budgets_exceeded);
}

void to_json(json& j, const GetBudgetsResponse& value) {
    j = json{{"budgets", value.budgets}};
    write_optional(j, "summary", value.summary);
}

void from_json(const json& j, GetBudgetsResponse& value) {
    read(j, "budgets", value.budgets);
    read_optional(j, "summary", value.summary);
}

}  // namespace costconform
