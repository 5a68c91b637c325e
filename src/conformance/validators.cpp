#include "conformance/validators.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace costconform {

namespace {

constexpr size_t kCurrencyCodeLength = 3;

bool contains(const std::vector<std::string>& domain, const std::string& value) {
    return std::find(domain.begin(), domain.end(), value) != domain.end();
}

std::string join(const std::vector<std::string>& values, size_t limit) {
    std::string out;
    for (size_t i = 0; i < values.size() && i < limit; ++i) {
        if (i > 0) out += ", ";
        out += values[i];
    }
    if (values.size() > limit) out += ", ...";
    return out;
}

std::string number(double value) {
    std::string text = std::to_string(value);
    text.erase(text.find_last_not_of('0') + 1);
    if (!text.empty() && text.back() == '.') text.pop_back();
    return text;
}

void require(const std::string& field, const std::string& value,
             std::vector<ValidationError>& out) {
    if (value.empty()) {
        out.push_back({field, value, "non-empty string", field + " is required"});
    }
}

void require_domain(const std::string& field, const std::string& value,
                    const std::vector<std::string>& domain, std::vector<ValidationError>& out) {
    if (value.empty()) {
        require(field, value, out);
        return;
    }
    if (!contains(domain, value)) {
        out.push_back({field, value, "one of [" + join(domain, 10) + "]",
                       "invalid " + field + ": " + value});
    }
}

void require_non_negative(const std::string& field, double value,
                          std::vector<ValidationError>& out) {
    if (!std::isfinite(value)) {
        out.push_back({field, number(value), "finite number >= 0", field + " must be finite"});
    } else if (value < 0.0) {
        out.push_back({field, number(value), ">= 0", field + " cannot be negative"});
    }
}

std::string indexed(const std::string& name, size_t index, const std::string& field) {
    return name + "[" + std::to_string(index) + "]." + field;
}

}  // namespace

const std::vector<std::string>& valid_billing_modes() {
    static const std::vector<std::string> modes = {
        "per_hour", "per_minute", "per_second", "per_day", "per_week", "per_month", "per_year",
        "per_gb_month", "per_gb_hour", "per_gb_day", "per_tb_month",
        "per_request", "per_operation", "per_transaction", "per_message", "per_event",
        "per_gb_transfer", "per_gb_egress", "per_gb_ingress",
        "per_cpu_hour", "per_cpu_second", "per_core_hour", "per_vcpu_hour",
        "per_memory_gb_hour", "per_memory_gib_hour",
        "per_rcu", "per_wcu", "per_dtu", "per_iops", "per_io_operation", "per_provisioned_iops",
        "per_endpoint_hour", "per_vpc_hour", "per_nat_gateway_hour", "per_load_balancer_hour",
        "per_connection_hour",
        "per_invocation", "per_execution", "per_gb_second", "per_million_requests",
        "per_license", "per_seat", "per_user",
        "on_demand", "reserved", "spot", "savings_plan",
        "flat_rate", "tiered", "volume", "graduated",
    };
    return modes;
}

const std::vector<std::string>& valid_recommendation_categories() {
    static const std::vector<std::string> categories = {"cost", "performance", "security",
                                                        "reliability", "anomaly"};
    return categories;
}

const std::vector<std::string>& valid_action_types() {
    static const std::vector<std::string> actions = {
        "rightsize", "terminate", "purchase_commitment", "adjust_requests",
        "modify", "delete_unused", "migrate", "consolidate",
        "schedule", "refactor", "other", "investigate",
    };
    return actions;
}

const std::vector<std::string>& valid_budget_periods() {
    static const std::vector<std::string> periods = {"daily", "weekly", "monthly", "quarterly",
                                                     "annually"};
    return periods;
}

const std::vector<std::string>& valid_budget_health() {
    static const std::vector<std::string> health = {"ok", "warning", "critical", "exceeded"};
    return health;
}

const std::vector<std::string>& known_capabilities() {
    static const std::vector<std::string> caps = {capability::kEstimateCost,
                                                  capability::kRecommendations,
                                                  capability::kBudgets, "dry_run"};
    return caps;
}

bool is_valid_billing_mode(const std::string& mode) {
    return contains(valid_billing_modes(), mode);
}

void validate_currency(const std::string& field, const std::string& currency,
                       std::vector<ValidationError>& out) {
    if (currency.empty()) {
        out.push_back({field, currency, "3-character ISO 4217 code", field + " is required"});
        return;
    }
    bool upper = std::all_of(currency.begin(), currency.end(),
                             [](unsigned char c) { return std::isupper(c) != 0; });
    if (currency.size() != kCurrencyCodeLength || !upper) {
        out.push_back({field, currency, "3-character ISO 4217 code (e.g., USD, EUR, GBP)",
                       field + " must be a 3 letter uppercase code"});
    }
}

std::vector<ValidationError> validate_response(const NameResponse& response) {
    std::vector<ValidationError> out;
    require("name", response.name, out);
    if (response.name.size() > kMaxPluginNameLength) {
        out.push_back({"name", std::to_string(response.name.size()) + " characters",
                       "at most " + std::to_string(kMaxPluginNameLength) + " characters",
                       "plugin name too long"});
    }
    return out;
}

std::vector<ValidationError> validate_response(const SupportsResponse& response) {
    std::vector<ValidationError> out;
    if (!response.supported && response.reason.empty()) {
        out.push_back({"reason", "", "non-empty string when supported is false",
                       "reason is required for unsupported resources"});
    }
    for (size_t i = 0; i < response.capabilities.size(); ++i) {
        require_domain("capabilities[" + std::to_string(i) + "]", response.capabilities[i],
                       known_capabilities(), out);
    }
    return out;
}

std::vector<ValidationError> validate_response(const GetActualCostResponse& response) {
    std::vector<ValidationError> out;
    for (size_t i = 0; i < response.results.size(); ++i) {
        const auto& r = response.results[i];
        if (!r.timestamp) {
            out.push_back({indexed("results", i, "timestamp"), "", "timestamp",
                           "timestamp is required"});
        }
        validate_currency(indexed("results", i, "currency"), r.currency, out);
        require_non_negative(indexed("results", i, "cost"), r.cost, out);
        require_non_negative(indexed("results", i, "usage_amount"), r.usage_amount, out);
    }
    return out;
}

std::vector<ValidationError> validate_response(const GetProjectedCostResponse& response) {
    std::vector<ValidationError> out;
    validate_currency("currency", response.currency, out);
    require_non_negative("unit_price", response.unit_price, out);
    require_non_negative("cost_per_month", response.cost_per_month, out);
    return out;
}

std::vector<ValidationError> validate_pricing_spec(const PricingSpec& spec,
                                                   const std::string& prefix) {
    std::vector<ValidationError> out;
    require(prefix + "provider", spec.provider, out);
    require(prefix + "resource_type", spec.resource_type, out);
    require_domain(prefix + "billing_mode", spec.billing_mode, valid_billing_modes(), out);
    validate_currency(prefix + "currency", spec.currency, out);
    require_non_negative(prefix + "rate_per_unit", spec.rate_per_unit, out);
    return out;
}

std::vector<ValidationError> validate_response(const GetPricingSpecResponse& response) {
    if (!response.spec) {
        return {{"spec", "", "PricingSpec", "spec is required"}};
    }
    return validate_pricing_spec(*response.spec, "spec.");
}

std::vector<ValidationError> validate_response(const EstimateCostResponse& response) {
    std::vector<ValidationError> out;
    validate_currency("currency", response.currency, out);
    require_non_negative("cost_monthly", response.cost_monthly, out);
    return out;
}

std::vector<ValidationError> validate_response(const GetRecommendationsResponse& response) {
    std::vector<ValidationError> out;
    for (size_t i = 0; i < response.recommendations.size(); ++i) {
        const auto& rec = response.recommendations[i];
        require(indexed("recommendations", i, "id"), rec.id, out);
        require_domain(indexed("recommendations", i, "category"), rec.category,
                       valid_recommendation_categories(), out);
        require_domain(indexed("recommendations", i, "action_type"), rec.action_type,
                       valid_action_types(), out);
        if (rec.estimated_savings != 0.0 || !rec.currency.empty()) {
            validate_currency(indexed("recommendations", i, "currency"), rec.currency, out);
        }
        if (!(rec.confidence >= 0.0 && rec.confidence <= 1.0)) {
            out.push_back({indexed("recommendations", i, "confidence"), number(rec.confidence),
                           "between 0 and 1", "confidence out of range"});
        }
    }
    return out;
}

std::vector<ValidationError> validate_response(const GetBudgetsResponse& response) {
    std::vector<ValidationError> out;
    for (size_t i = 0; i < response.budgets.size(); ++i) {
        const auto& budget = response.budgets[i];
        require(indexed("budgets", i, "id"), budget.id, out);
        if (!budget.amount) {
            out.push_back({indexed("budgets", i, "amount"), "", "BudgetAmount",
                           "amount is required"});
        } else {
            require_non_negative(indexed("budgets", i, "amount.limit"), budget.amount->limit, out);
            validate_currency(indexed("budgets", i, "amount.currency"), budget.amount->currency,
                              out);
        }
        require_domain(indexed("budgets", i, "period"), budget.period, valid_budget_periods(),
                       out);
        if (budget.status) {
            require_domain(indexed("budgets", i, "status.health"), budget.status->health,
                           valid_budget_health(), out);
        }
    }
    if (response.summary) {
        const auto& s = *response.summary;
        if (s.total_budgets < 0 || s.budgets_ok < 0 || s.budgets_warning < 0 ||
            s.budgets_exceeded < 0) {
            out.push_back({"summary", "", "non-negative counts", "summary has negative counts"});
        }
    }
    return out;
}

std::string format_findings(const std::vector<ValidationError>& findings) {
    std::string out;
    for (const auto& f : findings) {
        if (!out.empty()) out += "; ";
        out += f.field + ": " + f.message + " (expected " + f.expected + ", got '" + f.value + "')";
    }
    return out;
}

}  // namespace costconform
