#include "conformance/baselines.h"

namespace costconform {

namespace {

PerformanceBaseline entry(const char* operation, Method method, int standard_ms,
                          std::optional<int> advanced_ms, bool at_standard = true) {
    PerformanceBaseline b;
    b.operation = operation;
    b.method = method;
    b.standard_ceiling = std::chrono::milliseconds(standard_ms);
    b.measured_at_standard = at_standard;
    if (advanced_ms) {
        b.advanced_ceiling = std::chrono::milliseconds(*advanced_ms);
    }
    return b;
}

}  // namespace

const std::vector<PerformanceBaseline>& default_baselines() {
    static const std::vector<PerformanceBaseline> baselines = {
        entry("Name", Method::Name, 100, 50),
        entry("Supports", Method::Supports, 50, 25),
        entry("GetProjectedCost", Method::GetProjectedCost, 200, 100),
        entry("GetPricingSpec", Method::GetPricingSpec, 200, 100),
        entry("GetActualCost_24h", Method::GetActualCost, 2000, 1000),
        entry("GetActualCost_30d", Method::GetActualCost, 0, 10000, false),
        entry("EstimateCost", Method::EstimateCost, 200, 100),
        entry("GetRecommendations", Method::GetRecommendations, 5000, 2000),
        entry("GetBudgets", Method::GetBudgets, 5000, 2000),
    };
    return baselines;
}

std::optional<PerformanceBaseline> find_baseline(
    const std::string& operation,
    const std::map<std::string, PerformanceBaseline>& overrides) {
    const PerformanceBaseline* defaults = nullptr;
    for (const auto& b : default_baselines()) {
        if (b.operation == operation) defaults = &b;
    }
    if (defaults == nullptr) {
        return std::nullopt;
    }
    auto it = overrides.find(operation);
    if (it == overrides.end()) {
        return *defaults;
    }
    // Overrides change ceilings only; the measured operation stays the same.
    PerformanceBaseline b = it->second;
    b.operation = defaults->operation;
    b.method = defaults->method;
    return b;
}

}  // namespace costconform
