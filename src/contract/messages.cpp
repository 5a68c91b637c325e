#include "contract/messages.h"

namespace costconform {

const char* method_name(Method method) {
    switch (method) {
        case Method::Name: return "Name";
        case Method::Supports: return "Supports";
        case Method::GetActualCost: return "GetActualCost";
        case Method::GetProjectedCost: return "GetProjectedCost";
        case Method::GetPricingSpec: return "GetPricingSpec";
        case Method::EstimateCost: return "EstimateCost";
        case Method::GetRecommendations: return "GetRecommendations";
        case Method::GetBudgets: return "GetBudgets";
    }
    return "Unknown";
}

bool is_optional_method(Method method) {
    return capability_for(method) != nullptr;
}

const char* capability_for(Method method) {
    switch (method) {
        case Method::EstimateCost: return capability::kEstimateCost;
        case Method::GetRecommendations: return capability::kRecommendations;
        case Method::GetBudgets: return capability::kBudgets;
        default: return nullptr;
    }
}

}  // namespace costconform
