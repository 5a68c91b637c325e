#pragma once
#ifndef COSTCONFORM_CODEC_H
#define COSTCONFORM_CODEC_H

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "contract/messages.h"

namespace costconform {

// JSON mapping of the contract messages. Absent keys and null values decode to
// the field's empty value; optional sub-messages decode to std::nullopt.
void to_json(nlohmann::json& j, const ResourceDescriptor& value);
void from_json(const nlohmann::json& j, ResourceDescriptor& value);
void to_json(nlohmann::json& j, const NameRequest& value);
void from_json(const nlohmann::json& j, NameRequest& value);
void to_json(nlohmann::json& j, const NameResponse& value);
void from_json(const nlohmann::json& j, NameResponse& value);
void to_json(nlohmann::json& j, const SupportsRequest& value);
void from_json(const nlohmann::json& j, SupportsRequest& value);
void to_json(nlohmann::json& j, const SupportsResponse& value);
void from_json(const nlohmann::json& j, SupportsResponse& value);
void to_json(nlohmann::json& j, const GetActualCostRequest& value);
void from_json(const nlohmann::json& j, GetActualCostRequest& value);
void to_json(nlohmann::json& j, const ActualCostResult& value);
void from_json(const nlohmann::json& j, ActualCostResult& value);
void to_json(nlohmann::json& j, const GetActualCostResponse& value);
void from_json(const nlohmann::json& j, GetActualCostResponse& value);
void to_json(nlohmann::json& j, const GetProjectedCostRequest& value);
void from_json(const nlohmann::json& j, GetProjectedCostRequest& value);
void to_json(nlohmann::json& j, const GetProjectedCostResponse& value);
void from_json(const nlohmann::json& j, GetProjectedCostResponse& value);
void to_json(nlohmann::json& j, const GetPricingSpecRequest& value);
void from_json(const nlohmann::json& j, GetPricingSpecRequest& value);
void to_json(nlohmann::json& j, const PricingSpec& value);
void from_json(const nlohmann::json& j, PricingSpec& value);
void to_json(nlohmann::json& j, const GetPricingSpecResponse& value);
void from_json(const nlohmann::json& j, GetPricingSpecResponse& value);
void to_json(nlohmann::json& j, const EstimateCostRequest& value);
void from_json(const nlohmann::json& j, EstimateCostRequest& value);
void to_json(nlohmann::json& j, const EstimateCostResponse& value);
void from_json(const nlohmann::json& j, EstimateCostResponse& value);
void to_json(nlohmann::json& j, const GetRecommendationsRequest& value);
void from_json(const nlohmann::json& j, GetRecommendationsRequest& value);
void to_json(nlohmann::json& j, const Recommendation& value);
void from_json(const nlohmann::json& j, Recommendation& value);
void to_json(nlohmann::json& j, const GetRecommendationsResponse& value);
void from_json(const nlohmann::json& j, GetRecommendationsResponse& value);
void to_json(nlohmann::json& j, const GetBudgetsRequest& value);
void from_json(const nlohmann::json& j, GetBudgetsRequest& value);
void to_json(nlohmann::json& j, const BudgetAmount& value);
void from_json(const nlohmann::json& j, BudgetAmount& value);
void to_json(nlohmann::json& j, const BudgetStatus& value);
void from_json(const nlohmann::json& j, BudgetStatus& value);
void to_json(nlohmann::json& j, const Budget& value);
void from_json(const nlohmann::json& j, Budget& value);
void to_json(nlohmann::json& j, const BudgetSummary& value);
void from_json(const nlohmann::json& j, BudgetSummary& value);
void to_json(nlohmann::json& j, const GetBudgetsResponse& value);
void from_json(const nlohmann::json& j, GetBudgetsResponse& value);

template <typename Message>
std::string encode(const Message& message) {
    nlohmann::json j = message;
    return j.dump();
}

// Returns std::nullopt for payloads that are not a JSON object or whose
// fields have the wrong type.
template <typename Message>
std::optional<Message> decode(const std::string& bytes) {
    nlohmann::json j = nlohmann::json::parse(bytes, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }
    try {
        return j.get<Message>();
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

}  // namespace costconform

#endif  // COSTCONFORM_CODEC_H
