#pragma once
#ifndef COSTCONFORM_VALIDATORS_H
#define COSTCONFORM_VALIDATORS_H

#include <cstddef>
#include <string>
#include <vector>
#include "contract/messages.h"

namespace costconform {

constexpr size_t kMaxPluginNameLength = 100;

// One structural finding in a response.
struct ValidationError {
    std::string field;
    std::string value;
    std::string expected;
    std::string message;
};

const std::vector<std::string>& valid_billing_modes();
const std::vector<std::string>& valid_recommendation_categories();
const std::vector<std::string>& valid_action_types();
const std::vector<std::string>& valid_budget_periods();
const std::vector<std::string>& valid_budget_health();
const std::vector<std::string>& known_capabilities();

bool is_valid_billing_mode(const std::string& mode);

// Each validator walks every required field and enum domain of the response
// and returns all findings; an empty vector means the response is well formed.
std::vector<ValidationError> validate_response(const NameResponse& response);
std::vector<ValidationError> validate_response(const SupportsResponse& response);
std::vector<ValidationError> validate_response(const GetActualCostResponse& response);
std::vector<ValidationError> validate_response(const GetProjectedCostResponse& response);
std::vector<ValidationError> validate_response(const GetPricingSpecResponse& response);
std::vector<ValidationError> validate_response(const EstimateCostResponse& response);
std::vector<ValidationError> validate_response(const GetRecommendationsResponse& response);
std::vector<ValidationError> validate_response(const GetBudgetsResponse& response);

std::vector<ValidationError> validate_pricing_spec(const PricingSpec& spec,
                                                   const std::string& prefix = "");
void validate_currency(const std::string& field, const std::string& currency,
                       std::vector<ValidationError>& out);

// "field: message (expected ..., got ...)" joined with "; ".
std::string format_findings(const std::vector<ValidationError>& findings);

}  // namespace costconform

#endif  // COSTCONFORM_VALIDATORS_H
