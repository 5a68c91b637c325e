#pragma once
#ifndef COSTCONFORM_COST_SOURCE_SERVICE_H
#define COSTCONFORM_COST_SOURCE_SERVICE_H

#include "contract/messages.h"
#include "contract/status.h"
#include "transport/call_context.h"

namespace costconform {

// Server interface of the cost source contract. Name, Supports, GetActualCost,
// GetProjectedCost and GetPricingSpec must be implemented; the optional
// methods answer Unimplemented unless overridden.
//
// Handlers are invoked concurrently from the channel's worker threads.
class CostSourceService {
public:
    virtual ~CostSourceService() = default;

    virtual Status name(CallContext& ctx, const NameRequest& request,
                        NameResponse& response) = 0;
    virtual Status supports(CallContext& ctx, const SupportsRequest& request,
                            SupportsResponse& response) = 0;
    virtual Status get_actual_cost(CallContext& ctx, const GetActualCostRequest& request,
                                   GetActualCostResponse& response) = 0;
    virtual Status get_projected_cost(CallContext& ctx, const GetProjectedCostRequest& request,
                                      GetProjectedCostResponse& response) = 0;
    virtual Status get_pricing_spec(CallContext& ctx, const GetPricingSpecRequest& request,
                                    GetPricingSpecResponse& response) = 0;

    virtual Status estimate_cost(CallContext& ctx, const EstimateCostRequest& request,
                                 EstimateCostResponse& response);
    virtual Status get_recommendations(CallContext& ctx, const GetRecommendationsRequest& request,
                                       GetRecommendationsResponse& response);
    virtual Status get_budgets(CallContext& ctx, const GetBudgetsRequest& request,
                               GetBudgetsResponse& response);

    // Called by the harness when the implementation is bound to a channel and
    // after it is released. Throwing from on_bind() aborts the bind.
    virtual void on_bind() {}
    virtual void on_release() {}
};

}  // namespace costconform

#endif  // COSTCONFORM_COST_SOURCE_SERVICE_H
