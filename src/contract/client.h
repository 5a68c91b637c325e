#pragma once
#ifndef COSTCONFORM_CLIENT_H
#define COSTCONFORM_CLIENT_H

#include <string>
#include "contract/codec.h"
#include "contract/messages.h"
#include "contract/status.h"
#include "transport/call_context.h"
#include "transport/channel.h"

namespace costconform {

// Typed client stub over an InProcessChannel. Every call encodes the request,
// crosses the channel and decodes the response.
class CostSourceClient {
public:
    explicit CostSourceClient(InProcessChannel& channel) : channel_(channel) {}

    RpcResult<NameResponse> name(ClientContext& ctx, const NameRequest& request);
    RpcResult<SupportsResponse> supports(ClientContext& ctx, const SupportsRequest& request);
    RpcResult<GetActualCostResponse> get_actual_cost(ClientContext& ctx,
                                                     const GetActualCostRequest& request);
    RpcResult<GetProjectedCostResponse> get_projected_cost(ClientContext& ctx,
                                                           const GetProjectedCostRequest& request);
    RpcResult<GetPricingSpecResponse> get_pricing_spec(ClientContext& ctx,
                                                       const GetPricingSpecRequest& request);
    RpcResult<EstimateCostResponse> estimate_cost(ClientContext& ctx,
                                                  const EstimateCostRequest& request);
    RpcResult<GetRecommendationsResponse> get_recommendations(
        ClientContext& ctx, const GetRecommendationsRequest& request);
    RpcResult<GetBudgetsResponse> get_budgets(ClientContext& ctx, const GetBudgetsRequest& request);

    // Raw exchange, for probing the transport with payloads the typed stubs
    // cannot produce.
    Status call_raw(Method method, ClientContext& ctx, const std::string& request,
                    std::string& response);

private:
    InProcessChannel& channel_;

    template <typename Response, typename Request>
    RpcResult<Response> invoke(Method method, ClientContext& ctx, const Request& request);
};

}  // namespace costconform

#endif  // COSTCONFORM_CLIENT_H
