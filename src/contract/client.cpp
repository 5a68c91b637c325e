#include "contract/client.h"

namespace costconform {

template <typename Response, typename Request>
RpcResult<Response> CostSourceClient::invoke(Method method, ClientContext& ctx,
                                             const Request& request) {
    RpcResult<Response> result;
    std::string payload;
    result.status = channel_.unary_call(method, ctx, encode(request), payload);
    if (!result.status.is_ok()) {
        return result;
    }
    result.response = decode<Response>(payload);
    if (!result.response) {
        result.status = Status::transport(
            StatusCode::Internal,
            std::string("failed to decode ") + method_name(method) + " response");
    }
    return result;
}

RpcResult<NameResponse> CostSourceClient::name(ClientContext& ctx, const NameRequest& request) {
    return invoke<NameResponse>(Method::Name, ctx, request);
}

RpcResult<SupportsResponse> CostSourceClient::supports(ClientContext& ctx,
                                                       const SupportsRequest& request) {
    return invoke<SupportsResponse>(Method::Supports, ctx, request);
}

RpcResult<GetActualCostResponse> CostSourceClient::get_actual_cost(
    ClientContext& ctx, const GetActualCostRequest& request) {
    return invoke<GetActualCostResponse>(Method::GetActualCost, ctx, request);
}

RpcResult<GetProjectedCostResponse> CostSourceClient::get_projected_cost(
    ClientContext& ctx, const GetProjectedCostRequest& request) {
    return invoke<GetProjectedCostResponse>(Method::GetProjectedCost, ctx, request);
}

RpcResult<GetPricingSpecResponse> CostSourceClient::get_pricing_spec(
    ClientContext& ctx, const GetPricingSpecRequest& request) {
    return invoke<GetPricingSpecResponse>(Method::GetPricingSpec, ctx, request);
}

RpcResult<EstimateCostResponse> CostSourceClient::estimate_cost(
    ClientContext& ctx, const EstimateCostRequest& request) {
    return invoke<EstimateCostResponse>(Method::EstimateCost, ctx, request);
}

RpcResult<GetRecommendationsResponse> CostSourceClient::get_recommendations(
    ClientContext& ctx, const GetRecommendationsRequest& request) {
    return invoke<GetRecommendationsResponse>(Method::GetRecommendations, ctx, request);
}

RpcResult<GetBudgetsResponse> CostSourceClient::get_budgets(ClientContext& ctx,
                                                            const GetBudgetsRequest& request) {
    return invoke<GetBudgetsResponse>(Method::GetBudgets, ctx, request);
}

Status CostSourceClient::call_raw(Method method, ClientContext& ctx, const std::string& request,
                                  std::string& response) {
    return channel_.unary_call(method, ctx, request, response);
}

}  // namespace costconform
