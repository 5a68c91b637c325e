#include "contract/cost_source_service.h"

namespace costconform {

Status CostSourceService::estimate_cost(CallContext&, const EstimateCostRequest&,
                                        EstimateCostResponse&) {
    return Status(StatusCode::Unimplemented, "EstimateCost not implemented");
}

Status CostSourceService::get_recommendations(CallContext&, const GetRecommendationsRequest&,
                                              GetRecommendationsResponse&) {
    return Status(StatusCode::Unimplemented, "GetRecommendations not implemented");
}

Status CostSourceService::get_budgets(CallContext&, const GetBudgetsRequest&,
                                      GetBudgetsResponse&) {
    return Status(StatusCode::Unimplemented, "GetBudgets not implemented");
}

}  // namespace costconform
