#include "transport/service_binding.h"

namespace costconform {

void bind_service(InProcessChannel& channel, CostSourceService& service) {
    channel.register_method(Method::Name,
                            make_unary_handler(service, &CostSourceService::name));
    channel.register_method(Method::Supports,
                            make_unary_handler(service, &CostSourceService::supports));
    channel.register_method(Method::GetActualCost,
                            make_unary_handler(service, &CostSourceService::get_actual_cost));
    channel.register_method(Method::GetProjectedCost,
                            make_unary_handler(service, &CostSourceService::get_projected_cost));
    channel.register_method(Method::GetPricingSpec,
                            make_unary_handler(service, &CostSourceService::get_pricing_spec));
    channel.register_method(Method::EstimateCost,
                            make_unary_handler(service, &CostSourceService::estimate_cost));
    channel.register_method(Method::GetRecommendations,
                            make_unary_handler(service, &CostSourceService::get_recommendations));
    channel.register_method(Method::GetBudgets,
                            make_unary_handler(service, &CostSourceService::get_budgets));
}

}  // namespace costconform
