#include "conformance/spec_validation.h"

#include <spdlog/spdlog.h>
#include "conformance/validators.h"

namespace costconform {

namespace {

template <typename Response, typename Call>
TestResult check_schema(CheckContext& ctx, Method method, Call&& call) {
    const std::string name = std::string(method_name(method)) + "_ResponseSchema";
    if (auto reason = ctx.skip_reason(method)) {
        return skipped_result(name, TestCategory::SpecValidation, ConformanceLevel::Basic, *reason);
    }

    TestResult result = make_result(name, TestCategory::SpecValidation, ConformanceLevel::Basic);
    auto start = Clock::now();
    ClientContext call_ctx = ctx.new_call();
    RpcResult<Response> rpc = call(call_ctx);
    result.duration = elapsed_since(start);

    if (!rpc.ok()) {
        if (is_optional_method(method) && !rpc.status.from_transport() &&
            rpc.status.code() == StatusCode::Unimplemented) {
            ctx.mark_unimplemented(method);
            return skipped_result(name, TestCategory::SpecValidation, ConformanceLevel::Basic,
                                  rpc.status.to_string());
        }
        record_call_failure(result, rpc.status);
        return result;
    }

    auto findings = validate_response(*rpc.response);
    if (!findings.empty()) {
        fail(result, std::to_string(findings.size()) + " schema violation(s): " +
                         format_findings(findings));
    }
    return result;
}

}  // namespace

std::vector<TestResult> SpecValidationModule::run(CheckContext& ctx) {
    std::vector<TestResult> results;
    auto& client = ctx.client();

    results.push_back(check_schema<NameResponse>(ctx, Method::Name, [&](ClientContext& c) {
        return client.name(c, NameRequest{});
    }));
    results.push_back(check_schema<SupportsResponse>(ctx, Method::Supports, [&](ClientContext& c) {
        return client.supports(c, ctx.supports_request());
    }));
    results.push_back(
        check_schema<GetActualCostResponse>(ctx, Method::GetActualCost, [&](ClientContext& c) {
            return client.get_actual_cost(c, ctx.actual_cost_request(std::chrono::hours(24)));
        }));
    results.push_back(check_schema<GetProjectedCostResponse>(
        ctx, Method::GetProjectedCost,
        [&](ClientContext& c) { return client.get_projected_cost(c, ctx.projected_cost_request()); }));
    results.push_back(check_schema<GetPricingSpecResponse>(
        ctx, Method::GetPricingSpec,
        [&](ClientContext& c) { return client.get_pricing_spec(c, ctx.pricing_spec_request()); }));
    results.push_back(check_schema<EstimateCostResponse>(
        ctx, Method::EstimateCost,
        [&](ClientContext& c) { return client.estimate_cost(c, ctx.estimate_cost_request()); }));
    results.push_back(check_schema<GetRecommendationsResponse>(
        ctx, Method::GetRecommendations, [&](ClientContext& c) {
            return client.get_recommendations(c, ctx.recommendations_request());
        }));
    results.push_back(check_schema<GetBudgetsResponse>(
        ctx, Method::GetBudgets,
        [&](ClientContext& c) { return client.get_budgets(c, ctx.budgets_request()); }));

    for (const auto& r : results) {
        spdlog::debug("[spec_validation] {} {} ({:.1f}ms){}", r.name, to_string(r.status),
                      std::chrono::duration<double, std::milli>(r.duration).count(),
                      r.error ? ": " + *r.error : std::string());
    }
    return results;
}

}  // namespace costconform
