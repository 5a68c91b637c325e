#include "conformance/rpc_correctness.h"

#include <functional>
#include <utility>
#include <spdlog/spdlog.h>
#include "conformance/validators.h"

namespace costconform {

namespace {

constexpr TestCategory kCategory = TestCategory::RPCCorrectness;

std::string check_name(Method method, const char* check) {
    return std::string(method_name(method)) + "_" + check;
}

bool is_invalid_argument(StatusCode code) {
    return code == StatusCode::InvalidArgument;
}

// Any deliberate refusal. OK, Internal and Unknown are not.
bool is_defined_rejection(StatusCode code) {
    return code != StatusCode::Ok && code != StatusCode::Internal &&
           code != StatusCode::Unknown;
}

template <typename Response>
bool never_accept(const Response&) {
    return false;
}

// Per-method run state: once a method turns out to be unimplemented, its
// remaining checks are skipped.
class MethodChecks {
public:
    MethodChecks(CheckContext& ctx, Method method, std::vector<TestResult>& out)
        : ctx_(ctx), method_(method), out_(out) {}

    template <typename Response, typename Call>
    void expect_success(const char* check, Call&& call,
                        std::function<std::optional<std::string>(const Response&)> extra = {}) {
        const std::string name = check_name(method_, check);
        if (skip(name)) return;

        TestResult result = make_result(name, kCategory, ConformanceLevel::Basic);
        auto start = Clock::now();
        ClientContext call_ctx = ctx_.new_call();
        RpcResult<Response> rpc = call(call_ctx);
        result.duration = elapsed_since(start);

        if (!rpc.ok()) {
            if (is_optional_method(method_) && !rpc.status.from_transport() &&
                rpc.status.code() == StatusCode::Unimplemented) {
                ctx_.mark_unimplemented(method_);
                out_.push_back(skipped_result(name, kCategory, ConformanceLevel::Basic,
                                              rpc.status.to_string()));
                return;
            }
            record_call_failure(result, rpc.status);
        } else if (auto findings = validate_response(*rpc.response); !findings.empty()) {
            fail(result, "malformed response: " + format_findings(findings));
        } else if (extra) {
            if (auto problem = extra(*rpc.response)) {
                fail(result, *problem);
            }
        }
        out_.push_back(std::move(result));
    }

    template <typename Response, typename Call>
    void expect_rejection(const char* check, const char* expected, bool (*acceptable)(StatusCode),
                          Call&& call, bool (*accept_ok)(const Response&) = never_accept<Response>) {
        const std::string name = check_name(method_, check);
        if (skip(name)) return;

        TestResult result = make_result(name, kCategory, ConformanceLevel::Basic);
        auto start = Clock::now();
        ClientContext call_ctx = ctx_.new_call();
        RpcResult<Response> rpc = call(call_ctx);
        result.duration = elapsed_since(start);

        if (rpc.ok()) {
            if (!accept_ok(*rpc.response)) {
                fail(result, std::string("request was accepted, expected ") + expected);
            }
        } else if (rpc.status.from_transport()) {
            record_call_failure(result, rpc.status);
        } else if (!acceptable(rpc.status.code())) {
            fail(result, std::string("expected ") + expected + ", got " + rpc.status.to_string());
        }
        out_.push_back(std::move(result));
    }

private:
    CheckContext& ctx_;
    Method method_;
    std::vector<TestResult>& out_;

    bool skip(const std::string& name) {
        if (auto reason = ctx_.skip_reason(method_)) {
            out_.push_back(skipped_result(name, kCategory, ConformanceLevel::Basic, *reason));
            return true;
        }
        return false;
    }
};

bool unsupported_flagged(const SupportsResponse& response) {
    return !response.supported;
}

bool no_budgets(const GetBudgetsResponse& response) {
    return response.budgets.empty();
}

void check_name_method(CheckContext& ctx, std::vector<TestResult>& out) {
    MethodChecks checks(ctx, Method::Name, out);
    checks.expect_success<NameResponse>(
        "ValidRequest", [&](ClientContext& c) { return ctx.client().name(c, NameRequest{}); });
}

void check_supports(CheckContext& ctx, std::vector<TestResult>& out) {
    MethodChecks checks(ctx, Method::Supports, out);
    checks.expect_success<SupportsResponse>("ValidRequest", [&](ClientContext& c) {
        return ctx.client().supports(c, ctx.supports_request());
    });
    checks.expect_rejection<SupportsResponse>(
        "AbsentDescriptor", "InvalidArgument or supported=false", is_invalid_argument,
        [&](ClientContext& c) { return ctx.client().supports(c, SupportsRequest{}); },
        unsupported_flagged);
    checks.expect_rejection<SupportsResponse>(
        "UnsupportedResource", "a rejection code or supported=false", is_defined_rejection,
        [&](ClientContext& c) {
            return ctx.client().supports(c, SupportsRequest{ctx.unsupported_resource()});
        },
        unsupported_flagged);
}

void check_actual_cost(CheckContext& ctx, std::vector<TestResult>& out) {
    MethodChecks checks(ctx, Method::GetActualCost, out);
    checks.expect_success<GetActualCostResponse>("ValidRequest", [&](ClientContext& c) {
        return ctx.client().get_actual_cost(c, ctx.actual_cost_request(std::chrono::hours(24)));
    });
    checks.expect_rejection<GetActualCostResponse>(
        "AbsentDescriptor", "InvalidArgument", is_invalid_argument, [&](ClientContext& c) {
            auto request = ctx.actual_cost_request(std::chrono::hours(24));
            request.resource_id.clear();
            return ctx.client().get_actual_cost(c, request);
        });
    checks.expect_rejection<GetActualCostResponse>(
        "InvertedRange", "InvalidArgument", is_invalid_argument, [&](ClientContext& c) {
            auto request = ctx.actual_cost_request(std::chrono::hours(24));
            std::swap(request.start, request.end);
            return ctx.client().get_actual_cost(c, request);
        });
    checks.expect_rejection<GetActualCostResponse>(
        "ZeroWidthRange", "InvalidArgument", is_invalid_argument, [&](ClientContext& c) {
            auto request = ctx.actual_cost_request(std::chrono::hours(24));
            request.start = request.end;
            return ctx.client().get_actual_cost(c, request);
        });
    checks.expect_rejection<GetActualCostResponse>(
        "MissingRange", "InvalidArgument", is_invalid_argument, [&](ClientContext& c) {
            auto request = ctx.actual_cost_request(std::chrono::hours(24));
            request.start.reset();
            request.end.reset();
            return ctx.client().get_actual_cost(c, request);
        });
}

void check_projected_cost(CheckContext& ctx, std::vector<TestResult>& out) {
    MethodChecks checks(ctx, Method::GetProjectedCost, out);
    checks.expect_success<GetProjectedCostResponse>("ValidRequest", [&](ClientContext& c) {
        return ctx.client().get_projected_cost(c, ctx.projected_cost_request());
    });
    checks.expect_rejection<GetProjectedCostResponse>(
        "AbsentDescriptor", "InvalidArgument", is_invalid_argument, [&](ClientContext& c) {
            return ctx.client().get_projected_cost(c, GetProjectedCostRequest{});
        });
    checks.expect_rejection<GetProjectedCostResponse>(
        "UnsupportedResource", "a rejection code", is_defined_rejection, [&](ClientContext& c) {
            return ctx.client().get_projected_cost(
                c, GetProjectedCostRequest{ctx.unsupported_resource()});
        });
}

void check_pricing_spec(CheckContext& ctx, std::vector<TestResult>& out) {
    MethodChecks checks(ctx, Method::GetPricingSpec, out);
    checks.expect_success<GetPricingSpecResponse>("ValidRequest", [&](ClientContext& c) {
        return ctx.client().get_pricing_spec(c, ctx.pricing_spec_request());
    });
    checks.expect_rejection<GetPricingSpecResponse>(
        "AbsentDescriptor", "InvalidArgument", is_invalid_argument, [&](ClientContext& c) {
            return ctx.client().get_pricing_spec(c, GetPricingSpecRequest{});
        });
    checks.expect_rejection<GetPricingSpecResponse>(
        "UnsupportedResource", "a rejection code", is_defined_rejection, [&](ClientContext& c) {
            return ctx.client().get_pricing_spec(c,
                                                 GetPricingSpecRequest{ctx.unsupported_resource()});
        });
}

void check_estimate_cost(CheckContext& ctx, std::vector<TestResult>& out) {
    MethodChecks checks(ctx, Method::EstimateCost, out);
    checks.expect_success<EstimateCostResponse>("ValidRequest", [&](ClientContext& c) {
        return ctx.client().estimate_cost(c, ctx.estimate_cost_request());
    });
    checks.expect_rejection<EstimateCostResponse>(
        "AbsentDescriptor", "InvalidArgument", is_invalid_argument,
        [&](ClientContext& c) { return ctx.client().estimate_cost(c, EstimateCostRequest{}); });
    checks.expect_rejection<EstimateCostResponse>(
        "UnsupportedResource", "a rejection code", is_defined_rejection, [&](ClientContext& c) {
            EstimateCostRequest request;
            request.resource_type = ctx.unsupported_resource().resource_type;
            return ctx.client().estimate_cost(c, request);
        });
}

void check_recommendations(CheckContext& ctx, std::vector<TestResult>& out) {
    MethodChecks checks(ctx, Method::GetRecommendations, out);
    int page_size = ctx.recommendations_request().page_size;
    checks.expect_success<GetRecommendationsResponse>(
        "ValidRequest",
        [&](ClientContext& c) {
            return ctx.client().get_recommendations(c, ctx.recommendations_request());
        },
        [page_size](const GetRecommendationsResponse& response) -> std::optional<std::string> {
            if (page_size > 0 && response.recommendations.size() > static_cast<size_t>(page_size)) {
                return "returned " + std::to_string(response.recommendations.size()) +
                       " recommendations for page_size " + std::to_string(page_size);
            }
            return std::nullopt;
        });
    checks.expect_rejection<GetRecommendationsResponse>(
        "InvalidPageToken", "InvalidArgument", is_invalid_argument, [&](ClientContext& c) {
            auto request = ctx.recommendations_request();
            request.page_token = "not-a-page-token";
            return ctx.client().get_recommendations(c, request);
        });
    checks.expect_rejection<GetRecommendationsResponse>(
        "NegativePageSize", "InvalidArgument", is_invalid_argument, [&](ClientContext& c) {
            auto request = ctx.recommendations_request();
            request.page_size = -1;
            return ctx.client().get_recommendations(c, request);
        });
}

void check_budgets(CheckContext& ctx, std::vector<TestResult>& out) {
    MethodChecks checks(ctx, Method::GetBudgets, out);
    checks.expect_success<GetBudgetsResponse>("ValidRequest", [&](ClientContext& c) {
        return ctx.client().get_budgets(c, ctx.budgets_request());
    });
    checks.expect_rejection<GetBudgetsResponse>(
        "UnsupportedProvider", "a rejection code or no budgets", is_defined_rejection,
        [&](ClientContext& c) {
            auto request = ctx.budgets_request();
            request.provider_filter = ctx.unsupported_resource().provider;
            return ctx.client().get_budgets(c, request);
        },
        no_budgets);
}

}  // namespace

std::vector<TestResult> RpcCorrectnessModule::run(CheckContext& ctx) {
    std::vector<TestResult> results;
    check_name_method(ctx, results);
    check_supports(ctx, results);
    check_actual_cost(ctx, results);
    check_projected_cost(ctx, results);
    check_pricing_spec(ctx, results);
    check_estimate_cost(ctx, results);
    check_recommendations(ctx, results);
    check_budgets(ctx, results);

    for (const auto& r : results) {
        spdlog::debug("[rpc_correctness] {} {} ({:.1f}ms){}", r.name, to_string(r.status),
                      std::chrono::duration<double, std::milli>(r.duration).count(),
                      r.error ? ": " + *r.error : std::string());
    }
    return results;
}

}  // namespace costconform
