#include "conformance/concurrency.h"

#include <future>
#include <set>
#include <system_error>
#include <thread>
#include <utility>
#include <spdlog/spdlog.h>
#include "contract/codec.h"

namespace costconform {

const char* const kRaceDetectionInactiveWarning =
    "race detection was not active; concurrency results only show response consistency";

namespace {

constexpr TestCategory kCategory = TestCategory::Concurrency;

template <typename Response, typename Request>
FanOutProbe::Call make_call(CostSourceClient& client,
                            RpcResult<Response> (CostSourceClient::*fn)(ClientContext&,
                                                                       const Request&),
                            Request request) {
    return [&client, fn, request](ClientContext& c) {
        CallOutcome outcome;
        RpcResult<Response> rpc = (client.*fn)(c, request);
        outcome.status = rpc.status;
        if (rpc.ok()) {
            outcome.payload = encode(*rpc.response);
            outcome.findings = validate_response(*rpc.response);
        }
        return outcome;
    };
}

FanOutProbe::Call call_for(CheckContext& ctx, Method method) {
    auto& client = ctx.client();
    switch (method) {
        case Method::Name:
            return make_call(client, &CostSourceClient::name, NameRequest{});
        case Method::Supports:
            return make_call(client, &CostSourceClient::supports, ctx.supports_request());
        case Method::GetActualCost:
            return make_call(client, &CostSourceClient::get_actual_cost,
                             ctx.actual_cost_request(std::chrono::hours(24)));
        case Method::GetProjectedCost:
            return make_call(client, &CostSourceClient::get_projected_cost,
                             ctx.projected_cost_request());
        case Method::GetPricingSpec:
            return make_call(client, &CostSourceClient::get_pricing_spec,
                             ctx.pricing_spec_request());
        case Method::EstimateCost:
            return make_call(client, &CostSourceClient::estimate_cost,
                             ctx.estimate_cost_request());
        case Method::GetRecommendations:
            return make_call(client, &CostSourceClient::get_recommendations,
                             ctx.recommendations_request());
        case Method::GetBudgets:
            return make_call(client, &CostSourceClient::get_budgets, ctx.budgets_request());
    }
    return {};
}

struct ProbeCheck {
    const char* suffix;
    ConformanceLevel level;
    bool advanced_fan_out;
    bool require_identical;
};

}  // namespace

const char* to_string(ProbeState state) {
    switch (state) {
        case ProbeState::Idle: return "Idle";
        case ProbeState::Dispatching: return "Dispatching";
        case ProbeState::Collecting: return "Collecting";
        case ProbeState::Verified: return "Verified";
        case ProbeState::Failed: return "Failed";
    }
    return "Unknown";
}

bool is_deterministic_method(Method method) {
    return method != Method::GetActualCost && method != Method::GetRecommendations;
}

FanOutProbe::FanOutProbe(int fan_out, Call call, std::function<ClientContext()> make_context)
    : fan_out_(fan_out), call_(std::move(call)), make_context_(std::move(make_context)) {}

void FanOutProbe::dispatch() {
    state_ = ProbeState::Dispatching;
    outcomes_.assign(static_cast<size_t>(fan_out_), CallOutcome{});

    std::vector<ClientContext> contexts;
    contexts.reserve(static_cast<size_t>(fan_out_));
    for (int i = 0; i < fan_out_; ++i) {
        contexts.push_back(make_context_());
    }

    std::promise<void> gate;
    std::shared_future<void> go = gate.get_future().share();
    std::vector<std::thread> callers;
    callers.reserve(static_cast<size_t>(fan_out_));
    try {
        for (int i = 0; i < fan_out_; ++i) {
            callers.emplace_back([this, i, go, &contexts]() {
                go.wait();
                outcomes_[static_cast<size_t>(i)] = call_(contexts[static_cast<size_t>(i)]);
            });
        }
    } catch (const std::system_error& e) {
        gate.set_value();
        for (auto& t : callers) t.join();
        state_ = ProbeState::Failed;
        failure_ = std::string("could not start caller threads: ") + e.what();
        return;
    }

    gate.set_value();
    state_ = ProbeState::Collecting;
    for (auto& t : callers) {
        t.join();
    }
}

ProbeState FanOutProbe::verify(bool deterministic) {
    if (state_ != ProbeState::Collecting) {
        return state_;
    }

    int errors = 0;
    for (const auto& outcome : outcomes_) {
        if (!outcome.status.is_ok()) {
            if (errors == 0) {
                failing_status_ = outcome.status;
            }
            ++errors;
        }
    }
    if (errors > 0) {
        state_ = ProbeState::Failed;
        failure_ = std::to_string(errors) + " of " + std::to_string(fan_out_) +
                   " concurrent calls failed; first: " + failing_status_.to_string();
        return state_;
    }

    if (deterministic) {
        int distinct = distinct_responses();
        if (distinct > 1) {
            state_ = ProbeState::Failed;
            failure_ = std::to_string(distinct) + " distinct responses among " +
                       std::to_string(fan_out_) + " identical concurrent calls";
            return state_;
        }
    }

    for (size_t i = 0; i < outcomes_.size(); ++i) {
        if (!outcomes_[i].findings.empty()) {
            state_ = ProbeState::Failed;
            failure_ = "response " + std::to_string(i) +
                       " malformed under load: " + format_findings(outcomes_[i].findings);
            return state_;
        }
    }

    state_ = ProbeState::Verified;
    return state_;
}

int FanOutProbe::distinct_responses() const {
    std::set<std::string> payloads;
    for (const auto& outcome : outcomes_) {
        if (outcome.status.is_ok()) payloads.insert(outcome.payload);
    }
    return static_cast<int>(payloads.size());
}

std::vector<TestResult> ConcurrencyModule::run(CheckContext& ctx) {
    static const ProbeCheck kChecks[] = {
        {"ParallelRequests", ConformanceLevel::Standard, false, false},
        {"ResponseConsistency", ConformanceLevel::Standard, false, true},
        {"HighFanOut", ConformanceLevel::Advanced, true, true},
    };

    const bool race_detection = ctx.config().race_detection_active();
    if (!race_detection) {
        spdlog::warn("Concurrency category: {}", kRaceDetectionInactiveWarning);
    }

    std::vector<TestResult> results;
    for (Method method : kAllMethods) {
        std::optional<std::string> short_circuit;
        for (const auto& check : kChecks) {
            const std::string name = std::string(method_name(method)) + "_" + check.suffix;
            if (!ctx.within_target(check.level)) {
                results.push_back(above_target_result(name, kCategory, check.level));
                continue;
            }
            if (auto reason = ctx.skip_reason(method)) {
                results.push_back(skipped_result(name, kCategory, check.level, *reason));
                continue;
            }
            if (short_circuit) {
                results.push_back(skipped_result(name, kCategory, check.level, *short_circuit));
                continue;
            }

            int fan_out = check.advanced_fan_out ? ctx.config().advanced_fan_out()
                                                 : ctx.config().concurrency_fan_out;
            FanOutProbe probe(fan_out, call_for(ctx, method), [&ctx] { return ctx.new_call(); });
            TestResult result = make_result(name, kCategory, check.level);
            auto start = Clock::now();
            probe.dispatch();
            bool deterministic = check.require_identical && is_deterministic_method(method);
            ProbeState state = probe.verify(deterministic);
            result.duration = elapsed_since(start);
            result.metrics.push_back({"fan_out", static_cast<double>(fan_out), "calls"});
            result.metrics.push_back(
                {"distinct_responses", static_cast<double>(probe.distinct_responses()), "responses"});

            if (state == ProbeState::Failed) {
                const Status& status = probe.failing_status();
                if (is_optional_method(method) && !status.from_transport() &&
                    status.code() == StatusCode::Unimplemented) {
                    ctx.mark_unimplemented(method);
                    results.push_back(skipped_result(name, kCategory, check.level,
                                                     status.to_string()));
                    continue;
                }
                if (status.is_timeout()) {
                    result.status = TestStatus::TimedOut;
                } else if (status.is_cancellation()) {
                    result.status = TestStatus::Cancelled;
                } else {
                    result.status = TestStatus::Failed;
                }
                result.error = probe.failure();
                short_circuit = std::string("short-circuited after ") + check.suffix + " failed";
                spdlog::warn("[concurrency] {} failed, skipping remaining {} probes: {}", name,
                             method_name(method), probe.failure());
            }
            if (!race_detection) {
                result.warnings.push_back(kRaceDetectionInactiveWarning);
            }
            spdlog::debug("[concurrency] {} {} after {} -> {}", name, to_string(result.status),
                          fan_out, to_string(state));
            results.push_back(std::move(result));
        }
    }
    return results;
}

}  // namespace costconform
