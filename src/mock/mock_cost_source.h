#pragma once
#ifndef COSTCONFORM_MOCK_COST_SOURCE_H
#define COSTCONFORM_MOCK_COST_SOURCE_H

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>
#include <variant>
#include <vector>
#include "contract/cost_source_service.h"

namespace costconform {

// Handler throws std::runtime_error(message) when served.
struct Fault {
    std::string message;
};

// Built-in behaviour of the double for the method.
struct DefaultBehavior {};

template <typename Response>
struct MethodScript {
    std::variant<DefaultBehavior, Response, Status, Fault> action;
    std::chrono::milliseconds delay{0};
};

using RecordedRequest =
    std::variant<NameRequest, SupportsRequest, GetActualCostRequest, GetProjectedCostRequest,
                 GetPricingSpecRequest, EstimateCostRequest, GetRecommendationsRequest,
                 GetBudgetsRequest>;

// Scriptable implementation of the cost source contract.
//
// Configure it, bind it to a harness, then call it. Binding seals the double:
// any configuration call made while it is bound throws ConfigurationError.
// Scripts are only read while serving; the request log is the only state
// written and is guarded by a mutex.
class MockCostSource : public CostSourceService {
public:
    MockCostSource();

    // Scripting
    template <typename Response>
    MockCostSource& respond_with(Response response) {
        ensure_configurable();
        std::get<MethodScript<Response>>(scripts_).action = std::move(response);
        return *this;
    }
    MockCostSource& fail_with(Method method, StatusCode code, const std::string& message);
    MockCostSource& fault_on(Method method, const std::string& message);
    MockCostSource& delay(Method method, std::chrono::milliseconds delay);
    MockCostSource& reset(Method method);
    // Optional methods only. A disabled method answers Unimplemented and is
    // not advertised by Supports.
    MockCostSource& enable(Method method, bool enabled);

    // Default behaviour data
    MockCostSource& set_name(const std::string& name);
    MockCostSource& set_resources(std::map<std::string, std::vector<std::string>> resources);
    MockCostSource& set_currency(const std::string& currency);
    MockCostSource& set_base_hourly_rate(double rate);
    MockCostSource& set_actual_cost_data_points(int data_points);
    MockCostSource& set_recommendations(std::vector<Recommendation> recommendations);
    MockCostSource& set_budgets(std::vector<Budget> budgets);

    bool is_enabled(Method method) const;
    bool is_sealed() const { return bindings_.load() > 0; }

    // Recording
    size_t call_count(Method method) const;
    std::vector<RecordedRequest> recorded_requests() const;
    template <typename Request>
    std::vector<Request> received() const {
        std::lock_guard lock(log_mutex_);
        std::vector<Request> out;
        for (const auto& entry : log_) {
            if (const auto* request = std::get_if<Request>(&entry)) {
                out.push_back(*request);
            }
        }
        return out;
    }
    void clear_recorded();

    // CostSourceService
    Status name(CallContext& ctx, const NameRequest& request, NameResponse& response) override;
    Status supports(CallContext& ctx, const SupportsRequest& request,
                    SupportsResponse& response) override;
    Status get_actual_cost(CallContext& ctx, const GetActualCostRequest& request,
                           GetActualCostResponse& response) override;
    Status get_projected_cost(CallContext& ctx, const GetProjectedCostRequest& request,
                              GetProjectedCostResponse& response) override;
    Status get_pricing_spec(CallContext& ctx, const GetPricingSpecRequest& request,
                            GetPricingSpecResponse& response) override;
    Status estimate_cost(CallContext& ctx, const EstimateCostRequest& request,
                         EstimateCostResponse& response) override;
    Status get_recommendations(CallContext& ctx, const GetRecommendationsRequest& request,
                               GetRecommendationsResponse& response) override;
    Status get_budgets(CallContext& ctx, const GetBudgetsRequest& request,
                       GetBudgetsResponse& response) override;

    // Validates the configuration and seals the double.
    void on_bind() override;
    void on_release() override;

private:
    using Scripts =
        std::tuple<MethodScript<NameResponse>, MethodScript<SupportsResponse>,
                   MethodScript<GetActualCostResponse>, MethodScript<GetProjectedCostResponse>,
                   MethodScript<GetPricingSpecResponse>, MethodScript<EstimateCostResponse>,
                   MethodScript<GetRecommendationsResponse>, MethodScript<GetBudgetsResponse>>;

    Scripts scripts_;
    std::map<Method, bool> enabled_;
    std::atomic<int> bindings_{0};

    std::string name_;
    std::map<std::string, std::vector<std::string>> resources_;
    std::string currency_;
    double base_hourly_rate_;
    int actual_cost_data_points_;
    std::vector<Recommendation> recommendations_;
    std::vector<Budget> budgets_;

    mutable std::mutex log_mutex_;
    std::vector<RecordedRequest> log_;
    std::map<Method, size_t> call_counts_;

    void ensure_configurable() const;
    template <typename Fn>
    void visit_script(Method method, Fn&& fn);
    template <typename Request>
    void record(Method method, const Request& request);
    template <typename Response, typename Request, typename Fallback>
    Status serve(Method method, CallContext& ctx, const Request& request, Response& response,
                 Fallback&& fallback);

    bool provider_supported(const std::string& provider) const;
    bool resource_supported(const std::string& provider, const std::string& resource_type) const;
    std::vector<std::string> advertised_capabilities() const;
};

// Presets
std::unique_ptr<MockCostSource> slow_mock();
std::unique_ptr<MockCostSource> error_mock();

std::vector<Recommendation> sample_recommendations(int count);

}  // namespace costconform

#endif  // COSTCONFORM_MOCK_COST_SOURCE_H
