#pragma once
#ifndef COSTCONFORM_CATEGORY_MODULE_H
#define COSTCONFORM_CATEGORY_MODULE_H

#include <chrono>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "config/suite_config.h"
#include "conformance/types.h"
#include "contract/client.h"
#include "contract/status.h"

namespace costconform {

// Per-run state shared by the category modules: the connected client, the
// configuration and what the plugin advertised.
class CheckContext {
public:
    CheckContext(CostSourceClient& client, const SuiteConfig& config);

    CostSourceClient& client() { return client_; }
    const SuiteConfig& config() const { return config_; }
    ConformanceLevel target_level() const { return config_.target_level; }
    bool within_target(ConformanceLevel level) const { return level <= config_.target_level; }

    // Client context carrying the per-test deadline.
    ClientContext new_call() const;

    void set_capabilities(std::vector<std::string> capabilities);
    const std::vector<std::string>& capabilities() const { return capabilities_; }
    bool advertises(const std::string& capability) const;

    // Why checks of an optional method are skipped, or std::nullopt when they
    // should run. Mandatory methods always run.
    std::optional<std::string> skip_reason(Method method) const;
    void mark_unimplemented(Method method);

    // Requests built around the configured sample resource.
    SupportsRequest supports_request() const;
    GetActualCostRequest actual_cost_request(std::chrono::hours span) const;
    GetProjectedCostRequest projected_cost_request() const;
    GetPricingSpecRequest pricing_spec_request() const;
    EstimateCostRequest estimate_cost_request() const;
    GetRecommendationsRequest recommendations_request() const;
    GetBudgetsRequest budgets_request() const;
    // A descriptor no plugin is expected to support.
    ResourceDescriptor unsupported_resource() const;

private:
    CostSourceClient& client_;
    const SuiteConfig& config_;
    std::vector<std::string> capabilities_;
    Timestamp anchor_;
    mutable std::mutex mutex_;
    std::set<Method> unimplemented_;
};

// One certification category. Implementations never throw for contract
// violations; every finding becomes a TestResult.
class CategoryModule {
public:
    virtual ~CategoryModule() = default;
    virtual TestCategory category() const = 0;
    virtual std::vector<TestResult> run(CheckContext& ctx) = 0;
};

TestResult make_result(const std::string& name, TestCategory category, ConformanceLevel level);
TestResult skipped_result(const std::string& name, TestCategory category, ConformanceLevel level,
                          const std::string& reason);
// Result for a check above the run's target level.
TestResult above_target_result(const std::string& name, TestCategory category,
                               ConformanceLevel level);

// Records a non-OK call status on the result: TimedOut and Cancelled for
// transport deadline and cancellation, Failed otherwise.
void record_call_failure(TestResult& result, const Status& status);
void fail(TestResult& result, const std::string& error);

// Elapsed time since the start point.
std::chrono::nanoseconds elapsed_since(Clock::time_point start);

}  // namespace costconform

#endif  // COSTCONFORM_CATEGORY_MODULE_H
