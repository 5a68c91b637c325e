#include "conformance/category_module.h"

#include <algorithm>

namespace costconform {

CheckContext::CheckContext(CostSourceClient& client, const SuiteConfig& config)
    : client_(client),
      config_(config),
      anchor_(std::chrono::floor<std::chrono::hours>(std::chrono::system_clock::now())) {}

ClientContext CheckContext::new_call() const {
    ClientContext ctx;
    ctx.set_timeout(config_.test_timeout);
    return ctx;
}

void CheckContext::set_capabilities(std::vector<std::string> capabilities) {
    capabilities_ = std::move(capabilities);
}

bool CheckContext::advertises(const std::string& capability) const {
    return std::find(capabilities_.begin(), capabilities_.end(), capability) !=
           capabilities_.end();
}

std::optional<std::string> CheckContext::skip_reason(Method method) const {
    const char* capability = capability_for(method);
    if (capability == nullptr) {
        return std::nullopt;
    }
    if (!advertises(capability)) {
        return std::string("capability '") + capability + "' not advertised";
    }
    std::lock_guard lock(mutex_);
    if (unimplemented_.count(method) > 0) {
        return std::string(method_name(method)) + " returned Unimplemented";
    }
    return std::nullopt;
}

void CheckContext::mark_unimplemented(Method method) {
    std::lock_guard lock(mutex_);
    unimplemented_.insert(method);
}

SupportsRequest CheckContext::supports_request() const {
    return SupportsRequest{config_.sample_resource};
}

GetActualCostRequest CheckContext::actual_cost_request(std::chrono::hours span) const {
    GetActualCostRequest request;
    request.resource_id = config_.sample_resource.provider + ":" +
                          config_.sample_resource.resource_type + ":" +
                          config_.sample_resource.sku;
    request.start = anchor_ - span;
    request.end = anchor_;
    return request;
}

GetProjectedCostRequest CheckContext::projected_cost_request() const {
    return GetProjectedCostRequest{config_.sample_resource};
}

GetPricingSpecRequest CheckContext::pricing_spec_request() const {
    return GetPricingSpecRequest{config_.sample_resource};
}

EstimateCostRequest CheckContext::estimate_cost_request() const {
    EstimateCostRequest request;
    request.resource_type = config_.sample_resource.resource_type;
    request.attributes = {{"sku", config_.sample_resource.sku},
                          {"region", config_.sample_resource.region}};
    return request;
}

GetRecommendationsRequest CheckContext::recommendations_request() const {
    GetRecommendationsRequest request;
    request.page_size = 10;
    return request;
}

GetBudgetsRequest CheckContext::budgets_request() const {
    GetBudgetsRequest request;
    request.include_status = true;
    return request;
}

ResourceDescriptor CheckContext::unsupported_resource() const {
    return ResourceDescriptor{"unsupported-provider", "unsupported_resource_type", "none",
                              "nowhere-1", {}};
}

TestResult make_result(const std::string& name, TestCategory category, ConformanceLevel level) {
    TestResult result;
    result.name = name;
    result.category = category;
    result.level = level;
    result.status = TestStatus::Passed;
    return result;
}

TestResult skipped_result(const std::string& name, TestCategory category, ConformanceLevel level,
                          const std::string& reason) {
    TestResult result = make_result(name, category, level);
    result.status = TestStatus::Skipped;
    result.error = reason;
    return result;
}

TestResult above_target_result(const std::string& name, TestCategory category,
                               ConformanceLevel level) {
    return skipped_result(name, category, level,
                          std::string("requires ") + to_string(level) + " level");
}

void record_call_failure(TestResult& result, const Status& status) {
    if (status.is_timeout()) {
        result.status = TestStatus::TimedOut;
    } else if (status.is_cancellation()) {
        result.status = TestStatus::Cancelled;
    } else {
        result.status = TestStatus::Failed;
    }
    result.error = status.to_string();
}

void fail(TestResult& result, const std::string& error) {
    result.status = TestStatus::Failed;
    result.error = error;
}

std::chrono::nanoseconds elapsed_since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start);
}

}  // namespace costconform
