#include "mock/mock_cost_source.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "common/errors.h"

namespace costconform {

namespace {

constexpr int kDefaultDataPoints = 24;
constexpr double kDefaultBaseRate = 0.05;
constexpr int kDefaultRecommendationCount = 12;
constexpr double kHoursPerMonth = 24.0 * 30.0;

double rate_multiplier(const std::string& resource_type) {
    if (resource_type == "ec2" || resource_type == "vm" || resource_type == "compute_engine" ||
        resource_type == "compute") {
        return 2.0;
    }
    if (resource_type == "s3" || resource_type == "blob_storage" ||
        resource_type == "cloud_storage") {
        return 0.1;
    }
    if (resource_type == "lambda" || resource_type == "cloud_functions") {
        return 0.001;
    }
    if (resource_type == "namespace") return 1.5;
    if (resource_type == "sql_database") return 3.0;
    return 1.0;
}

std::string billing_mode_for(const std::string& resource_type) {
    if (resource_type == "ec2" || resource_type == "vm" || resource_type == "compute_engine" ||
        resource_type == "compute" || resource_type == "pod") {
        return "per_hour";
    }
    if (resource_type == "s3" || resource_type == "blob_storage" ||
        resource_type == "cloud_storage") {
        return "per_gb_month";
    }
    if (resource_type == "lambda" || resource_type == "cloud_functions") {
        return "per_invocation";
    }
    if (resource_type == "namespace") return "per_cpu_hour";
    if (resource_type == "sql_database") return "per_dtu";
    return "on_demand";
}

std::vector<Budget> default_budgets(const std::string& currency) {
    Budget monthly;
    monthly.id = "budget-aws-monthly";
    monthly.name = "AWS monthly spend";
    monthly.source = "aws-budgets";
    monthly.amount = BudgetAmount{1000.0, currency};
    monthly.period = "monthly";
    monthly.status = BudgetStatus{420.0, 42.0, "ok"};

    Budget quarterly;
    quarterly.id = "budget-gcp-quarterly";
    quarterly.name = "GCP quarterly spend";
    quarterly.source = "gcp-billing";
    quarterly.amount = BudgetAmount{5000.0, currency};
    quarterly.period = "quarterly";
    quarterly.status = BudgetStatus{4100.0, 82.0, "warning"};
    return {monthly, quarterly};
}

}  // namespace

std::vector<Recommendation> sample_recommendations(int count) {
    static const char* const kCategories[] = {"cost", "performance", "security", "reliability",
                                              "anomaly"};
    static const char* const kActions[] = {"rightsize", "terminate", "purchase_commitment",
                                           "adjust_requests", "modify", "delete_unused",
                                           "migrate", "consolidate", "schedule", "refactor",
                                           "other", "investigate"};
    static const char* const kProviders[] = {"aws", "azure", "gcp", "kubernetes"};

    std::vector<Recommendation> recs;
    recs.reserve(static_cast<size_t>(std::max(count, 0)));
    for (int i = 0; i < count; ++i) {
        Recommendation rec;
        rec.id = "rec-" + std::to_string(i + 1);
        rec.category = kCategories[i % 5];
        rec.action_type = rec.category == "anomaly" ? "investigate" : kActions[i % 12];
        rec.resource_id = std::string(kProviders[i % 4]) + ":resource-" + std::to_string(i + 1);
        rec.estimated_savings = 50.0 + 25.0 * i;
        rec.currency = "USD";
        rec.confidence = 0.7 + 0.075 * (i % 4);
        recs.push_back(std::move(rec));
    }
    return recs;
}

MockCostSource::MockCostSource()
    : name_("mock-test-plugin"),
      resources_{
          {"aws", {"ec2", "s3", "lambda", "rds"}},
          {"azure", {"vm", "blob_storage", "sql_database", "compute"}},
          {"gcp", {"compute_engine", "cloud_storage", "cloud_functions", "compute"}},
          {"kubernetes", {"namespace", "pod", "service"}},
      },
      currency_("USD"),
      base_hourly_rate_(kDefaultBaseRate),
      actual_cost_data_points_(kDefaultDataPoints),
      recommendations_(sample_recommendations(kDefaultRecommendationCount)),
      budgets_(default_budgets("USD")) {
    for (Method method : kAllMethods) {
        if (is_optional_method(method)) {
            enabled_[method] = true;
        }
    }
}

void MockCostSource::ensure_configurable() const {
    if (is_sealed()) {
        throw ConfigurationError("mock cost source cannot be reconfigured while bound");
    }
}

template <typename Fn>
void MockCostSource::visit_script(Method method, Fn&& fn) {
    switch (method) {
        case Method::Name: fn(std::get<MethodScript<NameResponse>>(scripts_)); break;
        case Method::Supports: fn(std::get<MethodScript<SupportsResponse>>(scripts_)); break;
        case Method::GetActualCost:
            fn(std::get<MethodScript<GetActualCostResponse>>(scripts_));
            break;
        case Method::GetProjectedCost:
            fn(std::get<MethodScript<GetProjectedCostResponse>>(scripts_));
            break;
        case Method::GetPricingSpec:
            fn(std::get<MethodScript<GetPricingSpecResponse>>(scripts_));
            break;
        case Method::EstimateCost:
            fn(std::get<MethodScript<EstimateCostResponse>>(scripts_));
            break;
        case Method::GetRecommendations:
            fn(std::get<MethodScript<GetRecommendationsResponse>>(scripts_));
            break;
        case Method::GetBudgets: fn(std::get<MethodScript<GetBudgetsResponse>>(scripts_)); break;
    }
}

MockCostSource& MockCostSource::fail_with(Method method, StatusCode code,
                                          const std::string& message) {
    ensure_configurable();
    visit_script(method, [&](auto& script) { script.action = Status(code, message); });
    return *this;
}

MockCostSource& MockCostSource::fault_on(Method method, const std::string& message) {
    ensure_configurable();
    visit_script(method, [&](auto& script) { script.action = Fault{message}; });
    return *this;
}

MockCostSource& MockCostSource::delay(Method method, std::chrono::milliseconds delay) {
    ensure_configurable();
    visit_script(method, [&](auto& script) { script.delay = delay; });
    return *this;
}

MockCostSource& MockCostSource::reset(Method method) {
    ensure_configurable();
    visit_script(method, [](auto& script) {
        script.action = DefaultBehavior{};
        script.delay = std::chrono::milliseconds(0);
    });
    return *this;
}

MockCostSource& MockCostSource::enable(Method method, bool enabled) {
    ensure_configurable();
    if (!is_optional_method(method)) {
        throw ConfigurationError(std::string(method_name(method)) +
                                 " is mandatory and cannot be disabled");
    }
    enabled_[method] = enabled;
    return *this;
}

MockCostSource& MockCostSource::set_name(const std::string& name) {
    ensure_configurable();
    name_ = name;
    return *this;
}

MockCostSource& MockCostSource::set_resources(
    std::map<std::string, std::vector<std::string>> resources) {
    ensure_configurable();
    resources_ = std::move(resources);
    return *this;
}

MockCostSource& MockCostSource::set_currency(const std::string& currency) {
    ensure_configurable();
    currency_ = currency;
    return *this;
}

MockCostSource& MockCostSource::set_base_hourly_rate(double rate) {
    ensure_configurable();
    base_hourly_rate_ = rate;
    return *this;
}

MockCostSource& MockCostSource::set_actual_cost_data_points(int data_points) {
    ensure_configurable();
    actual_cost_data_points_ = data_points;
    return *this;
}

MockCostSource& MockCostSource::set_recommendations(std::vector<Recommendation> recommendations) {
    ensure_configurable();
    recommendations_ = std::move(recommendations);
    return *this;
}

MockCostSource& MockCostSource::set_budgets(std::vector<Budget> budgets) {
    ensure_configurable();
    budgets_ = std::move(budgets);
    return *this;
}

bool MockCostSource::is_enabled(Method method) const {
    auto it = enabled_.find(method);
    return it == enabled_.end() || it->second;
}

size_t MockCostSource::call_count(Method method) const {
    std::lock_guard lock(log_mutex_);
    auto it = call_counts_.find(method);
    return it == call_counts_.end() ? 0 : it->second;
}

std::vector<RecordedRequest> MockCostSource::recorded_requests() const {
    std::lock_guard lock(log_mutex_);
    return log_;
}

void MockCostSource::clear_recorded() {
    std::lock_guard lock(log_mutex_);
    log_.clear();
    call_counts_.clear();
}

void MockCostSource::on_bind() {
    std::vector<std::string> problems;
    auto check = [&](Method method) {
        visit_script(method, [&](const auto& script) {
            std::string prefix = std::string(method_name(method)) + ": ";
            if (script.delay.count() < 0) {
                problems.push_back(prefix + "negative delay");
            }
            if (const auto* error = std::get_if<Status>(&script.action)) {
                if (error->is_ok()) {
                    problems.push_back(prefix + "canned error with status OK");
                }
            }
            if (const auto* fault = std::get_if<Fault>(&script.action)) {
                if (fault->message.empty()) {
                    problems.push_back(prefix + "fault without a message");
                }
            }
        });
    };
    for (Method method : kAllMethods) {
        check(method);
    }
    if (actual_cost_data_points_ < 0) {
        problems.push_back("negative actual cost data point count");
    }
    if (!std::isfinite(base_hourly_rate_) || base_hourly_rate_ < 0.0) {
        problems.push_back("base hourly rate must be a non-negative number");
    }

    if (!problems.empty()) {
        std::string joined;
        for (const auto& p : problems) {
            if (!joined.empty()) joined += "; ";
            joined += p;
        }
        throw ConfigurationError("mock cost source misconfigured: " + joined);
    }
    bindings_.fetch_add(1);
    spdlog::debug("Mock cost source '{}' sealed", name_);
}

void MockCostSource::on_release() {
    if (bindings_.load() > 0) {
        bindings_.fetch_sub(1);
    }
}

template <typename Request>
void MockCostSource::record(Method method, const Request& request) {
    std::lock_guard lock(log_mutex_);
    log_.emplace_back(request);
    ++call_counts_[method];
}

template <typename Response, typename Request, typename Fallback>
Status MockCostSource::serve(Method method, CallContext& ctx, const Request& request,
                             Response& response, Fallback&& fallback) {
    record(method, request);

    if (is_optional_method(method) && !is_enabled(method)) {
        return Status(StatusCode::Unimplemented,
                      std::string(method_name(method)) + " not enabled on this mock");
    }

    const auto& script = std::get<MethodScript<Response>>(scripts_);
    if (script.delay.count() > 0 && !ctx.wait_for(script.delay)) {
        if (ctx.is_cancelled()) {
            return Status(StatusCode::Cancelled, "call cancelled during artificial delay");
        }
        return Status(StatusCode::DeadlineExceeded, "deadline reached during artificial delay");
    }

    if (const auto* canned = std::get_if<Response>(&script.action)) {
        response = *canned;
        return Status::ok();
    }
    if (const auto* error = std::get_if<Status>(&script.action)) {
        return *error;
    }
    if (const auto* fault = std::get_if<Fault>(&script.action)) {
        throw std::runtime_error(fault->message);
    }
    return fallback();
}

bool MockCostSource::provider_supported(const std::string& provider) const {
    return resources_.count(provider) > 0;
}

bool MockCostSource::resource_supported(const std::string& provider,
                                        const std::string& resource_type) const {
    auto it = resources_.find(provider);
    if (it == resources_.end()) return false;
    return std::find(it->second.begin(), it->second.end(), resource_type) != it->second.end();
}

std::vector<std::string> MockCostSource::advertised_capabilities() const {
    std::vector<std::string> caps;
    for (Method method : kAllMethods) {
        if (is_optional_method(method) && is_enabled(method)) {
            caps.emplace_back(capability_for(method));
        }
    }
    return caps;
}

Status MockCostSource::name(CallContext& ctx, const NameRequest& request,
                            NameResponse& response) {
    return serve(Method::Name, ctx, request, response, [&] {
        response.name = name_;
        return Status::ok();
    });
}

Status MockCostSource::supports(CallContext& ctx, const SupportsRequest& request,
                                SupportsResponse& response) {
    return serve(Method::Supports, ctx, request, response, [&] {
        if (!request.resource) {
            response.supported = false;
            response.reason = "resource descriptor is required";
            return Status::ok();
        }
        const auto& resource = *request.resource;
        if (!provider_supported(resource.provider)) {
            response.supported = false;
            response.reason = "provider " + resource.provider + " is not supported";
            return Status::ok();
        }
        if (!resource_supported(resource.provider, resource.resource_type)) {
            response.supported = false;
            response.reason = "resource type " + resource.resource_type +
                              " is not supported for provider " + resource.provider;
            return Status::ok();
        }
        response.supported = true;
        response.capabilities = advertised_capabilities();
        return Status::ok();
    });
}

Status MockCostSource::get_actual_cost(CallContext& ctx, const GetActualCostRequest& request,
                                       GetActualCostResponse& response) {
    return serve(Method::GetActualCost, ctx, request, response, [&] {
        if (request.resource_id.empty()) {
            return Status(StatusCode::InvalidArgument, "resource_id is required");
        }
        if (!request.start || !request.end) {
            return Status(StatusCode::InvalidArgument, "start and end timestamps are required");
        }
        if (*request.end <= *request.start) {
            return Status(StatusCode::InvalidArgument, "end time must be after start time");
        }
        auto hours = std::chrono::duration_cast<std::chrono::hours>(*request.end - *request.start);
        int points = std::min<int64_t>(actual_cost_data_points_, hours.count() + 1);
        response.results.reserve(static_cast<size_t>(points));
        for (int i = 0; i < points; ++i) {
            Timestamp ts = *request.start + std::chrono::hours(i);
            if (ts > *request.end) break;
            // Varies between 0.8x and 1.2x of the base rate.
            double variation = 0.8 + 0.4 * static_cast<double>(i % 10) / 10.0;
            ActualCostResult result;
            result.timestamp = ts;
            result.cost = base_hourly_rate_ * variation;
            result.usage_amount = variation;
            result.usage_unit = "hour";
            result.currency = currency_;
            result.source = name_;
            response.results.push_back(std::move(result));
        }
        return Status::ok();
    });
}

Status MockCostSource::get_projected_cost(CallContext& ctx,
                                          const GetProjectedCostRequest& request,
                                          GetProjectedCostResponse& response) {
    return serve(Method::GetProjectedCost, ctx, request, response, [&] {
        if (!request.resource) {
            return Status(StatusCode::InvalidArgument, "resource descriptor is required");
        }
        const auto& resource = *request.resource;
        if (!provider_supported(resource.provider)) {
            return Status(StatusCode::NotFound, "provider " + resource.provider + " is not supported");
        }
        response.unit_price = base_hourly_rate_ * rate_multiplier(resource.resource_type);
        response.currency = currency_;
        response.cost_per_month = response.unit_price * kHoursPerMonth;
        response.billing_detail = "mock-" + resource.provider + "-rate";
        return Status::ok();
    });
}

Status MockCostSource::get_pricing_spec(CallContext& ctx, const GetPricingSpecRequest& request,
                                        GetPricingSpecResponse& response) {
    return serve(Method::GetPricingSpec, ctx, request, response, [&] {
        if (!request.resource) {
            return Status(StatusCode::InvalidArgument, "resource descriptor is required");
        }
        const auto& resource = *request.resource;
        if (resource.provider.empty()) {
            return Status(StatusCode::InvalidArgument, "provider is required");
        }
        if (resource.resource_type.empty()) {
            return Status(StatusCode::InvalidArgument, "resource_type is required");
        }
        if (!resource_supported(resource.provider, resource.resource_type)) {
            return Status(StatusCode::NotFound, "no pricing for " + resource.provider + "/" +
                                                    resource.resource_type);
        }
        PricingSpec spec;
        spec.provider = resource.provider;
        spec.resource_type = resource.resource_type;
        spec.sku = resource.sku;
        spec.region = resource.region;
        spec.billing_mode = billing_mode_for(resource.resource_type);
        spec.rate_per_unit = base_hourly_rate_ * rate_multiplier(resource.resource_type);
        spec.currency = currency_;
        spec.description = "Mock pricing for " + resource.provider + " " + resource.resource_type;
        response.spec = std::move(spec);
        return Status::ok();
    });
}

Status MockCostSource::estimate_cost(CallContext& ctx, const EstimateCostRequest& request,
                                     EstimateCostResponse& response) {
    return serve(Method::EstimateCost, ctx, request, response, [&] {
        if (request.resource_type.empty()) {
            return Status(StatusCode::InvalidArgument, "resource_type is required");
        }
        bool known = false;
        for (const auto& [provider, types] : resources_) {
            if (std::find(types.begin(), types.end(), request.resource_type) != types.end()) {
                known = true;
                break;
            }
        }
        if (!known) {
            return Status(StatusCode::NotFound,
                          "resource type " + request.resource_type + " is not supported");
        }
        response.currency = currency_;
        response.cost_monthly =
            base_hourly_rate_ * rate_multiplier(request.resource_type) * kHoursPerMonth;
        return Status::ok();
    });
}

Status MockCostSource::get_recommendations(CallContext& ctx,
                                           const GetRecommendationsRequest& request,
                                           GetRecommendationsResponse& response) {
    return serve(Method::GetRecommendations, ctx, request, response, [&] {
        if (request.page_size < 0) {
            return Status(StatusCode::InvalidArgument, "page_size must not be negative");
        }
        size_t offset = 0;
        if (!request.page_token.empty()) {
            if (!std::all_of(request.page_token.begin(), request.page_token.end(),
                             [](char c) { return c >= '0' && c <= '9'; }) ||
                request.page_token.size() > 9) {
                return Status(StatusCode::InvalidArgument,
                              "invalid page token: " + request.page_token);
            }
            offset = static_cast<size_t>(std::stoul(request.page_token));
        }

        std::vector<Recommendation> matching;
        for (const auto& rec : recommendations_) {
            if (request.target_resources.empty()) {
                matching.push_back(rec);
                continue;
            }
            for (const auto& target : request.target_resources) {
                if (rec.resource_id.rfind(target.provider + ":", 0) == 0) {
                    matching.push_back(rec);
                    break;
                }
            }
        }

        if (offset > matching.size()) {
            return Status(StatusCode::InvalidArgument,
                          "invalid page token: " + request.page_token);
        }
        size_t end = matching.size();
        if (request.page_size > 0) {
            end = std::min(matching.size(), offset + static_cast<size_t>(request.page_size));
        }
        response.recommendations.assign(matching.begin() + static_cast<std::ptrdiff_t>(offset),
                                        matching.begin() + static_cast<std::ptrdiff_t>(end));
        if (end < matching.size()) {
            response.next_page_token = std::to_string(end);
        }
        return Status::ok();
    });
}

Status MockCostSource::get_budgets(CallContext& ctx, const GetBudgetsRequest& request,
                                   GetBudgetsResponse& response) {
    return serve(Method::GetBudgets, ctx, request, response, [&] {
        BudgetSummary summary;
        for (const auto& budget : budgets_) {
            if (!request.provider_filter.empty() &&
                budget.source.find(request.provider_filter) == std::string::npos) {
                continue;
            }
            Budget copy = budget;
            if (!request.include_status) {
                copy.status.reset();
            }
            if (budget.status) {
                if (budget.status->health == "ok") ++summary.budgets_ok;
                else if (budget.status->health == "warning") ++summary.budgets_warning;
                else if (budget.status->health == "exceeded") ++summary.budgets_exceeded;
            }
            ++summary.total_budgets;
            response.budgets.push_back(std::move(copy));
        }
        response.summary = summary;
        return Status::ok();
    });
}

std::unique_ptr<MockCostSource> slow_mock() {
    using std::chrono::milliseconds;
    auto mock = std::make_unique<MockCostSource>();
    mock->set_name("slow-test-plugin")
        .delay(Method::Name, milliseconds(100))
        .delay(Method::Supports, milliseconds(200))
        .delay(Method::GetActualCost, milliseconds(500))
        .delay(Method::GetProjectedCost, milliseconds(300))
        .delay(Method::GetPricingSpec, milliseconds(250))
        .delay(Method::EstimateCost, milliseconds(150));
    return mock;
}

std::unique_ptr<MockCostSource> error_mock() {
    auto mock = std::make_unique<MockCostSource>();
    mock->set_name("error-test-plugin")
        .fail_with(Method::Name, StatusCode::Internal, "mock error: name operation failed")
        .fail_with(Method::Supports, StatusCode::InvalidArgument,
                   "mock error: supports operation failed")
        .fail_with(Method::GetActualCost, StatusCode::NotFound,
                   "mock error: actual cost data not available")
        .fail_with(Method::GetProjectedCost, StatusCode::Unavailable,
                   "mock error: projected cost service unavailable")
        .fail_with(Method::GetPricingSpec, StatusCode::FailedPrecondition,
                   "mock error: pricing spec access denied")
        .fail_with(Method::EstimateCost, StatusCode::Internal,
                   "mock error: estimate cost failed");
    return mock;
}

}  // namespace costconform
