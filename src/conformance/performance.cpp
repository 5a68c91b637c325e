#include "conformance/performance.h"

#include <algorithm>
#include <functional>
#include <sstream>
#include <iomanip>
#include <spdlog/spdlog.h>
#include "conformance/baselines.h"
#include "utils/alloc_probe.h"

namespace costconform {

namespace {

constexpr TestCategory kCategory = TestCategory::Performance;

using TimedCall = std::function<Status(ClientContext&)>;

double to_ms(std::chrono::nanoseconds d) {
    return std::chrono::duration<double, std::milli>(d).count();
}

std::string format_ms(double ms) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << ms << "ms";
    return oss.str();
}

TimedCall call_for(CheckContext& ctx, const PerformanceBaseline& baseline) {
    auto& client = ctx.client();
    switch (baseline.method) {
        case Method::Name:
            return [&client](ClientContext& c) { return client.name(c, NameRequest{}).status; };
        case Method::Supports:
            return [&client, request = ctx.supports_request()](ClientContext& c) {
                return client.supports(c, request).status;
            };
        case Method::GetActualCost: {
            bool thirty_days = baseline.operation.find("30d") != std::string::npos;
            auto span = std::chrono::hours(thirty_days ? 24 * 30 : 24);
            return [&client, request = ctx.actual_cost_request(span)](ClientContext& c) {
                return client.get_actual_cost(c, request).status;
            };
        }
        case Method::GetProjectedCost:
            return [&client, request = ctx.projected_cost_request()](ClientContext& c) {
                return client.get_projected_cost(c, request).status;
            };
        case Method::GetPricingSpec:
            return [&client, request = ctx.pricing_spec_request()](ClientContext& c) {
                return client.get_pricing_spec(c, request).status;
            };
        case Method::EstimateCost:
            return [&client, request = ctx.estimate_cost_request()](ClientContext& c) {
                return client.estimate_cost(c, request).status;
            };
        case Method::GetRecommendations:
            return [&client, request = ctx.recommendations_request()](ClientContext& c) {
                return client.get_recommendations(c, request).status;
            };
        case Method::GetBudgets:
            return [&client, request = ctx.budgets_request()](ClientContext& c) {
                return client.get_budgets(c, request).status;
            };
    }
    return {};
}

struct Measurement {
    LatencyStats stats;
    Status failure;
    bool budget_exhausted = false;
    bool unimplemented = false;
};

class Benchmark {
public:
    Benchmark(CheckContext& ctx, Clock::time_point budget_deadline)
        : ctx_(ctx), budget_deadline_(budget_deadline) {}

    Measurement measure(const PerformanceBaseline& baseline) {
        Measurement m;
        TimedCall call = call_for(ctx_, baseline);
        const auto& perf = ctx_.config().performance;

        for (int i = 0; i < perf.warmup_iterations; ++i) {
            if (!run_one(call, m, baseline.method, nullptr)) return m;
        }

        std::vector<std::chrono::nanoseconds> samples;
        samples.reserve(static_cast<size_t>(perf.timed_iterations));
        auto heap_before = heap_in_use_bytes();
        for (int i = 0; i < perf.timed_iterations; ++i) {
            std::chrono::nanoseconds latency{0};
            if (!run_one(call, m, baseline.method, &latency)) return m;
            samples.push_back(latency);
        }
        auto heap_after = heap_in_use_bytes();

        m.stats.iterations = static_cast<int>(samples.size());
        m.stats.min = *std::min_element(samples.begin(), samples.end());
        m.stats.max = *std::max_element(samples.begin(), samples.end());
        std::chrono::nanoseconds total{0};
        for (auto s : samples) total += s;
        m.stats.mean = total / static_cast<int64_t>(samples.size());
        if (heap_before && heap_after) {
            double delta = static_cast<double>(*heap_after) - static_cast<double>(*heap_before);
            m.stats.heap_growth_per_call = std::max(0.0, delta) / samples.size();
        }
        return m;
    }

private:
    CheckContext& ctx_;
    Clock::time_point budget_deadline_;

    bool run_one(const TimedCall& call, Measurement& m, Method method,
                 std::chrono::nanoseconds* latency) {
        auto now = Clock::now();
        if (now >= budget_deadline_) {
            m.budget_exhausted = true;
            return false;
        }
        ClientContext call_ctx = ctx_.new_call();
        if (!call_ctx.deadline() || *call_ctx.deadline() > budget_deadline_) {
            call_ctx.set_deadline(budget_deadline_);
        }
        auto start = Clock::now();
        Status status = call(call_ctx);
        auto elapsed = elapsed_since(start);
        if (!status.is_ok()) {
            if (status.is_timeout() && Clock::now() >= budget_deadline_) {
                m.budget_exhausted = true;
            } else if (is_optional_method(method) && !status.from_transport() &&
                       status.code() == StatusCode::Unimplemented) {
                m.unimplemented = true;
            }
            m.failure = status;
            return false;
        }
        if (latency) *latency = elapsed;
        return true;
    }
};

}  // namespace

void evaluate_latency(TestResult& result, const LatencyStats& stats,
                      std::chrono::milliseconds ceiling, size_t allocation_ceiling_bytes,
                      const PerformanceConfig& config) {
    double mean_ms = to_ms(stats.mean);
    double ceiling_ms = static_cast<double>(ceiling.count());
    double margin_ms = ceiling_ms * (1.0 + config.tolerance);

    result.metrics.push_back({"latency_min", to_ms(stats.min), "ms"});
    result.metrics.push_back({"latency_mean", mean_ms, "ms"});
    result.metrics.push_back({"latency_max", to_ms(stats.max), "ms"});
    result.metrics.push_back({"ceiling", ceiling_ms, "ms"});
    result.metrics.push_back({"iterations", static_cast<double>(stats.iterations), "calls"});
    if (stats.heap_growth_per_call) {
        result.metrics.push_back({"heap_growth_per_call", *stats.heap_growth_per_call, "bytes"});
    }

    if (mean_ms > margin_ms) {
        fail(result, "mean latency " + format_ms(mean_ms) + " exceeds ceiling " +
                         format_ms(ceiling_ms) + " (margin " + format_ms(margin_ms) +
                         "); min " + format_ms(to_ms(stats.min)) + ", max " +
                         format_ms(to_ms(stats.max)));
        return;
    }
    if (allocation_ceiling_bytes > 0 && stats.heap_growth_per_call &&
        *stats.heap_growth_per_call > static_cast<double>(allocation_ceiling_bytes)) {
        fail(result, "heap growth of " + std::to_string(static_cast<long long>(
                                              *stats.heap_growth_per_call)) +
                         " bytes per call exceeds ceiling of " +
                         std::to_string(allocation_ceiling_bytes));
        return;
    }
    if (mean_ms >= margin_ms * config.warning_ratio) {
        result.warnings.push_back("mean latency " + format_ms(mean_ms) + " is within " +
                                  std::to_string(static_cast<int>(
                                      (1.0 - config.warning_ratio) * 100.0 + 0.5)) +
                                  "% of the " + format_ms(margin_ms) + " margin");
        spdlog::warn("{} is close to its latency ceiling: {}", result.name,
                     result.warnings.back());
    }
}

std::vector<TestResult> PerformanceModule::run(CheckContext& ctx) {
    std::vector<TestResult> results;
    const auto& perf = ctx.config().performance;
    Benchmark bench(ctx, Clock::now() + perf.suite_timeout);

    for (const auto& defaults : default_baselines()) {
        auto baseline = find_baseline(defaults.operation, perf.baseline_overrides);
        if (!baseline) continue;

        struct Check {
            std::string name;
            ConformanceLevel level;
            std::chrono::milliseconds ceiling;
        };
        std::vector<Check> checks;
        if (baseline->measured_at_standard) {
            checks.push_back({baseline->operation + "_Latency", ConformanceLevel::Standard,
                              baseline->standard_ceiling});
        }
        if (baseline->advanced_ceiling) {
            checks.push_back({baseline->operation + "_LatencyAdvanced", ConformanceLevel::Advanced,
                              *baseline->advanced_ceiling});
        }

        bool any_in_target = std::any_of(checks.begin(), checks.end(), [&](const Check& c) {
            return ctx.within_target(c.level);
        });
        auto skip = ctx.skip_reason(baseline->method);

        Measurement m;
        std::chrono::nanoseconds measured_for{0};
        if (any_in_target && !skip) {
            auto start = Clock::now();
            m = bench.measure(*baseline);
            measured_for = elapsed_since(start);
            if (m.unimplemented) {
                ctx.mark_unimplemented(baseline->method);
                skip = ctx.skip_reason(baseline->method);
            }
        }

        for (const auto& check : checks) {
            if (!ctx.within_target(check.level)) {
                results.push_back(above_target_result(check.name, kCategory, check.level));
                continue;
            }
            if (skip) {
                results.push_back(skipped_result(check.name, kCategory, check.level, *skip));
                continue;
            }
            TestResult result = make_result(check.name, kCategory, check.level);
            result.duration = measured_for;
            if (m.budget_exhausted) {
                result.status = TestStatus::TimedOut;
                result.error = "performance suite timeout of " +
                               std::to_string(perf.suite_timeout.count()) + "s reached";
            } else if (!m.failure.is_ok()) {
                record_call_failure(result, m.failure);
            } else {
                evaluate_latency(result, m.stats, check.ceiling,
                                 baseline->allocation_ceiling_bytes, perf);
            }
            spdlog::debug("[performance] {} {} mean={}{}", result.name, to_string(result.status),
                          format_ms(to_ms(m.stats.mean)),
                          result.error ? ": " + *result.error : std::string());
            results.push_back(std::move(result));
        }
    }
    return results;
}

}  // namespace costconform
