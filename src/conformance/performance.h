#pragma once
#ifndef COSTCONFORM_PERFORMANCE_H
#define COSTCONFORM_PERFORMANCE_H

#include <chrono>
#include <optional>
#include "conformance/category_module.h"

namespace costconform {

// Latency and heap figures for one measured operation.
struct LatencyStats {
    int iterations = 0;
    std::chrono::nanoseconds min{0};
    std::chrono::nanoseconds mean{0};
    std::chrono::nanoseconds max{0};
    // Net process heap growth across the timed calls divided by the call
    // count, floored at 0. Memory freed within a call does not show up, and
    // allocations made by other threads during the loop do.
    std::optional<double> heap_growth_per_call;
};

// Compares mean latency against the baseline ceiling widened by the
// configured tolerance. Exceeding the margin fails; a mean at or above
// warning_ratio of the margin passes with a warning.
void evaluate_latency(TestResult& result, const LatencyStats& stats,
                      std::chrono::milliseconds ceiling, size_t allocation_ceiling_bytes,
                      const PerformanceConfig& config);

// Measures each operation of the baseline table after a warm-up and checks
// it against the Standard and Advanced ceilings.
class PerformanceModule : public CategoryModule {
public:
    TestCategory category() const override { return TestCategory::Performance; }
    std::vector<TestResult> run(CheckContext& ctx) override;
};

}  // namespace costconform

#endif  // COSTCONFORM_PERFORMANCE_H
