#pragma once
#ifndef COSTCONFORM_BASELINES_H
#define COSTCONFORM_BASELINES_H

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "contract/messages.h"

namespace costconform {

// Expected latency and allocation ceilings for one measured operation.
// GetActualCost is measured over a 24 hour and a 30 day range.
struct PerformanceBaseline {
    std::string operation;
    Method method = Method::Name;
    std::chrono::milliseconds standard_ceiling{0};
    // False for operations only measured at Advanced.
    bool measured_at_standard = true;
    std::optional<std::chrono::milliseconds> advanced_ceiling;
    // Ceiling on net heap growth per call (retained memory, not transient
    // allocations); 0 reports the measurement without enforcing it.
    size_t allocation_ceiling_bytes = 0;
};

const std::vector<PerformanceBaseline>& default_baselines();

// Default entry for the operation, replaced by an override when present.
std::optional<PerformanceBaseline> find_baseline(
    const std::string& operation,
    const std::map<std::string, PerformanceBaseline>& overrides);

}  // namespace costconform

#endif  // COSTCONFORM_BASELINES_H
