#pragma once
#ifndef COSTCONFORM_SUITE_CONFIG_H
#define COSTCONFORM_SUITE_CONFIG_H

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include "conformance/baselines.h"
#include "conformance/types.h"
#include "contract/cost_source_service.h"
#include "contract/messages.h"

namespace costconform {

struct PerformanceConfig {
    int warmup_iterations = 3;
    int timed_iterations = 10;
    // A mean latency above baseline * (1 + tolerance) fails.
    double tolerance = 0.10;
    // A passing mean at or above this fraction of the margin gets a warning.
    double warning_ratio = 0.80;
    // Budget for the whole Performance category.
    std::chrono::seconds suite_timeout{120};
    std::map<std::string, PerformanceBaseline> baseline_overrides;
};

struct SuiteConfig {
    // Borrowed; the caller keeps the implementation alive for the run.
    CostSourceService* target = nullptr;
    ConformanceLevel target_level = ConformanceLevel::Standard;

    std::chrono::milliseconds test_timeout{60000};
    int concurrency_fan_out = 10;
    int advanced_fan_out_multiplier = 5;
    PerformanceConfig performance;

    size_t max_message_bytes = 4 * 1024 * 1024;  // 4MB
    size_t channel_threads = 4;
    std::string log_level = "info";

    // Overrides the build-time detection of a race-detecting runtime.
    std::optional<bool> race_detection;

    // Descriptor used for requests that need a supported resource.
    ResourceDescriptor sample_resource{"aws", "ec2", "t3.micro", "us-east-1", {}};

    // Presets used by the run_*_conformance entry points.
    static SuiteConfig for_level(ConformanceLevel level, CostSourceService* target = nullptr);

    // Throws ConfigurationError.
    void validate() const;

    int advanced_fan_out() const;
    // Workers needed so that every fan-out call is served in parallel.
    size_t effective_channel_threads() const;
    bool race_detection_active() const;
};

// True when the library was built with ThreadSanitizer.
bool built_with_race_detector();

}  // namespace costconform

#endif  // COSTCONFORM_SUITE_CONFIG_H
