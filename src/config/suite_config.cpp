#include "config/suite_config.h"

#include <algorithm>
#include <spdlog/spdlog.h>
#include "common/errors.h"

namespace costconform {

namespace {
constexpr int kMaxFanOut = 50;
}  // namespace

SuiteConfig SuiteConfig::for_level(ConformanceLevel level, CostSourceService* target) {
    SuiteConfig config;
    config.target = target;
    config.target_level = level;
    switch (level) {
        case ConformanceLevel::Basic:
            config.test_timeout = std::chrono::seconds(60);
            config.concurrency_fan_out = 1;
            break;
        case ConformanceLevel::Standard:
            config.test_timeout = std::chrono::seconds(60);
            config.concurrency_fan_out = 10;
            break;
        case ConformanceLevel::Advanced:
            config.test_timeout = std::chrono::seconds(120);
            config.concurrency_fan_out = 50;
            break;
    }
    return config;
}

void SuiteConfig::validate() const {
    if (test_timeout.count() <= 0) {
        throw ConfigurationError("test_timeout must be positive");
    }
    if (concurrency_fan_out <= 0) {
        throw ConfigurationError("concurrency_fan_out must be positive");
    }
    if (advanced_fan_out_multiplier <= 0) {
        throw ConfigurationError("advanced_fan_out_multiplier must be positive");
    }
    if (performance.warmup_iterations < 0) {
        throw ConfigurationError("performance.warmup_iterations must not be negative");
    }
    if (performance.timed_iterations <= 0) {
        throw ConfigurationError("performance.timed_iterations must be positive");
    }
    if (performance.tolerance < 0.0) {
        throw ConfigurationError("performance.tolerance must not be negative");
    }
    if (performance.warning_ratio <= 0.0 || performance.warning_ratio > 1.0) {
        throw ConfigurationError("performance.warning_ratio must be in (0, 1]");
    }
    if (performance.suite_timeout.count() <= 0) {
        throw ConfigurationError("performance.suite_timeout must be positive");
    }
    for (const auto& [operation, baseline] : performance.baseline_overrides) {
        if (!find_baseline(operation, {})) {
            throw ConfigurationError("baseline override for unknown operation " + operation);
        }
        if (baseline.standard_ceiling.count() < 0 ||
            (baseline.advanced_ceiling && baseline.advanced_ceiling->count() < 0)) {
            throw ConfigurationError("baseline override for " + operation +
                                     " has a negative ceiling");
        }
    }
    if (max_message_bytes == 0) {
        throw ConfigurationError("max_message_bytes must be positive");
    }
    if (channel_threads == 0) {
        throw ConfigurationError("channel_threads must be positive");
    }
    if (spdlog::level::from_str(log_level) == spdlog::level::off && log_level != "off") {
        throw ConfigurationError("unknown log level: " + log_level);
    }
}

int SuiteConfig::advanced_fan_out() const {
    return std::max(concurrency_fan_out,
                    std::min(concurrency_fan_out * advanced_fan_out_multiplier, kMaxFanOut));
}

size_t SuiteConfig::effective_channel_threads() const {
    size_t fan_out = static_cast<size_t>(concurrency_fan_out);
    if (target_level == ConformanceLevel::Advanced) {
        fan_out = static_cast<size_t>(advanced_fan_out());
    }
    return std::max(channel_threads, fan_out);
}

bool SuiteConfig::race_detection_active() const {
    return race_detection.value_or(built_with_race_detector());
}

bool built_with_race_detector() {
#if defined(__SANITIZE_THREAD__)
    return true;
#elif defined(__has_feature)
#if __has_feature(thread_sanitizer)
    return true;
#else
    return false;
#endif
#else
    return false;
#endif
}

}  // namespace costconform
