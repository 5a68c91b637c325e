#pragma once
#ifndef COSTCONFORM_TYPES_H
#define COSTCONFORM_TYPES_H

#include <array>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace costconform {

enum class ConformanceLevel { Basic = 1, Standard = 2, Advanced = 3 };

enum class TestCategory { SpecValidation, RPCCorrectness, Performance, Concurrency };

// Categories in execution order.
constexpr std::array<TestCategory, 4> kCategoryOrder = {
    TestCategory::SpecValidation,
    TestCategory::RPCCorrectness,
    TestCategory::Performance,
    TestCategory::Concurrency,
};

enum class TestStatus { Passed, Failed, Skipped, TimedOut, Cancelled };

const char* to_string(ConformanceLevel level);
const char* to_string(TestCategory category);
const char* to_string(TestStatus status);
std::optional<ConformanceLevel> parse_level(const std::string& text);

// A numeric observation attached to a result, e.g. mean latency.
struct Metric {
    std::string name;
    double value = 0.0;
    std::string unit;
};

struct TestResult {
    std::string name;
    TestCategory category = TestCategory::SpecValidation;
    // Lowest level whose certification depends on this check.
    ConformanceLevel level = ConformanceLevel::Basic;
    TestStatus status = TestStatus::Passed;
    std::chrono::nanoseconds duration{0};
    std::optional<std::string> error;
    std::vector<Metric> metrics;
    std::vector<std::string> warnings;

    bool blocks_certification() const {
        return status == TestStatus::Failed || status == TestStatus::TimedOut ||
               status == TestStatus::Cancelled;
    }
};

struct CategoryResult {
    TestCategory category = TestCategory::SpecValidation;
    bool attempted = false;
    int passed = 0;
    int failed = 0;
    int skipped = 0;
    int timed_out = 0;
    int cancelled = 0;
    std::vector<TestResult> results;
    std::vector<std::string> warnings;

    int total() const { return passed + failed + skipped + timed_out + cancelled; }
    bool satisfied() const {
        return attempted && failed == 0 && timed_out == 0 && cancelled == 0;
    }
};

struct ConformanceResult {
    std::string version = "1.0.0";
    std::chrono::system_clock::time_point timestamp;
    std::string plugin_name = "unknown";
    ConformanceLevel requested_level = ConformanceLevel::Basic;
    // std::nullopt when not even Basic was achieved.
    std::optional<ConformanceLevel> achieved_level;
    std::vector<CategoryResult> categories;
    std::chrono::nanoseconds duration{0};
    std::string summary;

    int total() const;
    int count(TestStatus status) const;
    const CategoryResult* category(TestCategory category) const;
};

}  // namespace costconform

#endif  // COSTCONFORM_TYPES_H
