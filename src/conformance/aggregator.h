#pragma once
#ifndef COSTCONFORM_AGGREGATOR_H
#define COSTCONFORM_AGGREGATOR_H

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "conformance/types.h"

namespace costconform {

// Raw output of one suite run, before aggregation.
struct RunRecord {
    std::string plugin_name = "unknown";
    ConformanceLevel requested_level = ConformanceLevel::Basic;
    std::vector<TestResult> results;
    std::map<TestCategory, std::vector<std::string>> category_warnings;
    std::chrono::system_clock::time_point started;
    std::chrono::nanoseconds duration{0};
};

// Categories that must be satisfied to claim the level.
std::vector<TestCategory> required_categories(ConformanceLevel level);

// Counts and sorts the results of one category. A category with no results
// is reported as not attempted.
CategoryResult aggregate_category(TestCategory category, std::vector<TestResult> results,
                                  std::vector<std::string> warnings = {});

// Highest level L <= requested such that every category required at L was
// attempted and has no Failed, TimedOut or Cancelled result from a check at
// or below L. std::nullopt when Basic is not reached.
std::optional<ConformanceLevel> determine_achieved_level(
    const std::vector<CategoryResult>& categories, ConformanceLevel requested);

// Pure: the same record always yields the same result, whatever the order of
// its test results.
ConformanceResult aggregate(const RunRecord& record);

std::string summarize(const ConformanceResult& result);

}  // namespace costconform

#endif  // COSTCONFORM_AGGREGATOR_H
