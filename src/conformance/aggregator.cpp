#include "conformance/aggregator.h"

#include <algorithm>
#include <set>
#include <tuple>

namespace costconform {

namespace {

bool result_less(const TestResult& a, const TestResult& b) {
    return std::make_tuple(a.name, static_cast<int>(a.level), static_cast<int>(a.status),
                           a.error.value_or("")) <
           std::make_tuple(b.name, static_cast<int>(b.level), static_cast<int>(b.status),
                           b.error.value_or(""));
}

const CategoryResult* find_category(const std::vector<CategoryResult>& categories,
                                    TestCategory category) {
    for (const auto& c : categories) {
        if (c.category == category) return &c;
    }
    return nullptr;
}

bool level_satisfied(const std::vector<CategoryResult>& categories, ConformanceLevel level) {
    for (TestCategory required : required_categories(level)) {
        const CategoryResult* c = find_category(categories, required);
        if (c == nullptr || !c->attempted) {
            return false;
        }
        for (const auto& r : c->results) {
            if (r.level <= level && r.blocks_certification()) {
                return false;
            }
        }
    }
    return true;
}

}  // namespace

std::vector<TestCategory> required_categories(ConformanceLevel level) {
    if (level == ConformanceLevel::Basic) {
        return {TestCategory::SpecValidation, TestCategory::RPCCorrectness};
    }
    return {kCategoryOrder.begin(), kCategoryOrder.end()};
}

CategoryResult aggregate_category(TestCategory category, std::vector<TestResult> results,
                                  std::vector<std::string> warnings) {
    CategoryResult out;
    out.category = category;
    out.attempted = !results.empty();
    std::sort(results.begin(), results.end(), result_less);
    for (const auto& r : results) {
        switch (r.status) {
            case TestStatus::Passed: ++out.passed; break;
            case TestStatus::Failed: ++out.failed; break;
            case TestStatus::Skipped: ++out.skipped; break;
            case TestStatus::TimedOut: ++out.timed_out; break;
            case TestStatus::Cancelled: ++out.cancelled; break;
        }
    }
    out.results = std::move(results);
    std::set<std::string> unique(warnings.begin(), warnings.end());
    out.warnings.assign(unique.begin(), unique.end());
    return out;
}

std::optional<ConformanceLevel> determine_achieved_level(
    const std::vector<CategoryResult>& categories, ConformanceLevel requested) {
    std::optional<ConformanceLevel> achieved;
    for (ConformanceLevel level :
         {ConformanceLevel::Basic, ConformanceLevel::Standard, ConformanceLevel::Advanced}) {
        if (level > requested || !level_satisfied(categories, level)) {
            break;
        }
        achieved = level;
    }
    return achieved;
}

ConformanceResult aggregate(const RunRecord& record) {
    std::map<TestCategory, std::vector<TestResult>> by_category;
    for (const auto& r : record.results) {
        by_category[r.category].push_back(r);
    }

    ConformanceResult result;
    result.timestamp = record.started;
    result.plugin_name = record.plugin_name;
    result.requested_level = record.requested_level;
    result.duration = record.duration;
    for (TestCategory category : kCategoryOrder) {
        std::vector<std::string> warnings;
        auto w = record.category_warnings.find(category);
        if (w != record.category_warnings.end()) {
            warnings = w->second;
        }
        result.categories.push_back(
            aggregate_category(category, std::move(by_category[category]), std::move(warnings)));
    }
    result.achieved_level = determine_achieved_level(result.categories, record.requested_level);
    result.summary = summarize(result);
    return result;
}

std::string summarize(const ConformanceResult& result) {
    std::string out = result.plugin_name + " achieved " +
                      (result.achieved_level ? to_string(*result.achieved_level) : "no level") +
                      " (requested " + to_string(result.requested_level) + "): " +
                      std::to_string(result.count(TestStatus::Passed)) + " passed, " +
                      std::to_string(result.count(TestStatus::Failed)) + " failed, " +
                      std::to_string(result.count(TestStatus::Skipped)) + " skipped, " +
                      std::to_string(result.count(TestStatus::TimedOut)) + " timed out, " +
                      std::to_string(result.count(TestStatus::Cancelled)) + " cancelled";

    std::vector<std::string> blocking;
    for (const auto& c : result.categories) {
        if (c.attempted && !c.satisfied()) {
            blocking.push_back(to_string(c.category));
        }
    }
    if (!blocking.empty()) {
        out += "; unsatisfied:";
        for (const auto& name : blocking) out += " " + name;
    }
    for (const auto& c : result.categories) {
        for (const auto& w : c.warnings) {
            out += "; " + std::string(to_string(c.category)) + ": " + w;
        }
    }
    return out;
}

}  // namespace costconform
