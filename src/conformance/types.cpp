#include "conformance/types.h"

namespace costconform {

const char* to_string(ConformanceLevel level) {
    switch (level) {
        case ConformanceLevel::Basic: return "Basic";
        case ConformanceLevel::Standard: return "Standard";
        case ConformanceLevel::Advanced: return "Advanced";
    }
    return "Unknown";
}

const char* to_string(TestCategory category) {
    switch (category) {
        case TestCategory::SpecValidation: return "spec_validation";
        case TestCategory::RPCCorrectness: return "rpc_correctness";
        case TestCategory::Performance: return "performance";
        case TestCategory::Concurrency: return "concurrency";
    }
    return "unknown";
}

const char* to_string(TestStatus status) {
    switch (status) {
        case TestStatus::Passed: return "passed";
        case TestStatus::Failed: return "failed";
        case TestStatus::Skipped: return "skipped";
        case TestStatus::TimedOut: return "timed_out";
        case TestStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::optional<ConformanceLevel> parse_level(const std::string& text) {
    if (text == "Basic" || text == "basic") return ConformanceLevel::Basic;
    if (text == "Standard" || text == "standard") return ConformanceLevel::Standard;
    if (text == "Advanced" || text == "advanced") return ConformanceLevel::Advanced;
    return std::nullopt;
}

int ConformanceResult::total() const {
    int n = 0;
    for (const auto& c : categories) n += c.total();
    return n;
}

int ConformanceResult::count(TestStatus status) const {
    int n = 0;
    for (const auto& c : categories) {
        switch (status) {
            case TestStatus::Passed: n += c.passed; break;
            case TestStatus::Failed: n += c.failed; break;
            case TestStatus::Skipped: n += c.skipped; break;
            case TestStatus::TimedOut: n += c.timed_out; break;
            case TestStatus::Cancelled: n += c.cancelled; break;
        }
    }
    return n;
}

const CategoryResult* ConformanceResult::category(TestCategory category) const {
    for (const auto& c : categories) {
        if (c.category == category) return &c;
    }
    return nullptr;
}

}  // namespace costconform
