#include "conformance/report.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace costconform {

namespace {

constexpr size_t kBoxWidth = 66;
constexpr size_t kMaxErrorWidth = 52;

double to_millis(std::chrono::nanoseconds d) {
    return std::chrono::duration<double, std::milli>(d).count();
}

// Columns taken on a terminal; UTF-8 continuation bytes take none.
size_t display_width(const std::string& s) {
    size_t width = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++width;
    }
    return width;
}

std::string truncate(const std::string& s, size_t max_len) {
    if (s.size() <= max_len) return s;
    return s.substr(0, max_len - 3) + "...";
}

void rule(std::ostream& out, const char* left, const char* fill, const char* right) {
    out << left;
    for (size_t i = 0; i < kBoxWidth; ++i) out << fill;
    out << right << "\n";
}

void row(std::ostream& out, const std::string& text) {
    std::string line = " " + text;
    size_t width = display_width(line);
    out << "║" << line;
    for (size_t i = width; i < kBoxWidth; ++i) out << ' ';
    out << "║\n";
}

std::string format_duration(std::chrono::nanoseconds d) {
    std::ostringstream ss;
    double ms = to_millis(d);
    if (ms >= 1000.0) {
        ss << std::fixed << std::setprecision(2) << ms / 1000.0 << "s";
    } else {
        ss << std::fixed << std::setprecision(2) << ms << "ms";
    }
    return ss.str();
}

nlohmann::json test_to_json(const TestResult& r) {
    nlohmann::json j;
    j["name"] = r.name;
    j["status"] = to_string(r.status);
    j["level"] = to_string(r.level);
    j["duration_ms"] = to_millis(r.duration);
    if (r.error) {
        j["error"] = *r.error;
    }
    if (!r.metrics.empty()) {
        nlohmann::json metrics = nlohmann::json::array();
        for (const auto& m : r.metrics) {
            metrics.push_back({{"name", m.name}, {"value", m.value}, {"unit", m.unit}});
        }
        j["metrics"] = std::move(metrics);
    }
    if (!r.warnings.empty()) {
        j["warnings"] = r.warnings;
    }
    return j;
}

nlohmann::json category_to_json(const CategoryResult& c) {
    nlohmann::json j;
    j["name"] = to_string(c.category);
    j["attempted"] = c.attempted;
    j["satisfied"] = c.satisfied();
    j["total"] = c.total();
    j["passed"] = c.passed;
    j["failed"] = c.failed;
    j["skipped"] = c.skipped;
    j["timed_out"] = c.timed_out;
    j["cancelled"] = c.cancelled;
    j["warnings"] = c.warnings;
    nlohmann::json tests = nlohmann::json::array();
    for (const auto& r : c.results) {
        tests.push_back(test_to_json(r));
    }
    j["tests"] = std::move(tests);
    return j;
}

}  // namespace

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

nlohmann::json to_structured_report(const ConformanceResult& result) {
    nlohmann::json j;
    j["version"] = result.version;
    j["timestamp"] = format_timestamp(result.timestamp);
    j["plugin_name"] = result.plugin_name;
    j["requested_level"] = to_string(result.requested_level);
    j["level_achieved"] = result.achieved_level ? to_string(*result.achieved_level) : "None";
    j["duration_ms"] = to_millis(result.duration);
    j["summary"] = {
        {"total", result.total()},
        {"passed", result.count(TestStatus::Passed)},
        {"failed", result.count(TestStatus::Failed)},
        {"skipped", result.count(TestStatus::Skipped)},
        {"timed_out", result.count(TestStatus::TimedOut)},
        {"cancelled", result.count(TestStatus::Cancelled)},
    };
    j["summary_text"] = result.summary;

    nlohmann::json categories = nlohmann::json::array();
    for (TestCategory category : kCategoryOrder) {
        if (const CategoryResult* c = result.category(category)) {
            categories.push_back(category_to_json(*c));
        } else {
            CategoryResult empty;
            empty.category = category;
            categories.push_back(category_to_json(empty));
        }
    }
    j["categories"] = std::move(categories);
    return j;
}

std::string to_json(const ConformanceResult& result, int indent) {
    return to_structured_report(result).dump(indent);
}

void print_report(const ConformanceResult& result, std::ostream& out) {
    out << "\n";
    rule(out, "╔", "═", "╗");
    row(out, "              Plugin Conformance Test Report");
    rule(out, "╠", "═", "╣");
    row(out, "Plugin: " + truncate(result.plugin_name, 56));
    row(out, std::string("Level Achieved: ") +
                 (result.achieved_level ? to_string(*result.achieved_level) : "None") +
                 " (requested " + to_string(result.requested_level) + ")");
    row(out, "Duration: " + format_duration(result.duration));
    rule(out, "╠", "═", "╣");
    row(out, "Summary");
    rule(out, "╠", "─", "╣");
    row(out, "  Total:     " + std::to_string(result.total()));
    row(out, "  Passed:    " + std::to_string(result.count(TestStatus::Passed)));
    row(out, "  Failed:    " + std::to_string(result.count(TestStatus::Failed)));
    row(out, "  Skipped:   " + std::to_string(result.count(TestStatus::Skipped)));
    row(out, "  Timed out: " + std::to_string(result.count(TestStatus::TimedOut)));
    row(out, "  Cancelled: " + std::to_string(result.count(TestStatus::Cancelled)));
    rule(out, "╠", "═", "╣");
    row(out, "Categories");
    rule(out, "╠", "─", "╣");
    for (const auto& c : result.categories) {
        if (!c.attempted) {
            row(out, std::string("  - ") + to_string(c.category) + "  not attempted");
            continue;
        }
        std::ostringstream ss;
        ss << "  " << (c.satisfied() ? "✓" : "✗") << " " << std::left << std::setw(16)
           << to_string(c.category) << "  Passed: " << std::right << std::setw(2) << c.passed
           << "  Failed: " << std::setw(2) << c.failed + c.timed_out + c.cancelled
           << "  Skipped: " << std::setw(2) << c.skipped;
        row(out, ss.str());
    }

    bool any_blocking = false;
    for (const auto& c : result.categories) {
        for (const auto& r : c.results) {
            if (r.blocks_certification()) any_blocking = true;
        }
    }
    if (any_blocking) {
        rule(out, "╠", "═", "╣");
        row(out, "Failed Tests");
        rule(out, "╠", "─", "╣");
        for (const auto& c : result.categories) {
            for (const auto& r : c.results) {
                if (!r.blocks_certification()) continue;
                row(out, "  • " + truncate(r.name, 48) + " [" + to_string(r.status) + "]");
                if (r.error) {
                    row(out, "    Error: " + truncate(*r.error, kMaxErrorWidth));
                }
            }
        }
    }

    bool any_warning = false;
    for (const auto& c : result.categories) {
        if (!c.warnings.empty()) any_warning = true;
    }
    if (any_warning) {
        rule(out, "╠", "═", "╣");
        row(out, "Warnings");
        rule(out, "╠", "─", "╣");
        for (const auto& c : result.categories) {
            for (const auto& w : c.warnings) {
                row(out, "  ! " + truncate(std::string(to_string(c.category)) + ": " + w, 60));
            }
        }
    }

    rule(out, "╠", "═", "╣");
    if (!any_blocking && result.achieved_level == result.requested_level) {
        row(out, "                        ✓ ALL TESTS PASSED");
    } else {
        row(out, "                        ✗ SOME TESTS FAILED");
    }
    rule(out, "╚", "═", "╝");
    out << "\n";
}

std::string format_category_results(const ConformanceResult& result) {
    std::ostringstream ss;
    for (const auto& c : result.categories) {
        ss << to_string(c.category) << ": ";
        if (!c.attempted) {
            ss << "not attempted\n";
            continue;
        }
        ss << c.passed << " passed, " << c.failed << " failed, " << c.skipped << " skipped";
        if (c.timed_out > 0) ss << ", " << c.timed_out << " timed out";
        if (c.cancelled > 0) ss << ", " << c.cancelled << " cancelled";
        ss << "\n";
    }
    return ss.str();
}

}  // namespace costconform
