#pragma once
#ifndef COSTCONFORM_REPORT_H
#define COSTCONFORM_REPORT_H

#include <ostream>
#include <string>
#include <nlohmann/json.hpp>
#include "conformance/types.h"

namespace costconform {

// Machine-readable report. Every category appears, with attempted=false for
// those that did not run; level_achieved is "None" when Basic was missed.
nlohmann::json to_structured_report(const ConformanceResult& result);
std::string to_json(const ConformanceResult& result, int indent = 2);

// Boxed human-readable report.
void print_report(const ConformanceResult& result, std::ostream& out);

// One line per category: "<name>: N passed, N failed, N skipped".
std::string format_category_results(const ConformanceResult& result);

std::string format_timestamp(std::chrono::system_clock::time_point tp);

}  // namespace costconform

#endif  // COSTCONFORM_REPORT_H
