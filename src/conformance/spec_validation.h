#pragma once
#ifndef COSTCONFORM_SPEC_VALIDATION_H
#define COSTCONFORM_SPEC_VALIDATION_H

#include "conformance/category_module.h"

namespace costconform {

// Calls every method once with a valid request and checks the response's
// required fields and enum domains. One result per method lists all findings.
class SpecValidationModule : public CategoryModule {
public:
    TestCategory category() const override { return TestCategory::SpecValidation; }
    std::vector<TestResult> run(CheckContext& ctx) override;
};

}  // namespace costconform

#endif  // COSTCONFORM_SPEC_VALIDATION_H
