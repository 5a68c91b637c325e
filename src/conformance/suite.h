#pragma once
#ifndef COSTCONFORM_SUITE_H
#define COSTCONFORM_SUITE_H

#include <memory>
#include <vector>
#include "config/suite_config.h"
#include "conformance/aggregator.h"
#include "conformance/category_module.h"
#include "conformance/types.h"

namespace costconform {

// Runs the category modules against one contract implementation and
// aggregates the outcome into a ConformanceResult. Each run starts its own
// harness, so suites over different implementations may run concurrently.
class ConformanceSuite {
public:
    // Throws ConfigurationError for an invalid configuration. The suite
    // leaves the logger level alone; see apply_log_level.
    explicit ConformanceSuite(SuiteConfig config);

    void add_module(std::unique_ptr<CategoryModule> module);
    // Spec validation, RPC correctness, performance and concurrency.
    void register_default_modules();

    // Throws HarnessError when the implementation cannot be bound. Contract
    // violations never throw; they are recorded as results.
    ConformanceResult run();
    ConformanceResult run(ConformanceLevel level);
    CategoryResult run_category(TestCategory category);

    const SuiteConfig& config() const { return config_; }

private:
    SuiteConfig config_;
    std::vector<std::unique_ptr<CategoryModule>> modules_;

    CategoryModule* find_module(TestCategory category) const;
    RunRecord execute(const SuiteConfig& config, const std::vector<TestCategory>& categories);
};

// Whether a category has any check at or below the level.
bool category_runs_at(TestCategory category, ConformanceLevel level);

// Sets the default spdlog logger to config.log_level. The level is process
// wide, so suites running at the same time share whichever was applied last.
// The run_*_conformance entry points call this before running.
void apply_log_level(const SuiteConfig& config);

ConformanceResult run_basic_conformance(CostSourceService& service);
ConformanceResult run_standard_conformance(CostSourceService& service);
ConformanceResult run_advanced_conformance(CostSourceService& service);

}  // namespace costconform

#endif  // COSTCONFORM_SUITE_H
