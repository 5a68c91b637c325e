#include "conformance/suite.h"

#include <utility>
#include <spdlog/spdlog.h>
#include "common/errors.h"
#include "conformance/concurrency.h"
#include "conformance/performance.h"
#include "conformance/rpc_correctness.h"
#include "conformance/spec_validation.h"
#include "transport/harness.h"

namespace costconform {

namespace {

// Plugin name and advertised capabilities, probed before the modules run.
void probe_plugin(CheckContext& ctx, RunRecord& record) {
    ClientContext name_call = ctx.new_call();
    auto name = ctx.client().name(name_call, NameRequest{});
    if (name.ok() && !name.response->name.empty()) {
        record.plugin_name = name.response->name;
    } else {
        spdlog::warn("Could not read plugin name: {}", name.status.to_string());
    }

    ClientContext supports_call = ctx.new_call();
    auto supports = ctx.client().supports(supports_call, ctx.supports_request());
    if (supports.ok()) {
        ctx.set_capabilities(supports.response->capabilities);
    } else {
        spdlog::warn("Could not read plugin capabilities: {}", supports.status.to_string());
    }
}

}  // namespace

bool category_runs_at(TestCategory category, ConformanceLevel level) {
    switch (category) {
        case TestCategory::SpecValidation:
        case TestCategory::RPCCorrectness:
            return true;
        case TestCategory::Performance:
        case TestCategory::Concurrency:
            return level >= ConformanceLevel::Standard;
    }
    return false;
}

ConformanceSuite::ConformanceSuite(SuiteConfig config) : config_(std::move(config)) {
    config_.validate();
    if (config_.target == nullptr) {
        throw ConfigurationError("suite has no target implementation");
    }
}

void ConformanceSuite::add_module(std::unique_ptr<CategoryModule> module) {
    if (!module) {
        throw ConfigurationError("cannot add a null category module");
    }
    if (find_module(module->category()) != nullptr) {
        throw ConfigurationError(std::string("duplicate module for category ") +
                                 to_string(module->category()));
    }
    modules_.push_back(std::move(module));
}

void ConformanceSuite::register_default_modules() {
    add_module(std::make_unique<SpecValidationModule>());
    add_module(std::make_unique<RpcCorrectnessModule>());
    add_module(std::make_unique<PerformanceModule>());
    add_module(std::make_unique<ConcurrencyModule>());
}

CategoryModule* ConformanceSuite::find_module(TestCategory category) const {
    for (const auto& module : modules_) {
        if (module->category() == category) return module.get();
    }
    return nullptr;
}

ConformanceResult ConformanceSuite::run() {
    return run(config_.target_level);
}

ConformanceResult ConformanceSuite::run(ConformanceLevel level) {
    SuiteConfig config = config_;
    config.target_level = level;

    std::vector<TestCategory> categories;
    for (TestCategory category : kCategoryOrder) {
        if (category_runs_at(category, level)) {
            categories.push_back(category);
        }
    }

    spdlog::info("Starting conformance run at level {}", to_string(level));
    ConformanceResult result = aggregate(execute(config, categories));
    spdlog::info("Conformance run finished: {}", result.summary);
    return result;
}

CategoryResult ConformanceSuite::run_category(TestCategory category) {
    RunRecord record = execute(config_, {category});
    auto warnings = record.category_warnings[category];
    return aggregate_category(category, std::move(record.results), std::move(warnings));
}

RunRecord ConformanceSuite::execute(const SuiteConfig& config,
                                    const std::vector<TestCategory>& categories) {
    RunRecord record;
    record.requested_level = config.target_level;
    record.started = std::chrono::system_clock::now();
    const auto start = Clock::now();

    ChannelOptions options;
    options.threads = config.effective_channel_threads();
    options.max_message_bytes = config.max_message_bytes;
    TestHarness harness(options);
    HarnessScope scope(harness, *config.target);

    CheckContext ctx(scope.client(), config);
    probe_plugin(ctx, record);

    for (TestCategory category : categories) {
        CategoryModule* module = find_module(category);
        if (module == nullptr) {
            spdlog::warn("No module registered for category {}", to_string(category));
            continue;
        }
        spdlog::debug("Running category {}", to_string(category));
        std::vector<TestResult> results = module->run(ctx);
        for (auto& r : results) {
            r.category = category;
            record.results.push_back(std::move(r));
        }
        if (category == TestCategory::Concurrency && !config.race_detection_active()) {
            record.category_warnings[category].push_back(kRaceDetectionInactiveWarning);
        }
    }

    record.duration = elapsed_since(start);
    return record;
}

void apply_log_level(const SuiteConfig& config) {
    spdlog::set_level(spdlog::level::from_str(config.log_level));
}

namespace {

ConformanceResult run_at(ConformanceLevel level, CostSourceService& service) {
    ConformanceSuite suite(SuiteConfig::for_level(level, &service));
    apply_log_level(suite.config());
    suite.register_default_modules();
    return suite.run();
}

}  // namespace

ConformanceResult run_basic_conformance(CostSourceService& service) {
    return run_at(ConformanceLevel::Basic, service);
}

ConformanceResult run_standard_conformance(CostSourceService& service) {
    return run_at(ConformanceLevel::Standard, service);
}

ConformanceResult run_advanced_conformance(CostSourceService& service) {
    return run_at(ConformanceLevel::Advanced, service);
}

}  // namespace costconform
