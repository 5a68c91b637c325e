#pragma once
#ifndef COSTCONFORM_CONCURRENCY_H
#define COSTCONFORM_CONCURRENCY_H

#include <functional>
#include <string>
#include <vector>
#include "conformance/category_module.h"
#include "conformance/validators.h"

namespace costconform {

struct CallOutcome {
    Status status;
    // Encoded response, empty when the call failed.
    std::string payload;
    std::vector<ValidationError> findings;
};

enum class ProbeState { Idle, Dispatching, Collecting, Verified, Failed };

const char* to_string(ProbeState state);

// Fires N identical calls at once and judges the collected responses.
//
//   Idle -> Dispatching -> Collecting -> Verified | Failed
//
// All callers are released together by a start gate; no ordering between
// them is imposed. dispatch() returns once every call has returned or timed
// out.
class FanOutProbe {
public:
    using Call = std::function<CallOutcome(ClientContext&)>;

    FanOutProbe(int fan_out, Call call, std::function<ClientContext()> make_context);

    void dispatch();
    // Deterministic methods must answer byte-identical responses; others only
    // need each response to be well formed.
    ProbeState verify(bool deterministic);

    ProbeState state() const { return state_; }
    const std::vector<CallOutcome>& outcomes() const { return outcomes_; }
    const std::string& failure() const { return failure_; }
    // Set when the first failed call hit the transport deadline or was cancelled.
    const Status& failing_status() const { return failing_status_; }
    int distinct_responses() const;

private:
    int fan_out_;
    Call call_;
    std::function<ClientContext()> make_context_;
    ProbeState state_ = ProbeState::Idle;
    std::vector<CallOutcome> outcomes_;
    std::string failure_;
    Status failing_status_;
};

bool is_deterministic_method(Method method);

// Probes every method under parallel load. Results carry a warning when the
// build has no race detector, since a clean run then proves little.
class ConcurrencyModule : public CategoryModule {
public:
    TestCategory category() const override { return TestCategory::Concurrency; }
    std::vector<TestResult> run(CheckContext& ctx) override;
};

extern const char* const kRaceDetectionInactiveWarning;

}  // namespace costconform

#endif  // COSTCONFORM_CONCURRENCY_H
