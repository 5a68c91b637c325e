#pragma once
#ifndef COSTCONFORM_HARNESS_H
#define COSTCONFORM_HARNESS_H

#include <memory>
#include "contract/client.h"
#include "contract/cost_source_service.h"
#include "transport/channel.h"

namespace costconform {

// Binds one contract implementation to an in-process channel and hands out a
// connected client. A harness serves a single implementation at a time and is
// never shared between suite runs.
class TestHarness {
public:
    explicit TestHarness(ChannelOptions options = {});
    ~TestHarness();

    TestHarness(const TestHarness&) = delete;
    TestHarness& operator=(const TestHarness&) = delete;

    // Throws HarnessError if an implementation is already bound, the
    // implementation refuses the bind, or the channel cannot be opened.
    CostSourceClient& start(CostSourceService& service);
    void stop();

    bool is_started() const { return service_ != nullptr; }
    CostSourceClient& client();
    InProcessChannel* channel() { return channel_.get(); }

private:
    ChannelOptions options_;
    CostSourceService* service_ = nullptr;
    std::unique_ptr<InProcessChannel> channel_;
    std::unique_ptr<CostSourceClient> client_;
};

// Starts the harness for the lifetime of the scope.
class HarnessScope {
public:
    HarnessScope(TestHarness& harness, CostSourceService& service)
        : harness_(harness), client_(harness.start(service)) {}
    ~HarnessScope() { harness_.stop(); }

    HarnessScope(const HarnessScope&) = delete;
    HarnessScope& operator=(const HarnessScope&) = delete;

    CostSourceClient& client() { return client_; }

private:
    TestHarness& harness_;
    CostSourceClient& client_;
};

}  // namespace costconform

#endif  // COSTCONFORM_HARNESS_H
