#include "transport/harness.h"

#include <spdlog/spdlog.h>
#include "common/errors.h"
#include "transport/service_binding.h"

namespace costconform {

TestHarness::TestHarness(ChannelOptions options) : options_(options) {}

TestHarness::~TestHarness() {
    stop();
}

CostSourceClient& TestHarness::start(CostSourceService& service) {
    if (service_ != nullptr) {
        spdlog::error("Harness start refused: an implementation is already bound");
        throw HarnessError("an implementation is already bound to this harness");
    }

    try {
        service.on_bind();
    } catch (const HarnessError& e) {
        spdlog::error("Implementation refused to bind: {}", e.what());
        throw;
    } catch (const std::exception& e) {
        spdlog::error("Implementation refused to bind: {}", e.what());
        throw HarnessError(std::string("implementation refused to bind: ") + e.what());
    }

    try {
        auto channel = std::make_unique<InProcessChannel>(options_);
        bind_service(*channel, service);
        channel->open();
        channel_ = std::move(channel);
    } catch (const HarnessError& e) {
        spdlog::error("Failed to establish in-process channel: {}", e.what());
        service.on_release();
        throw;
    }

    client_ = std::make_unique<CostSourceClient>(*channel_);
    service_ = &service;
    spdlog::info("Harness started ({} workers)", options_.threads);
    return *client_;
}

void TestHarness::stop() {
    if (service_ == nullptr) {
        return;
    }
    client_.reset();
    channel_->close();
    channel_.reset();
    service_->on_release();
    service_ = nullptr;
    spdlog::info("Harness stopped");
}

CostSourceClient& TestHarness::client() {
    if (!client_) {
        throw HarnessError("harness is not started");
    }
    return *client_;
}

}  // namespace costconform
