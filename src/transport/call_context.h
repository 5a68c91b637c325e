#pragma once
#ifndef COSTCONFORM_CALL_CONTEXT_H
#define COSTCONFORM_CALL_CONTEXT_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

namespace costconform {

using Clock = std::chrono::steady_clock;

// State shared by both ends of one call.
struct CallState {
    std::mutex mutex;
    std::condition_variable cv;
    std::atomic<bool> cancelled{false};
    std::optional<Clock::time_point> deadline;

    void cancel();
    bool deadline_passed() const;
};

// Client side of a call. One context per call; not reusable.
class ClientContext {
public:
    ClientContext();
    ClientContext(ClientContext&&) = default;
    ClientContext& operator=(ClientContext&&) = default;
    ClientContext(const ClientContext&) = delete;
    ClientContext& operator=(const ClientContext&) = delete;

    void set_timeout(std::chrono::milliseconds timeout);
    void set_deadline(Clock::time_point deadline);
    std::optional<Clock::time_point> deadline() const { return state_->deadline; }

    // Safe to call from any thread while the call is in flight.
    void try_cancel();
    bool is_cancelled() const { return state_->cancelled.load(); }

    std::shared_ptr<CallState> state() const { return state_; }

private:
    std::shared_ptr<CallState> state_;
};

// Server side view handed to the implementation.
class CallContext {
public:
    explicit CallContext(std::shared_ptr<CallState> state);

    bool is_cancelled() const;
    bool deadline_exceeded() const;
    std::optional<Clock::time_point> deadline() const { return state_->deadline; }

    // Sleeps for the given duration. Returns false early if the caller
    // cancels or the deadline passes first.
    bool wait_for(std::chrono::milliseconds duration);

private:
    std::shared_ptr<CallState> state_;
};

}  // namespace costconform

#endif  // COSTCONFORM_CALL_CONTEXT_H
