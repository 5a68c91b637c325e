#include "transport/call_context.h"

#include <utility>

namespace costconform {

void CallState::cancel() {
    {
        std::lock_guard lock(mutex);
        cancelled.store(true);
    }
    cv.notify_all();
}

bool CallState::deadline_passed() const {
    return deadline && Clock::now() >= *deadline;
}

ClientContext::ClientContext() : state_(std::make_shared<CallState>()) {}

void ClientContext::set_timeout(std::chrono::milliseconds timeout) {
    state_->deadline = Clock::now() + timeout;
}

void ClientContext::set_deadline(Clock::time_point deadline) {
    state_->deadline = deadline;
}

void ClientContext::try_cancel() {
    state_->cancel();
}

CallContext::CallContext(std::shared_ptr<CallState> state) : state_(std::move(state)) {}

bool CallContext::is_cancelled() const {
    return state_->cancelled.load();
}

bool CallContext::deadline_exceeded() const {
    return state_->deadline_passed();
}

bool CallContext::wait_for(std::chrono::milliseconds duration) {
    auto until = Clock::now() + duration;
    if (state_->deadline && *state_->deadline < until) {
        until = *state_->deadline;
    }
    std::unique_lock lock(state_->mutex);
    state_->cv.wait_until(lock, until, [this] { return state_->cancelled.load(); });
    return !state_->cancelled.load() && !state_->deadline_passed();
}

}  // namespace costconform
