#include "transport/channel.h"

#include <system_error>
#include <utility>
#include <spdlog/spdlog.h>
#include "common/errors.h"

namespace costconform {

InProcessChannel::InProcessChannel(ChannelOptions options) : options_(options) {
    if (options_.threads == 0) {
        throw HarnessError("channel needs at least one worker thread");
    }
}

InProcessChannel::~InProcessChannel() {
    close();
}

void InProcessChannel::register_method(Method method, UnaryHandler handler) {
    if (open_.load()) {
        throw HarnessError(std::string("cannot register ") + method_name(method) +
                           " on an open channel");
    }
    handlers_[method] = std::move(handler);
}

void InProcessChannel::open() {
    if (open_.exchange(true)) {
        throw HarnessError("channel already open");
    }
    io_context_.restart();
    work_guard_.emplace(boost::asio::make_work_guard(io_context_));
    try {
        run_workers(options_.threads);
    } catch (const std::system_error& e) {
        close();
        throw HarnessError(std::string("failed to start channel workers: ") + e.what());
    }
    spdlog::debug("In-process channel open with {} workers, {} methods", options_.threads,
                  handlers_.size());
}

void InProcessChannel::close() {
    open_.store(false);
    if (work_guard_) {
        work_guard_->reset();
        work_guard_.reset();
    }
    for (auto& t : worker_threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    worker_threads_.clear();
}

void InProcessChannel::run_workers(size_t thread_count) {
    for (size_t i = 0; i < thread_count; ++i) {
        worker_threads_.emplace_back([this]() {
            io_context_.run();
        });
    }
}

Status InProcessChannel::unary_call(Method method, ClientContext& ctx, const std::string& request,
                                    std::string& response) {
    if (!open_.load()) {
        return Status::transport(StatusCode::Unavailable, "channel is not open");
    }
    if (request.size() > options_.max_message_bytes) {
        return Status::transport(StatusCode::ResourceExhausted,
                                 "request of " + std::to_string(request.size()) +
                                     " bytes exceeds limit of " +
                                     std::to_string(options_.max_message_bytes));
    }
    auto state = ctx.state();
    if (state->cancelled.load()) {
        return Status::transport(StatusCode::Cancelled, "call cancelled before dispatch");
    }
    if (state->deadline_passed()) {
        return Status::transport(StatusCode::DeadlineExceeded, "deadline passed before dispatch");
    }

    auto it = handlers_.find(method);
    if (it == handlers_.end()) {
        return Status::transport(StatusCode::Unimplemented,
                                 std::string("no handler registered for ") + method_name(method));
    }

    auto exchange = std::make_shared<Exchange>();
    in_flight_.fetch_add(1);
    boost::asio::post(io_context_, [this, handler = &it->second, method, state, exchange,
                                    payload = request]() mutable {
        dispatch(*handler, method, std::move(state), std::move(exchange), std::move(payload));
    });

    std::unique_lock lock(state->mutex);
    auto finished = [&] { return exchange->done || state->cancelled.load(); };
    if (state->deadline) {
        state->cv.wait_until(lock, *state->deadline, finished);
    } else {
        state->cv.wait(lock, finished);
    }

    if (exchange->done) {
        // A handler that gave up because the caller's deadline or cancellation
        // reached it answers at the same moment the caller wakes. The caller's
        // state decides the outcome so it is reported from the transport.
        const Status& answered = exchange->status;
        if (!answered.from_transport() &&
            (answered.code() == StatusCode::DeadlineExceeded ||
             answered.code() == StatusCode::Cancelled)) {
            if (state->cancelled.load()) {
                return Status::transport(StatusCode::Cancelled,
                                         std::string(method_name(method)) + " cancelled by caller");
            }
            if (state->deadline_passed()) {
                return Status::transport(StatusCode::DeadlineExceeded,
                                         std::string(method_name(method)) +
                                             " exceeded its deadline");
            }
        }
        response = std::move(exchange->response);
        return exchange->status;
    }
    if (state->cancelled.load()) {
        return Status::transport(StatusCode::Cancelled,
                                 std::string(method_name(method)) + " cancelled by caller");
    }
    // Deadline elapsed: tell the handler the caller is gone.
    state->cancelled.store(true);
    lock.unlock();
    state->cv.notify_all();
    return Status::transport(StatusCode::DeadlineExceeded,
                             std::string(method_name(method)) + " exceeded its deadline");
}

void InProcessChannel::dispatch(const UnaryHandler& handler, Method method,
                                std::shared_ptr<CallState> state,
                                std::shared_ptr<Exchange> exchange, std::string request) {
    CallContext server_ctx(state);
    std::string out;
    Status status;
    try {
        status = handler(server_ctx, request, out);
    } catch (const std::exception& e) {
        spdlog::warn("Recovered fault in {} handler: {}", method_name(method), e.what());
        status = Status::recovered_fault(e.what());
    } catch (...) {
        spdlog::warn("Recovered fault in {} handler: unknown exception", method_name(method));
        status = Status::recovered_fault("unknown exception");
    }

    if (status.is_ok() && out.size() > options_.max_message_bytes) {
        status = Status::transport(StatusCode::ResourceExhausted,
                                   "response of " + std::to_string(out.size()) +
                                       " bytes exceeds limit of " +
                                       std::to_string(options_.max_message_bytes));
        out.clear();
    }

    {
        std::lock_guard lock(state->mutex);
        exchange->status = std::move(status);
        exchange->response = std::move(out);
        exchange->done = true;
    }
    state->cv.notify_all();
    in_flight_.fetch_sub(1);
}

}  // namespace costconform
