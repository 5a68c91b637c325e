#pragma once
#ifndef COSTCONFORM_CHANNEL_H
#define COSTCONFORM_CHANNEL_H

#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include "contract/messages.h"
#include "contract/status.h"
#include "transport/call_context.h"

namespace costconform {

struct ChannelOptions {
    size_t threads = 4;
    size_t max_message_bytes = 4 * 1024 * 1024;  // 4MB
};

// Server-side entry point for one method, operating on encoded payloads.
using UnaryHandler =
    std::function<Status(CallContext& ctx, const std::string& request, std::string& response)>;

// In-memory client/server channel. Calls are posted to an io_context served by
// a pool of worker threads; the calling thread blocks until the handler
// answers, the deadline passes or the call is cancelled.
class InProcessChannel {
public:
    explicit InProcessChannel(ChannelOptions options);
    ~InProcessChannel();

    InProcessChannel(const InProcessChannel&) = delete;
    InProcessChannel& operator=(const InProcessChannel&) = delete;

    // Handlers can only be registered while the channel is closed.
    void register_method(Method method, UnaryHandler handler);

    void open();
    // Stops accepting calls and joins the workers once queued calls finish.
    // Must not race with in-flight calls.
    void close();
    bool is_open() const { return open_.load(); }

    Status unary_call(Method method, ClientContext& ctx, const std::string& request,
                      std::string& response);

    size_t in_flight() const { return in_flight_.load(); }
    const ChannelOptions& options() const { return options_; }

private:
    struct Exchange {
        bool done = false;
        Status status;
        std::string response;
    };

    ChannelOptions options_;
    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
        work_guard_;
    std::vector<std::thread> worker_threads_;
    std::map<Method, UnaryHandler> handlers_;
    std::atomic<bool> open_{false};
    std::atomic<size_t> in_flight_{0};

    void run_workers(size_t thread_count);
    void dispatch(const UnaryHandler& handler, Method method, std::shared_ptr<CallState> state,
                  std::shared_ptr<Exchange> exchange, std::string request);
};

}  // namespace costconform

#endif  // COSTCONFORM_CHANNEL_H
