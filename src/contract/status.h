#pragma once
#ifndef COSTCONFORM_STATUS_H
#define COSTCONFORM_STATUS_H

#include <optional>
#include <string>

namespace costconform {

// Numeric values follow the gRPC status codes.
enum class StatusCode {
    Ok = 0,
    Cancelled = 1,
    Unknown = 2,
    InvalidArgument = 3,
    DeadlineExceeded = 4,
    NotFound = 5,
    ResourceExhausted = 8,
    FailedPrecondition = 9,
    Unimplemented = 12,
    Internal = 13,
    Unavailable = 14,
};

const char* status_code_name(StatusCode code);
std::optional<StatusCode> status_code_from_name(const std::string& name);

class Status {
public:
    // Handler statuses are what the implementation returned. Transport statuses
    // are produced by the channel itself: deadlines, cancellation, size limits
    // and handler faults caught at the dispatch boundary.
    enum class Origin { Handler, Transport };

    Status() = default;
    Status(StatusCode code, std::string message);

    static Status ok() { return Status(); }
    static Status transport(StatusCode code, std::string message);
    static Status recovered_fault(const std::string& what);

    bool is_ok() const { return code_ == StatusCode::Ok; }
    StatusCode code() const { return code_; }
    const std::string& message() const { return message_; }
    Origin origin() const { return origin_; }
    bool from_transport() const { return origin_ == Origin::Transport; }
    bool is_recovered_fault() const { return recovered_fault_; }

    // The caller's deadline elapsed before the handler answered.
    bool is_timeout() const {
        return from_transport() && code_ == StatusCode::DeadlineExceeded;
    }
    // The caller abandoned the call.
    bool is_cancellation() const {
        return from_transport() && code_ == StatusCode::Cancelled;
    }

    std::string to_string() const;

private:
    StatusCode code_ = StatusCode::Ok;
    std::string message_;
    Origin origin_ = Origin::Handler;
    bool recovered_fault_ = false;
};

// Outcome of a unary call as seen by the client: a status and, on success,
// the decoded response.
template <typename Response>
struct RpcResult {
    Status status;
    std::optional<Response> response;

    bool ok() const { return status.is_ok() && response.has_value(); }
};

}  // namespace costconform

#endif  // COSTCONFORM_STATUS_H
