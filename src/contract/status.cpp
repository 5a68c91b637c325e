#include "contract/status.h"

#include <array>
#include <utility>

namespace costconform {

namespace {

const std::array<std::pair<StatusCode, const char*>, 11> kCodeNames = {{
    {StatusCode::Ok, "OK"},
    {StatusCode::Cancelled, "CANCELLED"},
    {StatusCode::Unknown, "UNKNOWN"},
    {StatusCode::InvalidArgument, "INVALID_ARGUMENT"},
    {StatusCode::DeadlineExceeded, "DEADLINE_EXCEEDED"},
    {StatusCode::NotFound, "NOT_FOUND"},
    {StatusCode::ResourceExhausted, "RESOURCE_EXHAUSTED"},
    {StatusCode::FailedPrecondition, "FAILED_PRECONDITION"},
    {StatusCode::Unimplemented, "UNIMPLEMENTED"},
    {StatusCode::Internal, "INTERNAL"},
    {StatusCode::Unavailable, "UNAVAILABLE"},
}};

}  // namespace

const char* status_code_name(StatusCode code) {
    for (const auto& [value, name] : kCodeNames) {
        if (value == code) return name;
    }
    return "UNKNOWN";
}

std::optional<StatusCode> status_code_from_name(const std::string& name) {
    for (const auto& [value, text] : kCodeNames) {
        if (name == text) return value;
    }
    return std::nullopt;
}

Status::Status(StatusCode code, std::string message)
    : code_(code), message_(std::move(message)) {}

Status Status::transport(StatusCode code, std::string message) {
    Status status(code, std::move(message));
    status.origin_ = Origin::Transport;
    return status;
}

Status Status::recovered_fault(const std::string& what) {
    Status status = transport(StatusCode::Internal, "handler panicked: " + what);
    status.recovered_fault_ = true;
    return status;
}

std::string Status::to_string() const {
    if (is_ok()) return "OK";
    std::string out = status_code_name(code_);
    if (!message_.empty()) {
        out += ": " + message_;
    }
    if (from_transport()) {
        out += " (transport)";
    }
    return out;
}

}  // namespace costconform
