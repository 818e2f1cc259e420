#pragma once
#include <stdexcept>
#include <string>

namespace sockreap {

enum class ErrorKind {
    CollectionFailed,
    NotFound,
    PermissionDenied,
    ProcessVanished,
    SignalDeliveryFailed,
    ProtectedTarget,
    NotConfirmed,
    InvalidArgument
};

const char* to_string(ErrorKind kind);

// Request-level failure. Per-PID termination failures are reported in
// TerminationOutcome instead of being thrown.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}
    ErrorKind kind() const { return kind_; }
private:
    ErrorKind kind_;
};

// "<what>: <strerror(err)> (errno=N)"
std::string errno_message(const std::string& what, int err);

}
