#pragma once

#include <stdexcept>
#include <string>

namespace docsum {

// Base class for pipeline-level failures.
class SummarizeError : public std::runtime_error {
public:
    explicit SummarizeError(const std::string& message)
        : std::runtime_error(message) {}
};

enum class BackendErrorKind {
    Timeout,
    Network,
    Auth,
    RateLimit,
    ModelNotFound,
    Api,
    InvalidResponse
};

const char* to_string(BackendErrorKind kind);

// A generation call failed. Never retried inside the pipeline.
class BackendError : public SummarizeError {
public:
    BackendError(BackendErrorKind kind, const std::string& message, int http_status = 0);

    BackendErrorKind kind() const { return kind_; }
    int http_status() const { return http_status_; }

private:
    BackendErrorKind kind_;
    int http_status_;
};

// The caller's cancellation signal (or a sibling chunk failure) stopped the call.
class CancelledError : public SummarizeError {
public:
    explicit CancelledError(const std::string& message = "operation cancelled")
        : SummarizeError(message) {}
};

} // namespace docsum
