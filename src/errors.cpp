#include "docsum/errors.h"

namespace docsum {

const char* to_string(BackendErrorKind kind) {
    switch (kind) {
        case BackendErrorKind::Timeout: return "timeout";
        case BackendErrorKind::Network: return "network error";
        case BackendErrorKind::Auth: return "authentication error";
        case BackendErrorKind::RateLimit: return "rate limited";
        case BackendErrorKind::ModelNotFound: return "model not found";
        case BackendErrorKind::Api: return "api error";
        case BackendErrorKind::InvalidResponse: return "invalid response";
    }
    return "backend error";
}

BackendError::BackendError(BackendErrorKind kind, const std::string& message, int http_status)
    : SummarizeError(std::string(to_string(kind)) + ": " + message),
      kind_(kind),
      http_status_(http_status) {}

} // namespace docsum
