#include "errors.hpp"

#include <utility>

namespace dbx_provision {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Timeout:        return "Timeout";
        case ErrorKind::NetworkError:   return "NetworkError";
        case ErrorKind::Unauthorized:   return "Unauthorized";
        case ErrorKind::RateLimited:    return "RateLimited";
        case ErrorKind::InvalidRequest: return "InvalidRequest";
        case ErrorKind::ServerError:    return "ServerError";
    }
    return "Unknown";
}

bool isClientError(ErrorKind kind) {
    return kind == ErrorKind::Unauthorized
        || kind == ErrorKind::RateLimited
        || kind == ErrorKind::InvalidRequest;
}

ErrorKind classifyStatus(unsigned int httpStatus) {
    if (httpStatus == 401 || httpStatus == 403) return ErrorKind::Unauthorized;
    if (httpStatus == 429)                      return ErrorKind::RateLimited;
    if (httpStatus >= 500 && httpStatus < 600)  return ErrorKind::ServerError;
    // Remaining 4xx, plus anything outside 2xx we do not follow (1xx/3xx).
    return ErrorKind::InvalidRequest;
}

// ---------------------------------------------------------------------------
// ExecutionError
// ---------------------------------------------------------------------------

ExecutionError::ExecutionError(ErrorKind kind, const std::string& message,
                               unsigned int httpStatus,
                               std::optional<ApiResponse> response)
    : ProvisionError(message)
    , mKind(kind)
    , mHttpStatus(httpStatus)
    , mResponse(std::move(response)) {}

std::optional<std::chrono::seconds> ExecutionError::retryAfter() const {
    if (mKind != ErrorKind::RateLimited || !mResponse) return std::nullopt;
    return mResponse->retryAfter;
}

// ---------------------------------------------------------------------------
// RetryExhausted
// ---------------------------------------------------------------------------

RetryExhausted::RetryExhausted(const ExecutionError& last, int attempts,
                               bool budgetExhausted)
    : ProvisionError((budgetExhausted ? "Wall-clock budget exhausted after "
                                      : "Max retries exceeded after ")
                     + std::to_string(attempts) + " attempt(s). Last error: "
                     + last.what())
    , mLast(last)
    , mAttempts(attempts)
    , mBudgetExhausted(budgetExhausted) {}

const char* toString(PollError::Kind kind) {
    switch (kind) {
        case PollError::Kind::Cancelled:              return "Cancelled";
        case PollError::Kind::StatusExtractionFailed: return "StatusExtractionFailed";
    }
    return "Unknown";
}

const char* toString(ProvisioningError::Kind kind) {
    switch (kind) {
        case ProvisioningError::Kind::CreateFailed:  return "CreateFailed";
        case ProvisioningError::Kind::CleanupFailed: return "CleanupFailed";
    }
    return "Unknown";
}

} // namespace dbx_provision
