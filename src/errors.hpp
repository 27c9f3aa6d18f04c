#pragma once

#include "models.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

namespace dbx_provision {

/// Root of every error raised by the provisioning client.
class ProvisionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Missing or malformed endpoint / token.  Never retried.
class ConfigurationError : public ProvisionError {
public:
    using ProvisionError::ProvisionError;
};

enum class ErrorKind {
    Timeout,
    NetworkError,
    Unauthorized,
    RateLimited,
    InvalidRequest,
    ServerError,
};

const char* toString(ErrorKind kind);

/// True for 4xx-derived kinds.
bool isClientError(ErrorKind kind);

/// Map a non-2xx HTTP status onto the error taxonomy.
ErrorKind classifyStatus(unsigned int httpStatus);

/// Failure of a single HTTP attempt.
class ExecutionError : public ProvisionError {
public:
    ExecutionError(ErrorKind kind, const std::string& message,
                   unsigned int httpStatus = 0,
                   std::optional<ApiResponse> response = std::nullopt);

    ErrorKind                         kind() const { return mKind; }
    unsigned int                      httpStatus() const { return mHttpStatus; }
    const std::optional<ApiResponse>& response() const { return mResponse; }

    /// Server-supplied delay hint, only meaningful for RateLimited.
    std::optional<std::chrono::seconds> retryAfter() const;

private:
    ErrorKind                  mKind;
    unsigned int               mHttpStatus;
    std::optional<ApiResponse> mResponse;
};

/// The retry loop gave up; wraps the last attempt's error.
class RetryExhausted : public ProvisionError {
public:
    RetryExhausted(const ExecutionError& last, int attempts,
                   bool budgetExhausted = false);

    const ExecutionError& lastError() const { return mLast; }
    int                   attempts() const { return mAttempts; }
    bool                  budgetExhausted() const { return mBudgetExhausted; }

private:
    ExecutionError mLast;
    int            mAttempts;
    bool           mBudgetExhausted;
};

class PollError : public ProvisionError {
public:
    enum class Kind { Cancelled, StatusExtractionFailed };

    PollError(Kind kind, const std::string& message)
        : ProvisionError(message), mKind(kind) {}

    Kind kind() const { return mKind; }

private:
    Kind mKind;
};

const char* toString(PollError::Kind kind);

class ProvisioningError : public ProvisionError {
public:
    enum class Kind { CreateFailed, CleanupFailed };

    ProvisioningError(Kind kind, const std::string& message)
        : ProvisionError(message), mKind(kind) {}

    Kind kind() const { return mKind; }

private:
    Kind mKind;
};

const char* toString(ProvisioningError::Kind kind);

} // namespace dbx_provision
