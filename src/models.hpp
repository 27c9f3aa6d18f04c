#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dbx_provision {

enum class HttpMethod { Get, Post };

const char* toString(HttpMethod method);

/// One REST call, built fresh for every attempt.
struct ApiRequest {
    HttpMethod                                       method = HttpMethod::Get;
    std::string                                      path;    // relative, e.g. "/api/2.0/clusters/get"
    std::optional<nlohmann::json>                    body;
    std::vector<std::pair<std::string, std::string>> query;
};

struct ApiResponse {
    unsigned int   httpStatus = 0;
    nlohmann::json body;              // null when the payload was not JSON
    std::string    rawBody;
    bool           parsed = false;
    std::optional<std::chrono::seconds> retryAfter;
};

enum class OperationStatus { Pending, Running, Succeeded, Failed, TimedOut, Unknown };

const char* toString(OperationStatus status);

inline bool isTerminal(OperationStatus status) {
    return status == OperationStatus::Succeeded
        || status == OperationStatus::Failed
        || status == OperationStatus::TimedOut;
}

/// Normalized status plus the resource's own state string (e.g. "ERROR").
struct StatusObservation {
    OperationStatus status = OperationStatus::Unknown;
    std::string     rawStatus;
};

/// Diagnostic entry for one HTTP attempt.
struct CallRecord {
    HttpMethod   method = HttpMethod::Get;
    std::string  path;
    int          attempt    = 1;   // 1-based, within its logical call
    unsigned int httpStatus = 0;   // 0 when no status line was received
    std::string  outcome;          // "Success" or an error kind name
    std::string  message;
};

using CallTrace = std::vector<CallRecord>;

struct ErrorDetail {
    std::string  category;             // "ExecutionError", "RetryExhausted", ...
    std::string  kind;                 // "Unauthorized", "Cancelled", ...
    std::string  message;
    unsigned int lastHttpStatus = 0;
    std::string  lastObservedStatus;
    int          attempts = 0;
};

/// The single record returned by every orchestration run.
struct ProvisionResult {
    std::string                resourceKind;
    std::string                operation;
    std::string                resourceId;
    OperationStatus            status = OperationStatus::Unknown;
    bool                       reusedExisting = false;
    CallTrace                  calls;
    std::optional<ErrorDetail> error;
    std::optional<std::string> cleanupError;
};

/// A resource found by an idempotency lookup.
struct ExistingResource {
    std::string     id;
    OperationStatus status = OperationStatus::Unknown;
    std::string     rawStatus;
};

} // namespace dbx_provision
