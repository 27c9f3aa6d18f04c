#pragma once

#include "auth_context.hpp"
#include "cancellation.hpp"
#include "models.hpp"
#include "retry_policy.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace dbx_provision {

struct PollOptions {
    std::chrono::milliseconds timeout{30 * 60 * 1000};
    std::chrono::milliseconds interval{15 * 1000};
};

/// Resource-kind specific: maps a status response onto OperationStatus.
/// May throw (e.g. nlohmann::json::exception) on an unexpected shape.
using StatusExtractor = std::function<StatusObservation(const ApiResponse&)>;

struct PollOutcome {
    OperationStatus status = OperationStatus::Unknown;
    std::string     lastRawStatus;
    int             checks = 0;   // logical status checks issued
};

/// Waits for an asynchronous operation to reach a terminal state.
class OperationPoller {
public:
    OperationPoller(const RetryPolicy& retry, Clock& clock, bool verbose = false);

    /// Issue status checks every options.interval until the extracted status
    /// is terminal or options.timeout elapses (-> TimedOut).
    ///
    /// @param whenMissing  if set, a not-found reply is read as this status
    ///                     instead of failing (used while awaiting deletion).
    /// @param budgetDeadline  caller's overall wall-clock limit, if any.
    /// @throws PollError{Cancelled | StatusExtractionFailed}
    /// @throws ExecutionError / RetryExhausted from a failed status check.
    PollOutcome pollUntilTerminal(const Credential& credential,
                                  const RequestBuilder& statusRequest,
                                  const StatusExtractor& extractStatus,
                                  const PollOptions& options,
                                  CallTrace& trace,
                                  const CancellationToken& cancel,
                                  std::optional<OperationStatus> whenMissing = std::nullopt,
                                  std::optional<Clock::time_point> budgetDeadline = std::nullopt) const;

private:
    const RetryPolicy& mRetry;
    Clock&             mClock;
    bool               mVerbose;
};

/// True for 404 replies and "RESOURCE_DOES_NOT_EXIST" error bodies.
bool isNotFound(const ExecutionError& error);

} // namespace dbx_provision
