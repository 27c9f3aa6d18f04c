#include "poller.hpp"
#include "errors.hpp"
#include "mapping.hpp"

#include <algorithm>
#include <iostream>

namespace dbx_provision {

bool isNotFound(const ExecutionError& error) {
    if (error.kind() != ErrorKind::InvalidRequest) return false;
    if (error.httpStatus() == 404) return true;
    if (!error.response()) return false;

    const std::string code = extractApiErrorCode(*error.response());
    if (code == "RESOURCE_DOES_NOT_EXIST" || code == "NOT_FOUND") return true;

    // jobs/get answers a deleted job with 400 INVALID_PARAMETER_VALUE.
    const std::string message = extractApiErrorMessage(*error.response());
    return message.find("does not exist") != std::string::npos;
}

OperationPoller::OperationPoller(const RetryPolicy& retry, Clock& clock, bool verbose)
    : mRetry(retry)
    , mClock(clock)
    , mVerbose(verbose) {}

PollOutcome OperationPoller::pollUntilTerminal(const Credential& credential,
                                               const RequestBuilder& statusRequest,
                                               const StatusExtractor& extractStatus,
                                               const PollOptions& options,
                                               CallTrace& trace,
                                               const CancellationToken& cancel,
                                               std::optional<OperationStatus> whenMissing,
                                               std::optional<Clock::time_point> budgetDeadline) const
{
    Clock::time_point deadline = mClock.now() + options.timeout;
    if (budgetDeadline && *budgetDeadline < deadline) {
        deadline = *budgetDeadline;
    }

    PollOutcome outcome;

    for (;;) {
        if (cancel.isCancelled()) {
            throw PollError(PollError::Kind::Cancelled, "Cancelled before status check");
        }
        if (mClock.now() >= deadline) {
            outcome.status = OperationStatus::TimedOut;
            return outcome;
        }

        StatusObservation observation;
        ++outcome.checks;

        try {
            const ApiResponse response =
                mRetry.execute(credential, statusRequest, trace, cancel, deadline);
            try {
                observation = extractStatus(response);
            } catch (const std::exception& e) {
                throw PollError(PollError::Kind::StatusExtractionFailed,
                                std::string("Unable to extract status: ") + e.what());
            }
        } catch (const RetryExhausted& e) {
            if (!e.budgetExhausted()) throw;
            // Status checks were still failing when time ran out.
            outcome.status = OperationStatus::TimedOut;
            return outcome;
        } catch (const ExecutionError& e) {
            if (!whenMissing || !isNotFound(e)) throw;
            observation.status    = *whenMissing;
            observation.rawStatus = "RESOURCE_DOES_NOT_EXIST";
        }

        outcome.status        = observation.status;
        outcome.lastRawStatus = observation.rawStatus;

        if (mVerbose) {
            std::cerr << "[Poller] check " << outcome.checks << ": "
                      << observation.rawStatus << " -> " << toString(observation.status) << "\n";
        }

        if (isTerminal(observation.status)) {
            return outcome;
        }

        const auto remaining = remainingUntil(mClock, deadline);
        if (remaining.count() <= 0) {
            outcome.status = OperationStatus::TimedOut;
            return outcome;
        }
        if (cancel.isCancelled()) {
            throw PollError(PollError::Kind::Cancelled, "Cancelled before poll interval");
        }
        if (!mClock.sleepFor(std::min(options.interval, remaining), cancel)) {
            throw PollError(PollError::Kind::Cancelled, "Cancelled during poll interval");
        }
    }
}

} // namespace dbx_provision
