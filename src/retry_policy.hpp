#pragma once

#include "auth_context.hpp"
#include "cancellation.hpp"
#include "errors.hpp"
#include "models.hpp"
#include "request_executor.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace dbx_provision {

struct RetryOptions {
    int                       maxAttempts    = 5;
    std::chrono::milliseconds baseDelay{2000};
    std::chrono::milliseconds maxDelay{30000};
    double                    jitterFraction = 0.2;   // +/- share of the delay
};

/// Yields a sample in [-1, 1] that is scaled by RetryOptions::jitterFraction.
using JitterSource = std::function<double()>;

/// Uniform jitter from a thread-local engine.
JitterSource makeRandomJitter();

struct RetryDecision {
    bool                      retry = false;
    std::chrono::milliseconds delay{0};
    std::string               reason;
};

/// Delay before retrying after failed attempt @p attempt (1-based):
/// base * 2^(attempt-1) clamped to maxDelay, then jittered and clamped again.
std::chrono::milliseconds computeBackoffDelay(int attempt,
                                              const RetryOptions& options,
                                              double jitterSample);

/// Transient kinds: RateLimited, ServerError, NetworkError, Timeout.
bool isRetryable(ErrorKind kind);

/// Builds a fresh request for every attempt.
using RequestBuilder = std::function<ApiRequest()>;

/// Executes one logical call with bounded retries and exponential backoff.
class RetryPolicy {
public:
    RetryPolicy(const RequestExecutor& executor,
                Clock& clock,
                RetryOptions options = {},
                JitterSource jitter = makeRandomJitter(),
                bool verbose = false);

    /// Decide what to do after failed attempt @p attempt (1-based).
    RetryDecision decide(int attempt, const ExecutionError& error) const;

    /// Run @p buildRequest's request until it succeeds or the policy gives up.
    /// Every attempt is appended to @p trace.
    ///
    /// @throws ExecutionError  for permanent failures (first attempt only).
    /// @throws RetryExhausted  when maxAttempts or @p deadline is reached.
    /// @throws PollError       with kind Cancelled when @p cancel fires.
    ApiResponse execute(const Credential& credential,
                        const RequestBuilder& buildRequest,
                        CallTrace& trace,
                        const CancellationToken& cancel,
                        std::optional<Clock::time_point> deadline = std::nullopt) const;

private:
    const RequestExecutor& mExecutor;
    Clock&                 mClock;
    RetryOptions           mOptions;
    JitterSource           mJitter;
    bool                   mVerbose;
};

} // namespace dbx_provision
