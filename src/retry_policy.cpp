#include "retry_policy.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <random>
#include <utility>

namespace dbx_provision {

JitterSource makeRandomJitter() {
    return [] {
        static thread_local std::mt19937 rng{std::random_device{}()};
        std::uniform_real_distribution<double> jitter(-1.0, 1.0);
        return jitter(rng);
    };
}

std::chrono::milliseconds computeBackoffDelay(int attempt,
                                              const RetryOptions& options,
                                              double jitterSample)
{
    const double maxMs  = static_cast<double>(std::max<int64_t>(0, options.maxDelay.count()));
    const double baseMs = static_cast<double>(std::max<int64_t>(0, options.baseDelay.count()));

    // Exponential: base * 2^(attempt-1), clamped to maxDelay.
    const int exponent = std::clamp(attempt - 1, 0, 30);
    double delay = std::min(baseMs * std::ldexp(1.0, exponent), maxMs);

    // Jitter keeps concurrently retrying orchestrations from aligning.
    const double sample = std::clamp(jitterSample, -1.0, 1.0);
    delay *= 1.0 + options.jitterFraction * sample;
    delay  = std::clamp(delay, 0.0, maxMs);

    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(delay)));
}

bool isRetryable(ErrorKind kind) {
    return kind == ErrorKind::RateLimited
        || kind == ErrorKind::ServerError
        || kind == ErrorKind::NetworkError
        || kind == ErrorKind::Timeout;
}

RetryPolicy::RetryPolicy(const RequestExecutor& executor,
                         Clock& clock,
                         RetryOptions options,
                         JitterSource jitter,
                         bool verbose)
    : mExecutor(executor)
    , mClock(clock)
    , mOptions(options)
    , mJitter(std::move(jitter))
    , mVerbose(verbose) {}

RetryDecision RetryPolicy::decide(int attempt, const ExecutionError& error) const {
    RetryDecision decision;

    if (!isRetryable(error.kind())) {
        decision.reason = std::string("permanent error: ") + toString(error.kind());
        return decision;
    }
    if (attempt >= mOptions.maxAttempts) {
        decision.reason = "gave up after " + std::to_string(attempt) + " attempt(s)";
        return decision;
    }

    decision.retry  = true;
    decision.delay  = computeBackoffDelay(attempt, mOptions, mJitter ? mJitter() : 0.0);
    decision.reason = std::string("transient error: ") + toString(error.kind());

    if (auto hint = error.retryAfter()) {
        decision.delay   = std::chrono::duration_cast<std::chrono::milliseconds>(*hint);
        decision.reason += " (Retry-After)";
    }
    return decision;
}

ApiResponse RetryPolicy::execute(const Credential& credential,
                                 const RequestBuilder& buildRequest,
                                 CallTrace& trace,
                                 const CancellationToken& cancel,
                                 std::optional<Clock::time_point> deadline) const
{
    std::optional<ExecutionError> lastError;

    for (int attempt = 1; ; ++attempt) {
        if (cancel.isCancelled()) {
            throw PollError(PollError::Kind::Cancelled, "Cancelled before request");
        }

        auto timeout = mExecutor.timeout();
        if (deadline) {
            const auto remaining = remainingUntil(mClock, *deadline);
            if (remaining.count() <= 0) {
                const ExecutionError budget(ErrorKind::Timeout,
                                            "Wall-clock budget exhausted before request");
                throw RetryExhausted(lastError ? *lastError : budget, attempt - 1, true);
            }
            timeout = std::min(timeout, remaining);
        }

        const ApiRequest request = buildRequest();

        CallRecord record;
        record.method  = request.method;
        record.path    = request.path;
        record.attempt = attempt;

        try {
            ApiResponse response = mExecutor.execute(credential, request, cancel, timeout);
            record.httpStatus = response.httpStatus;
            record.outcome    = "Success";
            trace.push_back(record);
            return response;

        } catch (const ExecutionError& e) {
            record.httpStatus = e.httpStatus();
            record.outcome    = toString(e.kind());
            record.message    = e.what();
            trace.push_back(record);
            lastError = e;

            const RetryDecision decision = decide(attempt, e);
            if (!decision.retry) {
                if (!isRetryable(e.kind())) {
                    throw;
                }
                throw RetryExhausted(e, attempt);
            }

            if (deadline && mClock.now() + decision.delay > *deadline) {
                throw RetryExhausted(e, attempt, /*budgetExhausted=*/true);
            }

            if (mVerbose) {
                std::cerr << "[Retry] " << toString(request.method) << " " << request.path
                          << " " << decision.reason << " - attempt " << attempt << "/"
                          << mOptions.maxAttempts << ", backoff "
                          << decision.delay.count() << " ms\n";
            }

            if (!mClock.sleepFor(decision.delay, cancel)) {
                throw PollError(PollError::Kind::Cancelled, "Cancelled during retry backoff");
            }

        } catch (const PollError& e) {
            record.outcome = toString(e.kind());
            record.message = e.what();
            trace.push_back(record);
            throw;
        }
    }
}

} // namespace dbx_provision
