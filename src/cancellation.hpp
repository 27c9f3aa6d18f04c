#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace dbx_provision {

/// Shared cancellation flag.  Copies observe the same state, so the caller
/// keeps one copy and hands another to the orchestration.
class CancellationToken {
public:
    CancellationToken();

    void cancel();
    bool isCancelled() const;

    /// Block for up to @p duration.  Returns true if cancelled, in which
    /// case it returns as soon as cancel() is called.
    bool waitFor(std::chrono::milliseconds duration) const;

private:
    struct State {
        mutable std::mutex      mutex;
        std::condition_variable cv;
        bool                    cancelled = false;
    };
    std::shared_ptr<State> mState;
};

/// Time source for every suspension point (backoff, poll interval,
/// budget checks).  Tests substitute a manual clock.
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    virtual time_point now() const = 0;

    /// Sleep for @p duration unless @p cancel fires first.
    /// @return false if the sleep was cut short by cancellation.
    virtual bool sleepFor(std::chrono::milliseconds duration,
                          const CancellationToken& cancel) = 0;
};

class SteadyClock : public Clock {
public:
    time_point now() const override { return std::chrono::steady_clock::now(); }
    bool sleepFor(std::chrono::milliseconds duration,
                  const CancellationToken& cancel) override;
};

/// Milliseconds left until @p deadline, never negative.
std::chrono::milliseconds remainingUntil(const Clock& clock, Clock::time_point deadline);

} // namespace dbx_provision
