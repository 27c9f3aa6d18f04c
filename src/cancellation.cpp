#include "cancellation.hpp"

namespace dbx_provision {

CancellationToken::CancellationToken()
    : mState(std::make_shared<State>()) {}

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mState->mutex);
        mState->cancelled = true;
    }
    mState->cv.notify_all();
}

bool CancellationToken::isCancelled() const {
    std::lock_guard<std::mutex> lock(mState->mutex);
    return mState->cancelled;
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mState->mutex);
    return mState->cv.wait_for(lock, duration, [this] { return mState->cancelled; });
}

bool SteadyClock::sleepFor(std::chrono::milliseconds duration,
                           const CancellationToken& cancel) {
    if (duration.count() <= 0) return !cancel.isCancelled();
    return !cancel.waitFor(duration);
}

std::chrono::milliseconds remainingUntil(const Clock& clock, Clock::time_point deadline) {
    const auto now = clock.now();
    if (now >= deadline) return std::chrono::milliseconds(0);
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
}

} // namespace dbx_provision
