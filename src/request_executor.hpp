#pragma once

#include "auth_context.hpp"
#include "cancellation.hpp"
#include "http_transport.hpp"
#include "models.hpp"

#include <chrono>

namespace dbx_provision {

/// Turns an ApiRequest into one authenticated HTTP exchange and classifies
/// the outcome.  Holds no per-call state.
class RequestExecutor {
public:
    static constexpr std::chrono::milliseconds kDefaultTimeout{30000};

    /// @param transport  Wire layer; must outlive the executor.
    /// @param timeout    Default per-attempt timeout.
    explicit RequestExecutor(HttpTransport& transport,
                             std::chrono::milliseconds timeout = kDefaultTimeout,
                             bool verbose = false);

    /// Execute with the default timeout and no cancellation.
    ApiResponse execute(const Credential& credential, const ApiRequest& request) const;

    /// @return the response for a 2xx status.
    /// @throws ExecutionError for any other status or a connection failure.
    /// @throws PollError{Cancelled} when @p cancel fires mid-request.
    ApiResponse execute(const Credential& credential,
                        const ApiRequest& request,
                        const CancellationToken& cancel,
                        std::chrono::milliseconds timeout) const;

    std::chrono::milliseconds timeout() const { return mTimeout; }

private:
    HttpTransport&            mTransport;
    std::chrono::milliseconds mTimeout;
    bool                      mVerbose;
};

} // namespace dbx_provision
