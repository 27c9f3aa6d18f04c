#pragma once

#include "cancellation.hpp"
#include "models.hpp"
#include "util.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace dbx_provision {

/// Wire-level request: everything already rendered to strings.
struct RawHttpRequest {
    HttpMethod                                       method = HttpMethod::Get;
    std::string                                      target;   // path + query
    std::vector<std::pair<std::string, std::string>> headers;
    std::string                                      body;
};

struct RawHttpResponse {
    unsigned int httpStatus = 0;
    std::string  body;
    std::string  retryAfter;   // raw header value, empty when absent
};

/// Sends one request and returns whatever status line came back.
/// Implementations throw ExecutionError{NetworkError|Timeout} for
/// connection-level failures and PollError{Cancelled} when @p cancel fires.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual RawHttpResponse send(const UrlParts& endpoint,
                                 const RawHttpRequest& request,
                                 std::chrono::milliseconds timeout,
                                 const CancellationToken& cancel) = 0;
};

/// HTTP/1.1 transport built on Boost.Beast.  Each call owns its own
/// io_context, so one instance may serve concurrent orchestrations.
class BeastHttpTransport : public HttpTransport {
public:
    explicit BeastHttpTransport(bool verbose = false);

    RawHttpResponse send(const UrlParts& endpoint,
                         const RawHttpRequest& request,
                         std::chrono::milliseconds timeout,
                         const CancellationToken& cancel) override;

private:
    bool mVerbose;

    RawHttpResponse doHttpRequest(const UrlParts& endpoint,
                                  const RawHttpRequest& request,
                                  std::chrono::steady_clock::time_point deadline,
                                  const CancellationToken& cancel);
    RawHttpResponse doHttpsRequest(const UrlParts& endpoint,
                                   const RawHttpRequest& request,
                                   std::chrono::steady_clock::time_point deadline,
                                   const CancellationToken& cancel);
};

} // namespace dbx_provision
