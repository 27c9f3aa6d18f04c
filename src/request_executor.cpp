#include "request_executor.hpp"
#include "errors.hpp"
#include "mapping.hpp"
#include "util.hpp"

#include <iostream>

namespace dbx_provision {

RequestExecutor::RequestExecutor(HttpTransport& transport,
                                 std::chrono::milliseconds timeout,
                                 bool verbose)
    : mTransport(transport)
    , mTimeout(timeout)
    , mVerbose(verbose) {}

ApiResponse RequestExecutor::execute(const Credential& credential,
                                     const ApiRequest& request) const
{
    return execute(credential, request, CancellationToken(), mTimeout);
}

ApiResponse RequestExecutor::execute(const Credential& credential,
                                     const ApiRequest& request,
                                     const CancellationToken& cancel,
                                     std::chrono::milliseconds timeout) const
{
    const auto& endpoint = credential.endpoint();

    RawHttpRequest raw;
    raw.method = request.method;
    raw.target = buildTarget(endpoint.target, request.path, request.query);
    raw.headers.emplace_back("Authorization", "Bearer " + credential.token());
    raw.headers.emplace_back("Accept", "application/json");
    raw.headers.emplace_back("User-Agent", "dbx_provision/1.0");
    if (request.body) {
        raw.headers.emplace_back("Content-Type", "application/json");
        raw.body = request.body->dump();
    }

    if (mVerbose) {
        std::cerr << "[Executor] " << toString(raw.method) << " " << raw.target << "\n";
        if (!raw.body.empty()) {
            if (raw.body.size() <= 300) {
                std::cerr << "[Executor] Body: " << raw.body << "\n";
            } else {
                std::cerr << "[Executor] Body: " << raw.body.substr(0, 300)
                          << " ...(truncated)\n";
            }
        }
    }

    const RawHttpResponse reply = mTransport.send(endpoint, raw, timeout, cancel);

    ApiResponse response;
    response.httpStatus = reply.httpStatus;
    response.rawBody    = reply.body;
    response.retryAfter = parseRetryAfter(reply.retryAfter);
    if (!reply.body.empty()) {
        try {
            response.body   = nlohmann::json::parse(reply.body);
            response.parsed = true;
        } catch (const nlohmann::json::parse_error&) {
            // Keep rawBody; error pages from proxies are often HTML.
        }
    }

    if (mVerbose) {
        std::cerr << "[Executor] HTTP " << response.httpStatus << "\n";
    }

    if (response.httpStatus >= 200 && response.httpStatus < 300) {
        return response;
    }

    const ErrorKind kind = classifyStatus(response.httpStatus);
    std::string message = "HTTP " + std::to_string(response.httpStatus) + " ("
                        + toString(kind) + ") for " + toString(raw.method) + " "
                        + request.path;
    const std::string apiMessage = extractApiErrorMessage(response);
    if (!apiMessage.empty()) {
        message += ": " + apiMessage;
    }
    throw ExecutionError(kind, message, response.httpStatus, std::move(response));
}

} // namespace dbx_provision
