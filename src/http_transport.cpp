#include "http_transport.hpp"
#include "errors.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

#ifdef DBX_PROVISION_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <iostream>
#include <stdexcept>
#include <utility>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace dbx_provision {

namespace {

using Deadline = std::chrono::steady_clock::time_point;

// Granularity at which a blocked network step notices cancellation.
constexpr auto kCancelCheckInterval = std::chrono::milliseconds(50);

/// Run @p ioc until the asynchronous step launched by @p start completes.
/// @p abort is invoked once when @p cancel fires or @p deadline passes; the
/// aborted handler still runs before this returns.
template <class Start, class Abort>
void awaitStep(net::io_context& ioc, const char* step, Deadline deadline,
               const CancellationToken& cancel, Start&& start, Abort&& abort)
{
    beast::error_code result;
    bool done      = false;
    bool cancelled = false;
    bool expired   = false;

    ioc.restart();
    start([&result, &done](beast::error_code ec) {
        result = ec;
        done   = true;
    });

    while (!done) {
        if (!cancelled && !expired) {
            if (cancel.isCancelled()) {
                cancelled = true;
                abort();
            } else if (std::chrono::steady_clock::now() >= deadline) {
                expired = true;
                abort();
            }
        }
        ioc.run_one_for(kCancelCheckInterval);
    }

    if (cancelled) {
        throw PollError(PollError::Kind::Cancelled,
                        std::string("Cancelled during ") + step);
    }
    if (expired || result == beast::error::timeout) {
        throw ExecutionError(ErrorKind::Timeout,
                             std::string("Timed out during ") + step);
    }
    if (result) {
        throw ExecutionError(ErrorKind::NetworkError,
                             std::string(step) + " failed: " + result.message());
    }
}

http::request<http::string_body>
makeBeastRequest(const UrlParts& endpoint, const RawHttpRequest& request)
{
    http::request<http::string_body> req{
        request.method == HttpMethod::Post ? http::verb::post : http::verb::get,
        request.target, 11};
    req.set(http::field::host, endpoint.host);
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    if (!request.body.empty()) {
        req.body() = request.body;
    }
    req.prepare_payload();
    return req;
}

RawHttpResponse toRawResponse(const http::response<http::string_body>& res)
{
    RawHttpResponse out;
    out.httpStatus = res.result_int();
    out.body       = res.body();
    const auto retryAfter = res[http::field::retry_after];
    out.retryAfter.assign(retryAfter.data(), retryAfter.size());
    return out;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

BeastHttpTransport::BeastHttpTransport(bool verbose)
    : mVerbose(verbose) {}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

RawHttpResponse BeastHttpTransport::send(const UrlParts& endpoint,
                                         const RawHttpRequest& request,
                                         std::chrono::milliseconds timeout,
                                         const CancellationToken& cancel)
{
    if (cancel.isCancelled()) {
        throw PollError(PollError::Kind::Cancelled, "Cancelled before request");
    }

    const Deadline deadline = std::chrono::steady_clock::now() + timeout;

    if (mVerbose) {
        std::cerr << "[Transport] " << toString(request.method) << " "
                  << endpoint.scheme << "://" << endpoint.host << ":"
                  << endpoint.port << request.target << "\n";
    }

    return endpoint.scheme == "https"
        ? doHttpsRequest(endpoint, request, deadline, cancel)
        : doHttpRequest(endpoint, request, deadline, cancel);
}

// ---------------------------------------------------------------------------
// Plain HTTP
// ---------------------------------------------------------------------------

RawHttpResponse BeastHttpTransport::doHttpRequest(const UrlParts& endpoint,
                                                  const RawHttpRequest& request,
                                                  Deadline deadline,
                                                  const CancellationToken& cancel)
{
    net::io_context   ioc;
    tcp::resolver     resolver(ioc);
    beast::tcp_stream stream(ioc);

    auto abort = [&resolver, &stream] {
        resolver.cancel();
        stream.cancel();
    };

    tcp::resolver::results_type results;
    awaitStep(ioc, "resolve", deadline, cancel, [&](auto done) {
        resolver.async_resolve(endpoint.host, endpoint.port,
            [&results, done](beast::error_code ec, tcp::resolver::results_type r) {
                results = std::move(r);
                done(ec);
            });
    }, abort);

    stream.expires_at(deadline);
    awaitStep(ioc, "connect", deadline, cancel, [&](auto done) {
        stream.async_connect(results,
            [done](beast::error_code ec, const tcp::endpoint&) { done(ec); });
    }, abort);

    auto req = makeBeastRequest(endpoint, request);
    awaitStep(ioc, "write", deadline, cancel, [&](auto done) {
        http::async_write(stream, req,
            [done](beast::error_code ec, std::size_t) { done(ec); });
    }, abort);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    awaitStep(ioc, "read", deadline, cancel, [&](auto done) {
        http::async_read(stream, buffer, res,
            [done](beast::error_code ec, std::size_t) { done(ec); });
    }, abort);

    if (mVerbose) {
        std::cerr << "[Transport] HTTP " << res.result_int() << "\n";
    }

    // Graceful shutdown (non-critical errors are swallowed).
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    return toRawResponse(res);
}

// ---------------------------------------------------------------------------
// HTTPS (compiled only when OpenSSL is available)
// ---------------------------------------------------------------------------

RawHttpResponse BeastHttpTransport::doHttpsRequest(const UrlParts& endpoint,
                                                   const RawHttpRequest& request,
                                                   Deadline deadline,
                                                   const CancellationToken& cancel)
{
#ifdef DBX_PROVISION_HAS_SSL
    namespace ssl = net::ssl;

    net::io_context ioc;
    ssl::context    ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
    stream.set_verify_callback(ssl::host_name_verification(endpoint.host));

    // SNI hostname.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint.host.c_str())) {
        throw ExecutionError(ErrorKind::NetworkError, "Failed to set SNI hostname");
    }

    auto abort = [&resolver, &stream] {
        resolver.cancel();
        beast::get_lowest_layer(stream).cancel();
    };

    tcp::resolver::results_type results;
    awaitStep(ioc, "resolve", deadline, cancel, [&](auto done) {
        resolver.async_resolve(endpoint.host, endpoint.port,
            [&results, done](beast::error_code ec, tcp::resolver::results_type r) {
                results = std::move(r);
                done(ec);
            });
    }, abort);

    beast::get_lowest_layer(stream).expires_at(deadline);
    awaitStep(ioc, "connect", deadline, cancel, [&](auto done) {
        beast::get_lowest_layer(stream).async_connect(results,
            [done](beast::error_code ec, const tcp::endpoint&) { done(ec); });
    }, abort);

    awaitStep(ioc, "TLS handshake", deadline, cancel, [&](auto done) {
        stream.async_handshake(ssl::stream_base::client,
            [done](beast::error_code ec) { done(ec); });
    }, abort);

    auto req = makeBeastRequest(endpoint, request);
    awaitStep(ioc, "write", deadline, cancel, [&](auto done) {
        http::async_write(stream, req,
            [done](beast::error_code ec, std::size_t) { done(ec); });
    }, abort);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    awaitStep(ioc, "read", deadline, cancel, [&](auto done) {
        http::async_read(stream, buffer, res,
            [done](beast::error_code ec, std::size_t) { done(ec); });
    }, abort);

    if (mVerbose) {
        std::cerr << "[Transport] HTTPS " << res.result_int() << "\n";
    }

    // Skip close_notify; the response is complete and the socket is ours.
    beast::error_code ec;
    beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ec);

    return toRawResponse(res);
#else
    (void)endpoint;
    (void)request;
    (void)deadline;
    (void)cancel;
    throw ConfigurationError("HTTPS endpoint requested but dbx_provision was "
                             "built without OpenSSL");
#endif
}

} // namespace dbx_provision
