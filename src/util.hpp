#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dbx_provision {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "8080", etc.
    std::string target;   // path component (e.g. "/" or "/proxy")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Percent-encode a query component (RFC 3986 unreserved set kept as-is).
std::string urlEncode(const std::string& value);

/// Join a base path ("/", "/proxy") with an API path and an encoded query.
std::string buildTarget(const std::string& basePath,
                        const std::string& path,
                        const std::vector<std::pair<std::string, std::string>>& query);

/// Parse a Retry-After header given in delta-seconds.
/// HTTP-date values and garbage yield std::nullopt.
std::optional<std::chrono::seconds> parseRetryAfter(const std::string& header);

std::string trim(const std::string& s);

} // namespace dbx_provision
