#pragma once

#include "util.hpp"

#include <string>

namespace dbx_provision {

/// Raw configuration as handed over by the caller.
struct AuthConfig {
    std::string token;
    std::string baseUrl;   // e.g. "https://adb-123.azuredatabricks.net"
};

/// Validated, read-only bearer credential plus target endpoint.
/// Safe to share between concurrent orchestrations.
class Credential {
public:
    const std::string& token() const { return mToken; }
    const std::string& baseUrl() const { return mBaseUrl; }
    const UrlParts&    endpoint() const { return mEndpoint; }

private:
    friend Credential makeCredential(const AuthConfig& config);

    Credential(std::string token, std::string baseUrl, UrlParts endpoint);

    const std::string mToken;
    const std::string mBaseUrl;
    const UrlParts    mEndpoint;
};

/// Validate @p config locally (no network).
/// @throws ConfigurationError when the token or URL is missing or malformed.
Credential makeCredential(const AuthConfig& config);

} // namespace dbx_provision
