#include "auth_context.hpp"
#include "errors.hpp"

#include <stdexcept>
#include <utility>

namespace dbx_provision {

Credential::Credential(std::string token, std::string baseUrl, UrlParts endpoint)
    : mToken(std::move(token))
    , mBaseUrl(std::move(baseUrl))
    , mEndpoint(std::move(endpoint)) {}

Credential makeCredential(const AuthConfig& config) {
    const std::string token = trim(config.token);
    const std::string url   = trim(config.baseUrl);

    if (url.empty()) {
        throw ConfigurationError("Missing endpoint base URL");
    }
    if (token.empty()) {
        throw ConfigurationError("Missing bearer token");
    }

    UrlParts endpoint;
    try {
        endpoint = parseUrl(url);
    } catch (const std::invalid_argument& e) {
        throw ConfigurationError(std::string("Malformed endpoint URL: ") + e.what());
    }

    return Credential(token, url, std::move(endpoint));
}

} // namespace dbx_provision
