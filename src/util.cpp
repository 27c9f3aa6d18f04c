#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace dbx_provision {

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);
    std::transform(parts.scheme.begin(), parts.scheme.end(), parts.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Invalid URL (unsupported scheme): " + url);
    }

    // --- authority (host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find_first_of("/?#", hostStart);

    std::string authority;
    if (pathStart == std::string::npos) {
        authority    = url.substr(hostStart);
        parts.target = "/";
    } else {
        authority    = url.substr(hostStart, pathStart - hostStart);
        parts.target = url[pathStart] == '/' ? url.substr(pathStart) : "/";
    }

    // Drop query / fragment from the base path.
    auto cut = parts.target.find_first_of("?#");
    if (cut != std::string::npos) parts.target.erase(cut);

    // --- host / port ---
    auto colon = authority.find(':');
    if (colon == std::string::npos) {
        parts.host = authority;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
        if (parts.port.empty() ||
            !std::all_of(parts.port.begin(), parts.port.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            throw std::invalid_argument("Invalid URL (bad port): " + url);
        }
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    return parts;
}

std::string urlEncode(const std::string& value) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string buildTarget(const std::string& basePath,
                        const std::string& path,
                        const std::vector<std::pair<std::string, std::string>>& query)
{
    std::string target = basePath;
    while (!target.empty() && target.back() == '/') target.pop_back();

    if (path.empty() || path.front() != '/') target += '/';
    target += path;

    char sep = '?';
    for (const auto& [key, value] : query) {
        target += sep;
        target += urlEncode(key);
        target += '=';
        target += urlEncode(value);
        sep = '&';
    }
    return target;
}

std::optional<std::chrono::seconds> parseRetryAfter(const std::string& header) {
    const std::string value = trim(header);
    if (value.empty() || value.size() > 9 ||
        !std::all_of(value.begin(), value.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    return std::chrono::seconds(std::stol(value));
}

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(),
                                  [](unsigned char c) { return std::isspace(c) != 0; });
    auto end = std::find_if_not(s.rbegin(), s.rend(),
                                [](unsigned char c) { return std::isspace(c) != 0; }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

} // namespace dbx_provision
