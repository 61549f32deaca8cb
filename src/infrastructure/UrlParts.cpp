#include "infrastructure/UrlParts.hpp"
#include <algorithm>
#include <cctype>

namespace dualtap::infrastructure {

namespace {

int DefaultPort(const std::string& scheme) {
    return scheme == "https" ? 443 : 80;
}

bool ParsePort(const std::string& text, int& port) {
    if (text.empty() || text.size() > 5) return false;
    if (!std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) return false;
    port = std::stoi(text);
    return port > 0 && port <= 65535;
}

// Fills host/port/authority from "host", "host:port", "[v6]" or "[v6]:port".
bool SplitAuthority(const std::string& authority, UrlParts& parts) {
    if (authority.empty()) return false;
    parts.authority = authority;
    parts.port = DefaultPort(parts.scheme);

    std::string portText;
    if (authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) return false;
        parts.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') return false;
            portText = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        parts.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            portText = authority.substr(colon + 1);
        }
    }

    if (!portText.empty() && !ParsePort(portText, parts.port)) return false;
    return !parts.host.empty();
}

} // namespace

std::optional<UrlParts> UrlParts::ParseAbsolute(const std::string& url) {
    auto sep = url.find("://");
    if (sep == std::string::npos || sep == 0) return std::nullopt;

    UrlParts parts;
    parts.scheme = url.substr(0, sep);
    std::transform(parts.scheme.begin(), parts.scheme.end(), parts.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto rest = url.substr(sep + 3);
    auto pathStart = rest.find_first_of("/?");
    std::string authority = rest.substr(0, pathStart);
    parts.path = pathStart == std::string::npos ? "/" : rest.substr(pathStart);
    if (parts.path.front() == '?') {
        parts.path = "/" + parts.path;
    }

    if (!SplitAuthority(authority, parts)) return std::nullopt;
    return parts;
}

std::optional<UrlParts> UrlParts::FromOriginForm(const std::string& hostHeader, const std::string& target) {
    if (target.empty() || target.front() != '/') return std::nullopt;

    UrlParts parts;
    parts.scheme = "http";
    parts.path = target;
    if (!SplitAuthority(hostHeader, parts)) return std::nullopt;
    return parts;
}

std::optional<UrlParts> UrlParts::FromConnectLine(const std::string& requestLine) {
    const std::string method = "CONNECT ";
    if (requestLine.compare(0, method.size(), method) != 0) return std::nullopt;

    auto end = requestLine.find_first_of(" \r\n", method.size());
    std::string authority = requestLine.substr(method.size(), end == std::string::npos ? std::string::npos : end - method.size());

    UrlParts parts;
    parts.scheme = "https";
    parts.path = "/";
    if (!SplitAuthority(authority, parts)) return std::nullopt;
    return parts;
}

} // namespace dualtap::infrastructure
