/**
 * @file UrlParts.hpp
 * @brief Minimal split of proxy request targets into scheme, authority and path.
 */

#pragma once
#include <optional>
#include <string>

namespace dualtap::infrastructure {

struct UrlParts {
    std::string scheme;     ///< Lower case ("http", "https").
    std::string host;       ///< Without brackets or port.
    int port = 0;
    std::string authority;  ///< As written ("example.com:8080"), used for the Host header.
    std::string path;       ///< Path and query, always starting with '/'.

    std::string url() const { return scheme + "://" + authority + path; }

    /** @brief Parses "scheme://authority/path?query". */
    static std::optional<UrlParts> ParseAbsolute(const std::string& url);

    /** @brief Combines an origin-form target with the Host header value. */
    static std::optional<UrlParts> FromOriginForm(const std::string& hostHeader, const std::string& target);

    /**
     * @brief Parses the request line of a CONNECT head ("CONNECT host:port HTTP/1.1").
     * Scheme is "https" and the port defaults to 443.
     */
    static std::optional<UrlParts> FromConnectLine(const std::string& requestLine);
};

} // namespace dualtap::infrastructure
