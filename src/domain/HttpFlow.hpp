/**
 * @file HttpFlow.hpp
 * @brief Request/response exchange as surfaced by a traffic interception engine.
 */

#pragma once
#include <map>
#include <optional>
#include <string>

namespace dualtap::domain {

/** @brief Header name to value. Repeated headers are folded with ", ". */
using HeaderMap = std::map<std::string, std::string>;

/**
 * @struct HttpRequest
 * @brief Outgoing request side of a flow. Mutable until the engine forwards it.
 */
struct HttpRequest {
    std::string method;                 ///< "GET", "POST", ...
    std::string url;                    ///< Full URL including scheme and host.
    std::string host;                   ///< Host as addressed by the client (may carry ":port").
    HeaderMap headers;
    std::optional<std::string> body;    ///< Absent when the request carried no body.
};

/**
 * @struct HttpResponse
 * @brief Response side of a flow, present once the upstream answered.
 */
struct HttpResponse {
    int statusCode = 0;
    HeaderMap headers;
    std::optional<std::string> body;

    /** @brief Value of the Content-Type header (case-insensitive lookup), empty if missing. */
    std::string contentType() const;
};

/**
 * @struct HttpFlow
 * @brief One observed exchange.
 */
struct HttpFlow {
    HttpRequest request;
    std::optional<HttpResponse> response;
};

} // namespace dualtap::domain
