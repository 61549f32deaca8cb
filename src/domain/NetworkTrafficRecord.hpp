/**
 * @file NetworkTrafficRecord.hpp
 * @brief Domain entity for one proxy observation (request or response).
 */

#pragma once
#include <chrono>
#include <optional>
#include <string>
#include "domain/HttpFlow.hpp"

namespace dualtap::domain {

/**
 * @class NetworkTrafficRecord
 * @brief Immutable row of the network_traffic table.
 *
 * A request-time record carries only request fields. A response-time record is
 * written fresh with both sides populated; the two rows are never linked by id.
 */
class NetworkTrafficRecord {
public:
    static constexpr const char* kSourceTag = "mitm";

    std::chrono::system_clock::time_point timestamp;
    std::string method;
    std::string url;
    std::optional<int> statusCode;                  ///< Absent until the response is observed.
    HeaderMap requestHeaders;
    std::optional<HeaderMap> responseHeaders;
    std::optional<std::string> requestBody;
    std::optional<std::string> responseBody;
    std::string source = kSourceTag;

    NetworkTrafficRecord() = default;

    /** @brief Builds the request-only record for a flow. */
    static NetworkTrafficRecord FromRequest(const HttpRequest& request,
                                            std::chrono::system_clock::time_point at);

    /** @brief Builds the full record once the response side is known. */
    static NetworkTrafficRecord FromExchange(const HttpRequest& request,
                                             const HttpResponse& response,
                                             std::chrono::system_clock::time_point at);
};

} // namespace dualtap::domain
