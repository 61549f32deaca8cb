/**
 * @file NetworkTrafficRecord.cpp
 * @brief Implementation of NetworkTrafficRecord factories.
 */

#include "domain/NetworkTrafficRecord.hpp"

namespace dualtap::domain {

NetworkTrafficRecord NetworkTrafficRecord::FromRequest(const HttpRequest& request,
                                                       std::chrono::system_clock::time_point at) {
    NetworkTrafficRecord record;
    record.timestamp = at;
    record.method = request.method;
    record.url = request.url;
    record.requestHeaders = request.headers;
    record.requestBody = request.body;
    return record;
}

NetworkTrafficRecord NetworkTrafficRecord::FromExchange(const HttpRequest& request,
                                                        const HttpResponse& response,
                                                        std::chrono::system_clock::time_point at) {
    NetworkTrafficRecord record = FromRequest(request, at);
    record.statusCode = response.statusCode;
    record.responseHeaders = response.headers;
    record.responseBody = response.body;
    return record;
}

} // namespace dualtap::domain
