/**
 * @file HttpFlow.cpp
 * @brief Implementation of HttpFlow helpers.
 */

#include "domain/HttpFlow.hpp"
#include <algorithm>
#include <cctype>

namespace dualtap::domain {

namespace {

bool EqualsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

} // namespace

std::string HttpResponse::contentType() const {
    for (const auto& [name, value] : headers) {
        if (EqualsIgnoreCase(name, "content-type")) {
            return value;
        }
    }
    return {};
}

} // namespace dualtap::domain
