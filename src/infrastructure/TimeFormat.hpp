/**
 * @file TimeFormat.hpp
 * @brief Timestamp formatting shared by the store and the reports.
 */

#pragma once
#include <chrono>
#include <string>

namespace dualtap::infrastructure {

class TimeFormat {
public:
    /** @brief "YYYY-MM-DDTHH:MM:SS.ffffffZ" in UTC. */
    static std::string ToIso8601(std::chrono::system_clock::time_point at);

    /** @brief "HH:MM:SS" in local time, for console output. */
    static std::string ToClock(std::chrono::system_clock::time_point at);
};

} // namespace dualtap::infrastructure
