/**
 * @file TimeFormat.cpp
 * @brief Implementation of TimeFormat.
 */

#include "infrastructure/TimeFormat.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace dualtap::infrastructure {

std::string TimeFormat::ToIso8601(std::chrono::system_clock::time_point at) {
    auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(at);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(at - seconds).count();
    if (micros < 0) {
        // Pre-epoch instants round toward zero; keep the fraction positive.
        seconds -= std::chrono::seconds(1);
        micros += 1000000;
    }

    std::time_t t = std::chrono::system_clock::to_time_t(seconds);
    std::tm utc{};
    gmtime_r(&t, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return ss.str();
}

std::string TimeFormat::ToClock(std::chrono::system_clock::time_point at) {
    std::time_t t = std::chrono::system_clock::to_time_t(at);
    std::tm local{};
    localtime_r(&t, &local);

    std::ostringstream ss;
    ss << std::put_time(&local, "%H:%M:%S");
    return ss.str();
}

} // namespace dualtap::infrastructure
