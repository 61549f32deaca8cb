/**
 * @file HookRecord.hpp
 * @brief Domain entity for one message sent by injected hook code.
 */

#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace dualtap::domain {

/**
 * @class HookRecord
 * @brief Immutable row of the frida_hooks table.
 *
 * additionalData always holds what the instrumentation engine delivered,
 * including fields the adapter does not interpret.
 */
class HookRecord {
public:
    std::chrono::system_clock::time_point timestamp;
    std::string hookType;                           ///< Tag chosen by the hook code ("webview_load", ...).
    std::string functionName;
    std::optional<nlohmann::json> parameters;
    std::optional<std::string> returnValue;         ///< Stringified by the sender.
    std::optional<nlohmann::json> additionalData;

    HookRecord() = default;
};

} // namespace dualtap::domain
