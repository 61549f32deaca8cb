/**
 * @file FridaDeviceProvider.hpp
 * @brief DeviceProvider backed by the frida-core C API (USB device, attach, spawn, scripts).
 */

#pragma once
#include <memory>
#include <string>
#include <frida-core.h>
#include "domain/InstrumentationEngine.hpp"

namespace dualtap::infrastructure {

class FridaRuntime;

/**
 * @class FridaDeviceProvider
 * @brief Finds the first USB device known to frida-core.
 *
 * Owns a GMainLoop on a private thread; script "message" signals are delivered
 * there, so every Script::MessageHandler runs on that thread. Devices, sessions
 * and scripts keep the runtime alive and may outlive the provider.
 */
class FridaDeviceProvider : public domain::DeviceProvider {
public:
    FridaDeviceProvider();
    ~FridaDeviceProvider() override;

    std::shared_ptr<domain::Device> findDevice(std::chrono::milliseconds timeout) override;

private:
    std::shared_ptr<FridaRuntime> m_runtime;
};

/**
 * @brief Converts a frida-core error into the capture's exception types and frees it.
 *
 * Does nothing when error is null. FRIDA_ERROR_PROCESS_NOT_FOUND becomes
 * ProcessNotFound(subject); every other error becomes AttachFault.
 */
void ThrowIfFridaError(GError* error, const std::string& subject);

} // namespace dualtap::infrastructure
