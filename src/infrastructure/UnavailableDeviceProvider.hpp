/**
 * @file UnavailableDeviceProvider.hpp
 * @brief DeviceProvider used when no instrumentation backend is linked into the build.
 */

#pragma once
#include "domain/InstrumentationEngine.hpp"

namespace dualtap::infrastructure {

/**
 * @class UnavailableDeviceProvider
 * @brief Never finds a device, so attach ends in the Failed state and capture
 * continues with traffic only.
 */
class UnavailableDeviceProvider : public domain::DeviceProvider {
public:
    std::shared_ptr<domain::Device> findDevice(std::chrono::milliseconds timeout) override;
};

} // namespace dualtap::infrastructure
