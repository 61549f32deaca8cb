#include "infrastructure/UnavailableDeviceProvider.hpp"
#include "infrastructure/DeviceProviderFactory.hpp"
#include <iostream>

namespace dualtap::infrastructure {

std::shared_ptr<domain::Device> UnavailableDeviceProvider::findDevice(std::chrono::milliseconds) {
    std::cerr << "[UnavailableDeviceProvider] No instrumentation backend in this build; no device available." << std::endl;
    return nullptr;
}

std::shared_ptr<domain::DeviceProvider> CreateDeviceProvider() {
    return std::make_shared<UnavailableDeviceProvider>();
}

} // namespace dualtap::infrastructure
