/**
 * @file DeviceProviderFactory.hpp
 * @brief Creates the DeviceProvider of the instrumentation backend linked into the build.
 *
 * Defined by FridaDeviceProvider.cpp when frida-core is available and by
 * UnavailableDeviceProvider.cpp otherwise; exactly one of them is linked.
 */

#pragma once
#include <memory>
#include "domain/InstrumentationEngine.hpp"

namespace dualtap::infrastructure {

std::shared_ptr<domain::DeviceProvider> CreateDeviceProvider();

} // namespace dualtap::infrastructure
