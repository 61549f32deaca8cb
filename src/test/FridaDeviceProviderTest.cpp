#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

#include "infrastructure/DeviceProviderFactory.hpp"
#include "infrastructure/FridaDeviceProvider.hpp"

using namespace dualtap;
using infrastructure::ThrowIfFridaError;

int main() {
    std::cout << "[Test] Starting Frida Device Provider Test..." << std::endl;

    // No error, no exception.
    ThrowIfFridaError(nullptr, "com.android.chrome");
    std::cout << "[PASS] Null error is ignored." << std::endl;

    // Missing process maps to ProcessNotFound carrying the requested name.
    {
        bool caught = false;
        try {
            ThrowIfFridaError(g_error_new(FRIDA_ERROR, FRIDA_ERROR_PROCESS_NOT_FOUND,
                                          "Unable to find process with name '%s'", "com.example.browser"),
                              "com.example.browser");
        } catch (const domain::ProcessNotFound& e) {
            caught = true;
            assert(e.processName() == "com.example.browser");
        }
        assert(caught);
    }
    std::cout << "[PASS] Process-not-found errors become ProcessNotFound." << std::endl;

    // Everything else is a plain AttachFault with the engine's message kept.
    {
        bool caught = false;
        try {
            ThrowIfFridaError(g_error_new(FRIDA_ERROR, FRIDA_ERROR_PERMISSION_DENIED, "Unable to access process"),
                              "pid 4242");
        } catch (const domain::ProcessNotFound&) {
            assert(false && "permission errors must not look like a missing process");
        } catch (const domain::AttachFault& e) {
            caught = true;
            assert(std::string(e.what()) == "pid 4242: Unable to access process");
        }
        assert(caught);
    }
    {
        bool caught = false;
        try {
            ThrowIfFridaError(g_error_new(G_IO_ERROR, FRIDA_ERROR_PROCESS_NOT_FOUND, "Foreign domain"), "com.example");
        } catch (const domain::ProcessNotFound&) {
            assert(false && "only the frida error domain maps to ProcessNotFound");
        } catch (const domain::AttachFault&) {
            caught = true;
        }
        assert(caught);
    }
    std::cout << "[PASS] Other errors become AttachFault." << std::endl;

    // The linked factory yields the frida-core provider; a short device wait never throws.
    {
        auto provider = infrastructure::CreateDeviceProvider();
        assert(provider);
        assert(dynamic_cast<infrastructure::FridaDeviceProvider*>(provider.get()) != nullptr);

        auto device = provider->findDevice(std::chrono::milliseconds(100));
        std::cout << "[Test] USB device " << (device ? device->name() : std::string("absent")) << std::endl;
    }
    std::cout << "[PASS] Device lookup returns within its timeout." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
