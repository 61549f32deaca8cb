/**
 * @file FridaDeviceProvider.cpp
 * @brief Device, Session and Script on top of frida-core.
 */

#include "infrastructure/FridaDeviceProvider.hpp"
#include "infrastructure/DeviceProviderFactory.hpp"

#include <algorithm>
#include <climits>
#include <iostream>
#include <mutex>
#include <thread>

namespace dualtap::infrastructure {

/**
 * @class FridaRuntime
 * @brief Device manager plus the main loop that delivers frida-core signals.
 */
class FridaRuntime {
public:
    FridaRuntime() {
        static std::once_flag initialized;
        std::call_once(initialized, []() { frida_init(); });

        m_manager = frida_device_manager_new();
        m_loop = g_main_loop_new(nullptr, TRUE);
        m_loopThread = std::thread([loop = m_loop]() { g_main_loop_run(loop); });
    }

    ~FridaRuntime() {
        GError* error = nullptr;
        frida_device_manager_close_sync(m_manager, nullptr, &error);
        if (error) {
            std::cerr << "[FridaDeviceProvider] Closing device manager: " << error->message << std::endl;
            g_error_free(error);
        }
        g_object_unref(m_manager);

        g_main_loop_quit(m_loop);
        m_loopThread.join();
        g_main_loop_unref(m_loop);
    }

    FridaRuntime(const FridaRuntime&) = delete;
    FridaRuntime& operator=(const FridaRuntime&) = delete;

    FridaDeviceManager* manager() const { return m_manager; }

private:
    FridaDeviceManager* m_manager = nullptr;
    GMainLoop* m_loop = nullptr;
    std::thread m_loopThread;
};

void ThrowIfFridaError(GError* error, const std::string& subject) {
    if (!error) return;

    const bool notFound = error->domain == FRIDA_ERROR && error->code == FRIDA_ERROR_PROCESS_NOT_FOUND;
    const std::string message = error->message ? error->message : "unknown error";
    g_error_free(error);

    if (notFound) {
        throw domain::ProcessNotFound(subject);
    }
    throw domain::AttachFault(subject + ": " + message);
}

namespace {

class FridaScriptHandle : public domain::Script {
public:
    FridaScriptHandle(std::shared_ptr<FridaRuntime> runtime, FridaScript* script)
        : m_runtime(std::move(runtime)), m_script(script) {}

    ~FridaScriptHandle() override {
        unload();
        if (m_signalId != 0) {
            g_signal_handler_disconnect(m_script, m_signalId);
        }
        {
            // Waits out a delivery already in progress on the loop thread.
            std::lock_guard<std::mutex> lock(m_mutex);
            m_handler = nullptr;
        }
        g_object_unref(m_script);
    }

    void setMessageHandler(MessageHandler handler) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_handler = std::move(handler);
    }

    void load() override {
        if (m_signalId == 0) {
            m_signalId = g_signal_connect(m_script, "message", G_CALLBACK(&FridaScriptHandle::OnMessage), this);
        }
        GError* error = nullptr;
        frida_script_load_sync(m_script, nullptr, &error);
        ThrowIfFridaError(error, "hook script");
        m_loaded = true;
    }

    void unload() override {
        if (!m_loaded) return;
        m_loaded = false;

        GError* error = nullptr;
        frida_script_unload_sync(m_script, nullptr, &error);
        if (error) {
            std::cerr << "[FridaDeviceProvider] Unloading script: " << error->message << std::endl;
            g_error_free(error);
        }
    }

private:
    static void OnMessage(FridaScript*, const gchar* message, GBytes*, gpointer userData) {
        static_cast<FridaScriptHandle*>(userData)->deliver(message ? message : "");
    }

    void deliver(const std::string& message) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_handler) return;
        try {
            m_handler(message);
        } catch (const std::exception& e) {
            std::cerr << "[FridaDeviceProvider] Message handler failed: " << e.what() << std::endl;
        }
    }

    std::shared_ptr<FridaRuntime> m_runtime;
    FridaScript* m_script;
    gulong m_signalId = 0;
    bool m_loaded = false;
    std::mutex m_mutex;
    MessageHandler m_handler;
};

class FridaSessionHandle : public domain::Session {
public:
    FridaSessionHandle(std::shared_ptr<FridaRuntime> runtime, FridaSession* session)
        : m_runtime(std::move(runtime)), m_session(session) {}

    ~FridaSessionHandle() override {
        detach();
        g_object_unref(m_session);
    }

    std::unique_ptr<domain::Script> createScript(const std::string& source) override {
        FridaScriptOptions* options = frida_script_options_new();
        frida_script_options_set_name(options, "dualtap-hooks");

        GError* error = nullptr;
        FridaScript* script = frida_session_create_script_sync(m_session, source.c_str(), options, nullptr, &error);
        g_object_unref(options);
        ThrowIfFridaError(error, "hook script");
        if (!script) {
            throw domain::AttachFault("hook script: no script returned");
        }
        return std::make_unique<FridaScriptHandle>(m_runtime, script);
    }

    void detach() override {
        if (m_detached) return;
        m_detached = true;

        GError* error = nullptr;
        frida_session_detach_sync(m_session, nullptr, &error);
        if (error) {
            std::cerr << "[FridaDeviceProvider] Detaching: " << error->message << std::endl;
            g_error_free(error);
        }
    }

private:
    std::shared_ptr<FridaRuntime> m_runtime;
    FridaSession* m_session;
    bool m_detached = false;
};

class FridaDeviceHandle : public domain::Device {
public:
    FridaDeviceHandle(std::shared_ptr<FridaRuntime> runtime, FridaDevice* device)
        : m_runtime(std::move(runtime)), m_device(device) {}

    ~FridaDeviceHandle() override {
        g_object_unref(m_device);
    }

    std::string name() const override {
        const gchar* name = frida_device_get_name(m_device);
        return name ? name : "";
    }

    std::unique_ptr<domain::Session> attach(const std::string& processName) override {
        GError* error = nullptr;
        FridaProcess* process =
            frida_device_get_process_by_name_sync(m_device, processName.c_str(), nullptr, nullptr, &error);
        ThrowIfFridaError(error, processName);
        if (!process) {
            throw domain::ProcessNotFound(processName);
        }
        const guint pid = frida_process_get_pid(process);
        g_object_unref(process);
        return attachPid(pid, processName);
    }

    std::unique_ptr<domain::Session> attach(int pid) override {
        return attachPid(static_cast<guint>(pid), "pid " + std::to_string(pid));
    }

    int spawn(const std::string& program) override {
        GError* error = nullptr;
        const guint pid = frida_device_spawn_sync(m_device, program.c_str(), nullptr, nullptr, &error);
        ThrowIfFridaError(error, program);
        return static_cast<int>(pid);
    }

    void resume(int pid) override {
        GError* error = nullptr;
        frida_device_resume_sync(m_device, static_cast<guint>(pid), nullptr, &error);
        ThrowIfFridaError(error, "pid " + std::to_string(pid));
    }

private:
    std::unique_ptr<domain::Session> attachPid(guint pid, const std::string& subject) {
        GError* error = nullptr;
        FridaSession* session = frida_device_attach_sync(m_device, pid, nullptr, nullptr, &error);
        ThrowIfFridaError(error, subject);
        if (!session) {
            throw domain::AttachFault(subject + ": no session returned");
        }
        return std::make_unique<FridaSessionHandle>(m_runtime, session);
    }

    std::shared_ptr<FridaRuntime> m_runtime;
    FridaDevice* m_device;
};

} // namespace

FridaDeviceProvider::FridaDeviceProvider() : m_runtime(std::make_shared<FridaRuntime>()) {}

FridaDeviceProvider::~FridaDeviceProvider() = default;

std::shared_ptr<domain::Device> FridaDeviceProvider::findDevice(std::chrono::milliseconds timeout) {
    const auto waitMs = static_cast<gint>(std::clamp<std::chrono::milliseconds::rep>(timeout.count(), 0, INT_MAX));

    GError* error = nullptr;
    FridaDevice* device = frida_device_manager_get_device_by_type_sync(
        m_runtime->manager(), FRIDA_DEVICE_TYPE_USB, waitMs, nullptr, &error);
    if (error) {
        std::cerr << "[FridaDeviceProvider] No USB device: " << error->message << std::endl;
        g_error_free(error);
        return nullptr;
    }
    if (!device) {
        return nullptr;
    }

    auto handle = std::make_shared<FridaDeviceHandle>(m_runtime, device);
    std::cout << "[FridaDeviceProvider] Found device: " << handle->name() << std::endl;
    return handle;
}

std::shared_ptr<domain::DeviceProvider> CreateDeviceProvider() {
    return std::make_shared<FridaDeviceProvider>();
}

} // namespace dualtap::infrastructure
