/**
 * @file InstrumentationAdapter.hpp
 * @brief Attaches hook code to a target process and records what the hooks report.
 */

#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/CaptureConfig.hpp"
#include "domain/EventStore.hpp"
#include "domain/InstrumentationEngine.hpp"

namespace dualtap::application {

/**
 * @enum AttachState
 * @brief Progress of the last attach() call. Active and Failed are terminal.
 */
enum class AttachState {
    Idle,
    DeviceLookup,
    ExplicitAttach,
    FallbackAttach,
    Spawn,
    Scripted,
    Active,
    Failed
};

const char* ToString(AttachState state);

/**
 * @class InstrumentationAdapter
 * @brief Drives the attach/spawn chain and turns hook messages into HookRecords.
 *
 * attach() blocks for device lookup and attach or spawn, and never retries. Messages
 * arrive on the engine's delivery thread through onMessage(). That path only
 * touches the store, so it never waits on attach() or detach().
 */
class InstrumentationAdapter {
public:
    /**
     * @param store Destination for HookRecords.
     * @param devices Locates the instrumentation-capable device.
     * @param hookScript Payload loaded into the target. Opaque to the adapter.
     * @param options Fallback candidates, spawn target and device timeout.
     */
    InstrumentationAdapter(std::shared_ptr<domain::EventStore> store,
                           std::shared_ptr<domain::DeviceProvider> devices,
                           std::string hookScript,
                           domain::InstrumentationOptions options);
    ~InstrumentationAdapter();

    InstrumentationAdapter(const InstrumentationAdapter&) = delete;
    InstrumentationAdapter& operator=(const InstrumentationAdapter&) = delete;

    /**
     * @brief Establishes a session and loads the hooks.
     * @param processName Explicit target. Failure to attach to it is final. Without
     *        one, the fallback candidates are tried in order, then the spawn target.
     * @return True once the state is Active. On failure see lastError().
     */
    bool attach(const std::optional<std::string>& processName = std::nullopt);

    /**
     * @brief Handles one raw JSON message from the hooks.
     * "send" payloads are stored; "error" reports are only logged; anything
     * unrecognised is stored verbatim.
     */
    void onMessage(const std::string& rawMessage);

    /** @brief Unloads the hooks and releases the session. Idempotent. */
    void detach();

    AttachState state() const;
    std::string lastError() const;

    /** @brief Process names passed to Device::attach during the last attach(), in order. */
    std::vector<std::string> attemptedProcesses() const;

    /** @brief Process the active session belongs to. */
    std::optional<std::string> attachedProcess() const;

private:
    std::unique_ptr<domain::Session> attachByName(domain::Device& device, const std::string& processName);
    std::unique_ptr<domain::Session> attachFirstCandidate(domain::Device& device);
    std::unique_ptr<domain::Session> spawnTarget(domain::Device& device);

    void handlePayload(const nlohmann::json& payload);
    void storeMalformed(const std::string& rawMessage);
    void store(const domain::HookRecord& record);

    void transition(AttachState next);
    bool fail(const std::string& reason);
    void teardownLocked();

    std::shared_ptr<domain::EventStore> m_store;
    std::shared_ptr<domain::DeviceProvider> m_devices;
    const std::string m_hookScript;
    const domain::InstrumentationOptions m_options;

    mutable std::mutex m_mutex;
    AttachState m_state = AttachState::Idle;
    std::string m_lastError;
    std::vector<std::string> m_attempted;
    std::optional<std::string> m_attachedProcess;
    std::shared_ptr<domain::Device> m_device;
    std::unique_ptr<domain::Session> m_session;
    std::unique_ptr<domain::Script> m_script;
};

} // namespace dualtap::application
