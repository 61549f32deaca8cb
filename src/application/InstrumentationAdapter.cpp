/**
 * @file InstrumentationAdapter.cpp
 * @brief Implementation of InstrumentationAdapter.
 */

#include "application/InstrumentationAdapter.hpp"
#include <chrono>
#include <iostream>

namespace dualtap::application {

using json = nlohmann::json;

namespace {

constexpr const char* kUnknown = "unknown";

// Strings are taken as-is; other JSON values keep their JSON spelling.
std::optional<std::string> TextField(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) return std::nullopt;
    if (it->is_string()) return it->get<std::string>();
    return it->dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace

const char* ToString(AttachState state) {
    switch (state) {
        case AttachState::Idle: return "Idle";
        case AttachState::DeviceLookup: return "DeviceLookup";
        case AttachState::ExplicitAttach: return "ExplicitAttach";
        case AttachState::FallbackAttach: return "FallbackAttach";
        case AttachState::Spawn: return "Spawn";
        case AttachState::Scripted: return "Scripted";
        case AttachState::Active: return "Active";
        case AttachState::Failed: return "Failed";
    }
    return "Unknown";
}

InstrumentationAdapter::InstrumentationAdapter(std::shared_ptr<domain::EventStore> store,
                                               std::shared_ptr<domain::DeviceProvider> devices,
                                               std::string hookScript,
                                               domain::InstrumentationOptions options)
    : m_store(std::move(store)),
      m_devices(std::move(devices)),
      m_hookScript(std::move(hookScript)),
      m_options(std::move(options)) {}

InstrumentationAdapter::~InstrumentationAdapter() {
    detach();
}

bool InstrumentationAdapter::attach(const std::optional<std::string>& processName) {
    std::lock_guard<std::mutex> lock(m_mutex);
    teardownLocked();
    m_attempted.clear();
    m_lastError.clear();
    m_attachedProcess.reset();

    transition(AttachState::DeviceLookup);
    if (!m_devices) {
        return fail("No device provider configured");
    }
    try {
        m_device = m_devices->findDevice(m_options.deviceTimeout);
    } catch (const std::exception& e) {
        return fail(std::string("Device lookup failed: ") + e.what());
    }
    if (!m_device) {
        return fail("No instrumentation device found");
    }
    std::cout << "[InstrumentationAdapter] Connected to device: " << m_device->name() << std::endl;

    std::unique_ptr<domain::Session> session;
    try {
        if (processName) {
            transition(AttachState::ExplicitAttach);
            session = attachByName(*m_device, *processName);
            m_attachedProcess = *processName;
        } else {
            transition(AttachState::FallbackAttach);
            session = attachFirstCandidate(*m_device);
            if (!session) {
                std::cout << "[InstrumentationAdapter] No candidate process running, spawning "
                          << m_options.spawnTarget << std::endl;
                transition(AttachState::Spawn);
                session = spawnTarget(*m_device);
                m_attachedProcess = m_options.spawnTarget;
            }
        }

        transition(AttachState::Scripted);
        if (m_hookScript.empty()) {
            throw domain::AttachFault("Hook payload is empty");
        }
        auto script = session->createScript(m_hookScript);
        script->setMessageHandler([this](const std::string& message) { onMessage(message); });
        script->load();

        m_session = std::move(session);
        m_script = std::move(script);
    } catch (const std::exception& e) {
        if (session) {
            try {
                session->detach();
            } catch (const std::exception& detachError) {
                std::cerr << "[InstrumentationAdapter] Detach after failure: " << detachError.what() << std::endl;
            }
        }
        m_attachedProcess.reset();
        return fail(e.what());
    }

    transition(AttachState::Active);
    std::cout << "[InstrumentationAdapter] Hooks active in " << *m_attachedProcess << std::endl;
    return true;
}

std::unique_ptr<domain::Session> InstrumentationAdapter::attachByName(domain::Device& device,
                                                                     const std::string& processName) {
    m_attempted.push_back(processName);
    auto session = device.attach(processName);
    if (!session) {
        throw domain::AttachFault("Attach returned no session for " + processName);
    }
    std::cout << "[InstrumentationAdapter] Attached to process: " << processName << std::endl;
    return session;
}

std::unique_ptr<domain::Session> InstrumentationAdapter::attachFirstCandidate(domain::Device& device) {
    for (const auto& candidate : m_options.fallbackCandidates) {
        try {
            return attachByName(device, candidate);
        } catch (const domain::ProcessNotFound&) {
            continue; // Not running; try the next one. Other faults are final.
        }
    }
    return nullptr;
}

std::unique_ptr<domain::Session> InstrumentationAdapter::spawnTarget(domain::Device& device) {
    int pid = device.spawn(m_options.spawnTarget);
    auto session = device.attach(pid);
    if (!session) {
        throw domain::AttachFault("Attach returned no session for spawned pid " + std::to_string(pid));
    }
    device.resume(pid);
    std::cout << "[InstrumentationAdapter] Spawned and attached to " << m_options.spawnTarget
              << " (pid " << pid << ")" << std::endl;
    return session;
}

void InstrumentationAdapter::onMessage(const std::string& rawMessage) {
    json message = json::parse(rawMessage, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        storeMalformed(rawMessage);
        return;
    }

    auto type = TextField(message, "type");
    if (type && *type == "send" && message.contains("payload")) {
        handlePayload(message["payload"]);
    } else if (type && *type == "error") {
        std::cerr << "[InstrumentationAdapter] Script error: "
                  << TextField(message, "stack").value_or(TextField(message, "description").value_or(rawMessage))
                  << std::endl;
    } else if (type && *type == "log") {
        std::cout << "[InstrumentationAdapter] Script log: " << TextField(message, "payload").value_or("") << std::endl;
    } else {
        storeMalformed(rawMessage);
    }
}

void InstrumentationAdapter::handlePayload(const json& payload) {
    domain::HookRecord record;
    record.timestamp = std::chrono::system_clock::now();
    record.additionalData = payload;

    if (!payload.is_object()) {
        record.hookType = kUnknown;
        record.functionName = kUnknown;
        std::cerr << "[InstrumentationAdapter] Payload is not an object; storing verbatim." << std::endl;
        store(record);
        return;
    }

    record.hookType = TextField(payload, "type").value_or(kUnknown);
    record.functionName = TextField(payload, "method").value_or(kUnknown);
    auto url = payload.find("url");
    record.parameters = json{{"url", url != payload.end() ? *url : json("")}};
    record.returnValue = TextField(payload, "return_value");

    std::cout << "[InstrumentationAdapter] Received: " << record.hookType << std::endl;
    store(record);
}

void InstrumentationAdapter::storeMalformed(const std::string& rawMessage) {
    std::cerr << "[InstrumentationAdapter] Unrecognised message; storing verbatim." << std::endl;

    domain::HookRecord record;
    record.timestamp = std::chrono::system_clock::now();
    record.hookType = "malformed";
    record.functionName = kUnknown;
    record.additionalData = json(rawMessage);
    store(record);
}

void InstrumentationAdapter::store(const domain::HookRecord& record) {
    try {
        m_store->append(record);
    } catch (const std::exception& e) {
        std::cerr << "[InstrumentationAdapter] Failed to record hook " << record.hookType << ": " << e.what() << std::endl;
    }
}

void InstrumentationAdapter::detach() {
    std::lock_guard<std::mutex> lock(m_mutex);
    teardownLocked();
}

void InstrumentationAdapter::teardownLocked() {
    if (m_script) {
        try {
            m_script->unload();
        } catch (const std::exception& e) {
            std::cerr << "[InstrumentationAdapter] Script unload failed: " << e.what() << std::endl;
        }
        m_script.reset();
    }
    if (m_session) {
        try {
            m_session->detach();
        } catch (const std::exception& e) {
            std::cerr << "[InstrumentationAdapter] Session detach failed: " << e.what() << std::endl;
        }
        m_session.reset();
        std::cout << "[InstrumentationAdapter] Detached." << std::endl;
    }
    m_device.reset();
    if (m_state == AttachState::Active) {
        m_state = AttachState::Idle;
    }
}

void InstrumentationAdapter::transition(AttachState next) {
    m_state = next;
}

bool InstrumentationAdapter::fail(const std::string& reason) {
    std::cerr << "[InstrumentationAdapter] Attach failed in " << ToString(m_state) << ": " << reason << std::endl;
    m_lastError = reason;
    m_state = AttachState::Failed;
    m_device.reset();
    return false;
}

AttachState InstrumentationAdapter::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

std::string InstrumentationAdapter::lastError() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastError;
}

std::vector<std::string> InstrumentationAdapter::attemptedProcesses() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_attempted;
}

std::optional<std::string> InstrumentationAdapter::attachedProcess() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_attachedProcess;
}

} // namespace dualtap::application
